#pragma once

#include "util/TomlReader.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace btrcheck::app {

// User-facing threshold values. Kept signed so out-of-range input survives
// until validation can report it.
struct Thresholds {
  long long allocated_warning_gib{0};
  long long allocated_critical_gib{0};
  long long allocated_warning_percent{100};
  long long allocated_critical_percent{100};

  // Only meaningful once validated (non-negative, no overflow)
  [[nodiscard]] uint64_t warning_floor_bytes() const { return static_cast<uint64_t>(allocated_warning_gib) << 30; }
  [[nodiscard]] uint64_t critical_floor_bytes() const { return static_cast<uint64_t>(allocated_critical_gib) << 30; }
};

// Values given on the command line; unset ones fall through to the file,
// then the environment, then the defaults above.
struct CliArgs {
  std::optional<std::string> mountpoint;
  std::optional<std::string> config_path;
  std::optional<long long> allocated_warning_gib;
  std::optional<long long> allocated_critical_gib;
  std::optional<long long> allocated_warning_percent;
  std::optional<long long> allocated_critical_percent;
  bool debug{false};
};

struct Options {
  std::string mountpoint;
  Thresholds thresholds;
  bool debug{false};
  // Malformed values found in the config file or environment
  std::vector<std::string> problems;
};

// Accepts both BTRCHECK_ and btrcheck_ prefixes
const char* getenv_compat(const char* name);

// $XDG_CONFIG_HOME/btrcheck/config.toml, else ~/.config/btrcheck/config.toml
std::string config_file_path();

// Resolve every option from CLI -> TOML -> env -> compiled default.
[[nodiscard]] Options resolve_options(const CliArgs& cli, const btrcheck::util::TomlReader& toml, bool have_toml);

} // namespace btrcheck::app
