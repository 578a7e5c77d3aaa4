#include "app/Config.hpp"

#include <cstdlib>
#include <string>

namespace btrcheck::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("BTRCHECK_", 0) == 0) {
    alt = std::string("btrcheck_") + n.substr(9);
  } else if (n.rfind("btrcheck_", 0) == 0) {
    alt = std::string("BTRCHECK_") + n.substr(9);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/btrcheck/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/btrcheck/config.toml";
  return {};
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

// Resolve an integer from CLI -> TOML -> env -> compiled default.
// A value that is present but not an integer is recorded, not defaulted.
static long long resolve_int(const std::optional<long long>& cli,
                             const btrcheck::util::TomlReader& toml, bool have_toml,
                             const char* section, const char* key,
                             const char* env_name, long long def,
                             std::vector<std::string>& problems) {
  if (cli) return *cli;
  if (have_toml && toml.has(section, key)) {
    if (auto v = toml.get_integer(section, key)) return *v;
    problems.push_back(std::string("config [") + section + "] " + key + " is not an integer: '" +
                       toml.get_string(section, key) + "'");
    return def;
  }
  if (const char* v = getenv_compat(env_name)) {
    if (auto parsed = btrcheck::util::TomlReader::parse_integer(v)) return *parsed;
    problems.push_back(std::string(env_name) + " is not an integer: '" + v + "'");
  }
  return def;
}

Options resolve_options(const CliArgs& cli, const btrcheck::util::TomlReader& toml, bool have_toml) {
  Options o{};

  // --- [check] ---
  if (cli.mountpoint) {
    o.mountpoint = *cli.mountpoint;
  } else if (have_toml && toml.has("check", "mountpoint")) {
    o.mountpoint = toml.get_string("check", "mountpoint");
  } else if (const char* v = getenv_compat("BTRCHECK_MOUNTPOINT")) {
    o.mountpoint = v;
  }
  if (cli.debug) o.debug = true;
  else if (have_toml && toml.has("check", "debug")) o.debug = toml.get_bool("check", "debug", false);
  else o.debug = env_flag("BTRCHECK_DEBUG", false);

  // --- [thresholds] ---
  auto& t = o.thresholds;
  t.allocated_warning_gib      = resolve_int(cli.allocated_warning_gib, toml, have_toml, "thresholds", "allocated_warning_gib",
                                             "BTRCHECK_ALLOCATED_WARNING_GIB", 0, o.problems);
  t.allocated_critical_gib     = resolve_int(cli.allocated_critical_gib, toml, have_toml, "thresholds", "allocated_critical_gib",
                                             "BTRCHECK_ALLOCATED_CRITICAL_GIB", 0, o.problems);
  t.allocated_warning_percent  = resolve_int(cli.allocated_warning_percent, toml, have_toml, "thresholds", "allocated_warning_percent",
                                             "BTRCHECK_ALLOCATED_WARNING_PERCENT", 100, o.problems);
  t.allocated_critical_percent = resolve_int(cli.allocated_critical_percent, toml, have_toml, "thresholds", "allocated_critical_percent",
                                             "BTRCHECK_ALLOCATED_CRITICAL_PERCENT", 100, o.problems);
  return o;
}

} // namespace btrcheck::app
