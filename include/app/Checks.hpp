#pragma once
#include "app/Config.hpp"
#include "model/Fs.hpp"
#include "model/Severity.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace btrcheck::app {

struct CheckResult {
  btrcheck::model::Severity severity{btrcheck::model::Severity::Ok};
  std::vector<std::string> alerts;   // one per triggered rule
  std::vector<std::string> summary;  // always reported
};

// part * 100 / whole rounded half up, clamped to 0..100; 0 when whole is 0.
[[nodiscard]] int rounded_percent(uint64_t part, uint64_t whole);

// Unallocated floor and allocated ceiling rules.
[[nodiscard]] CheckResult check_usage(const btrcheck::model::UsageSnapshot& u, const Thresholds& t);

// CRITICAL for every device with a nonzero error counter.
[[nodiscard]] CheckResult check_devices(const std::vector<btrcheck::model::DeviceHealth>& devices);

} // namespace btrcheck::app
