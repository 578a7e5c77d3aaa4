#include "app/Checks.hpp"
#include "util/Formatting.hpp"

#include <algorithm>

namespace btrcheck::app {

using btrcheck::model::Severity;
using btrcheck::model::worst;
using btrcheck::util::human_bytes;

int rounded_percent(uint64_t part, uint64_t whole) {
  if (whole == 0) return 0;
  // floor(100 * part / whole + 1/2) in exact arithmetic
  const unsigned __int128 num = static_cast<unsigned __int128>(part) * 200U + whole;
  const unsigned __int128 den = static_cast<unsigned __int128>(whole) * 2U;
  const unsigned __int128 pct = std::min<unsigned __int128>(num / den, 100U);
  return static_cast<int>(pct);
}

CheckResult check_usage(const btrcheck::model::UsageSnapshot& u, const Thresholds& t) {
  CheckResult r;
  const uint64_t total = u.total();
  const uint64_t unallocated = u.unallocated();
  const int allocated_pct = rounded_percent(u.allocated, total);
  const int used_pct = rounded_percent(u.used, total);

  if (unallocated < t.critical_floor_bytes()) {
    r.severity = worst(r.severity, Severity::Critical);
    r.alerts.push_back("Unallocated space " + human_bytes(unallocated) + " below critical limit " +
                       std::to_string(t.allocated_critical_gib) + "GiB");
  } else if (unallocated < t.warning_floor_bytes()) {
    r.severity = worst(r.severity, Severity::Warning);
    r.alerts.push_back("Unallocated space " + human_bytes(unallocated) + " below warning limit " +
                       std::to_string(t.allocated_warning_gib) + "GiB");
  }

  if (allocated_pct >= t.allocated_critical_percent) {
    r.severity = worst(r.severity, Severity::Critical);
    r.alerts.push_back("Allocated space " + std::to_string(allocated_pct) + "% reached critical limit " +
                       std::to_string(t.allocated_critical_percent) + "%");
  } else if (allocated_pct >= t.allocated_warning_percent) {
    r.severity = worst(r.severity, Severity::Warning);
    r.alerts.push_back("Allocated space " + std::to_string(allocated_pct) + "% reached warning limit " +
                       std::to_string(t.allocated_warning_percent) + "%");
  }

  r.summary.push_back("Total size " + human_bytes(total));
  r.summary.push_back("Allocated " + human_bytes(u.allocated) + " (" + std::to_string(allocated_pct) + "%)");
  r.summary.push_back("Used " + human_bytes(u.used) + " (" + std::to_string(used_pct) + "%)");
  if (u.wasted() > 0) {
    r.summary.push_back("Wasted " + human_bytes(u.wasted()) + " (hard " + human_bytes(u.wasted_hard) +
                        ", soft " + human_bytes(u.wasted_soft) + ")");
  }
  return r;
}

CheckResult check_devices(const std::vector<btrcheck::model::DeviceHealth>& devices) {
  CheckResult r;
  for (const auto& d : devices) {
    if (d.stats.healthy()) continue;
    std::string line = "Device " + std::to_string(d.device.devid);
    if (!d.device.path.empty()) line += " (" + d.device.path + ")";
    line += " errors:";
    for (const auto& [name, v] : d.stats.counters) {
      if (v != 0) line += " " + name + " " + std::to_string(v);
    }
    r.alerts.push_back(std::move(line));
    r.severity = Severity::Critical;
  }
  r.summary.push_back(btrcheck::util::count_noun(devices.size(), "device", "devices"));
  if (r.severity == Severity::Ok) r.summary.push_back("no errors");
  return r;
}

} // namespace btrcheck::app
