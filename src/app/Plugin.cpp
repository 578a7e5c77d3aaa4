#include "app/Plugin.hpp"
#include "app/Checks.hpp"

#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>

namespace btrcheck::app {

using btrcheck::model::Severity;

// Largest GiB value whose byte count still fits in 64 bits
static constexpr long long kMaxGib = static_cast<long long>(UINT64_MAX >> 30);

static void check_gib(const char* name, long long v, std::vector<std::string>& out) {
  if (v < 0) out.push_back(std::string(name) + " must not be negative (got " + std::to_string(v) + ")");
  else if (v > kMaxGib) out.push_back(std::string(name) + " is too large (got " + std::to_string(v) + ")");
}

static void check_pct(const char* name, long long v, std::vector<std::string>& out) {
  if (v < 0 || v > 100)
    out.push_back(std::string(name) + " must be between 0 and 100 (got " + std::to_string(v) + ")");
}

std::vector<std::string> validate(const Options& opts) {
  std::vector<std::string> out = opts.problems;

  struct stat st{};
  if (opts.mountpoint.empty()) {
    out.push_back("No mountpoint given");
  } else if (::stat(opts.mountpoint.c_str(), &st) != 0) {
    const int err = errno;
    if (err == ENOENT) out.push_back("Mountpoint " + opts.mountpoint + " does not exist");
    else out.push_back("Mountpoint " + opts.mountpoint + " cannot be accessed: " + std::strerror(err));
  } else if (::access(opts.mountpoint.c_str(), R_OK) != 0) {
    out.push_back("Mountpoint " + opts.mountpoint + " is not readable: " + std::strerror(errno));
  }

  const auto& t = opts.thresholds;
  check_gib("allocated-warning-gib", t.allocated_warning_gib, out);
  check_gib("allocated-critical-gib", t.allocated_critical_gib, out);
  check_pct("allocated-warning-percent", t.allocated_warning_percent, out);
  check_pct("allocated-critical-percent", t.allocated_critical_percent, out);
  return out;
}

Report run_plugin(const Options& opts, btrcheck::collectors::IFsCollector& fs) {
  if (auto problems = validate(opts); !problems.empty()) {
    if (opts.debug) {
      for (const auto& p : problems) std::fprintf(stderr, "check_btrfs: Plugin: %s\n", p.c_str());
    }
    return failure_report(Severity::Critical, problems);
  }

  auto collector_failure = [&]{
    std::string msg = fs.last_error();
    if (msg.empty()) msg = std::string(fs.name()) + " collector failed";
    fs.shutdown();
    return failure_report(Severity::Unknown, {msg});
  };

  if (!fs.init(opts.mountpoint)) return collector_failure();
  if (opts.debug) std::fprintf(stderr, "check_btrfs: Plugin: using %s collector\n", fs.name());

  // One device enumeration feeds both checks.
  std::vector<btrcheck::model::DeviceInfo> devices;
  if (!fs.sample_devices(devices)) return collector_failure();
  btrcheck::model::UsageSnapshot usage{};
  if (!fs.sample_usage(devices, usage)) return collector_failure();

  std::vector<btrcheck::model::DeviceHealth> health;
  health.reserve(devices.size());
  for (auto& d : devices) {
    btrcheck::model::DeviceStats stats;
    if (!fs.sample_device_stats(d.devid, stats)) return collector_failure();
    health.push_back({std::move(d), std::move(stats)});
  }
  fs.shutdown();

  return build_report({check_usage(usage, opts.thresholds), check_devices(health)});
}

} // namespace btrcheck::app
