#pragma once
#include "collectors/IFsCollector.hpp"
#include <map>
#include <string>
#include <vector>

// Canned statistics; counts calls so tests can prove what was queried.
class FakeFsCollector : public btrcheck::collectors::IFsCollector {
public:
  btrcheck::model::UsageSnapshot usage{};
  std::vector<btrcheck::model::DeviceInfo> devices;
  std::map<uint64_t, btrcheck::model::DeviceStats> stats;
  bool fail_init{false};
  bool fail_usage{false};
  std::string error;

  int init_calls{0};
  int usage_calls{0};
  int device_calls{0};
  int stats_calls{0};
  int shutdown_calls{0};

  bool init(const std::string& path) override {
    ++init_calls;
    opened = path;
    if (fail_init) { error = path + " is not a btrfs filesystem"; return false; }
    return true;
  }
  bool sample_usage(const std::vector<btrcheck::model::DeviceInfo>& devs,
                    btrcheck::model::UsageSnapshot& out) override {
    ++usage_calls;
    usage_devices = devs.size();
    if (fail_usage) { error = "BTRFS_IOC_SPACE_INFO on " + opened + ": Operation not permitted"; return false; }
    out = usage;
    return true;
  }
  bool sample_devices(std::vector<btrcheck::model::DeviceInfo>& out) override {
    ++device_calls;
    out = devices;
    return true;
  }
  bool sample_device_stats(uint64_t devid, btrcheck::model::DeviceStats& out) override {
    ++stats_calls;
    auto it = stats.find(devid);
    out = it == stats.end() ? clean_stats() : it->second;
    return true;
  }
  void shutdown() override { ++shutdown_calls; }
  std::string last_error() const override { return error; }
  const char* name() const override { return "fake"; }

  int queries() const { return init_calls + usage_calls + device_calls + stats_calls; }

  static btrcheck::model::DeviceStats clean_stats() {
    btrcheck::model::DeviceStats s;
    for (const char* n : {"write_io_errs", "read_io_errs", "flush_io_errs", "corruption_errs", "generation_errs"})
      s.counters.emplace_back(n, 0);
    return s;
  }

  std::string opened;
  size_t usage_devices{0};
};

inline constexpr uint64_t kGiB = 1024ULL * 1024ULL * 1024ULL;
