#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace btrcheck::model {

// Filesystem-wide byte counts as reported by the collector. Raw device
// space, so mirrored profiles count every copy.
struct UsageSnapshot {
  uint64_t device_size{};  // sum of device sizes
  uint64_t allocated{};    // reserved into chunks
  uint64_t used{};         // occupied inside chunks
  uint64_t wasted_hard{};  // never allocatable with the data profile
  uint64_t wasted_soft{};  // allocatable again after a full balance

  [[nodiscard]] uint64_t wasted() const { return wasted_hard + wasted_soft; }
  [[nodiscard]] uint64_t total() const {
    return device_size > wasted() ? device_size - wasted() : 0ULL;
  }
  [[nodiscard]] uint64_t unallocated() const {
    return total() > allocated ? total() - allocated : 0ULL;
  }
  [[nodiscard]] uint64_t unused() const {
    return total() > used ? total() - used : 0ULL;
  }
};

struct DeviceInfo {
  uint64_t devid{};
  std::string path;        // e.g., /dev/sdb1
  uint64_t total_bytes{};
  uint64_t bytes_used{};   // allocated on this device
};

// Counter name -> cumulative count, in kernel order.
struct DeviceStats {
  std::vector<std::pair<std::string, uint64_t>> counters;

  [[nodiscard]] bool healthy() const {
    for (const auto& [name, v] : counters)
      if (v != 0) return false;
    return true;
  }
};

struct DeviceHealth {
  DeviceInfo device;
  DeviceStats stats;
};

} // namespace btrcheck::model
