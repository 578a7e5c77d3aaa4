#pragma once
#include "model/Fs.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace btrcheck::collectors {

// Source of filesystem statistics. The btrfs ioctl implementation is the
// production one; tests substitute a canned collector.
class IFsCollector {
public:
  virtual ~IFsCollector() = default;

  // Open the filesystem mounted at (or containing) path.
  // Return false if it cannot be opened or is the wrong filesystem type.
  [[nodiscard]] virtual bool init(const std::string& path) = 0;

  // Filesystem-wide usage; devices is the current sample_devices() result.
  [[nodiscard]] virtual bool sample_usage(const std::vector<btrcheck::model::DeviceInfo>& devices,
                                          btrcheck::model::UsageSnapshot& out) = 0;

  // Devices ordered by devid.
  [[nodiscard]] virtual bool sample_devices(std::vector<btrcheck::model::DeviceInfo>& out) = 0;

  [[nodiscard]] virtual bool sample_device_stats(uint64_t devid, btrcheck::model::DeviceStats& out) = 0;

  // Release the filesystem handle. Default: no-op
  virtual void shutdown() {}

  // Description of the last failure, empty if none
  [[nodiscard]] virtual std::string last_error() const = 0;

  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace btrcheck::collectors
