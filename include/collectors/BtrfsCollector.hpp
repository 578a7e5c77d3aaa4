#pragma once

#include "collectors/ChunkEstimator.hpp"
#include "collectors/IFsCollector.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace btrcheck::collectors {

// Reads allocation and device error counters from a mounted btrfs
// filesystem through the kernel ioctl interface.
class BtrfsCollector : public IFsCollector {
public:
  explicit BtrfsCollector(bool debug = false);
  ~BtrfsCollector() override;
  BtrfsCollector(const BtrfsCollector&) = delete;
  BtrfsCollector& operator=(const BtrfsCollector&) = delete;

  bool init(const std::string& path) override;   // open + statfs magic check
  void shutdown() override;                      // close the fd
  bool sample_usage(const std::vector<btrcheck::model::DeviceInfo>& devices,
                    btrcheck::model::UsageSnapshot& out) override;
  bool sample_devices(std::vector<btrcheck::model::DeviceInfo>& out) override;
  bool sample_device_stats(uint64_t devid, btrcheck::model::DeviceStats& out) override;
  std::string last_error() const override { return last_error_; }
  const char* name() const override { return "btrfs ioctl"; }

private:
  int fd_{-1};
  bool debug_{false};
  std::string path_;
  std::string last_error_;

  bool fail(const char* what);
  bool read_space_info(std::vector<SpaceInfo>& out);
};

} // namespace btrcheck::collectors
