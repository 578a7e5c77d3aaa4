#include "collectors/BtrfsCollector.hpp"
#include "collectors/ChunkEstimator.hpp"

#include <sys/ioctl.h>
#include <sys/statfs.h>
#include <fcntl.h>
#include <unistd.h>
#include <linux/btrfs.h>
#include <linux/magic.h>

#include <algorithm>
#include <cerrno>
#include <cinttypes>
#include <cstdio>
#include <cstring>
#include <iterator>
#include <utility>

namespace btrcheck::collectors {

// Kernel order of btrfs_ioctl_get_dev_stats.values[]
static constexpr const char* kDevStatNames[] = {
  "write_io_errs", "read_io_errs", "flush_io_errs", "corruption_errs", "generation_errs",
};

BtrfsCollector::BtrfsCollector(bool debug) : debug_(debug) {}

BtrfsCollector::~BtrfsCollector() { shutdown(); }

bool BtrfsCollector::fail(const char* what) {
  int err = errno;
  last_error_ = std::string(what) + " on " + path_ + ": " + std::strerror(err);
  std::fprintf(stderr, "check_btrfs: BtrfsCollector: %s\n", last_error_.c_str());
  return false;
}

bool BtrfsCollector::init(const std::string& path) {
  shutdown();
  path_ = path;
  last_error_.clear();
  fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd_ < 0) return fail("open");

  struct statfs sfs{};
  if (::fstatfs(fd_, &sfs) != 0) {
    bool r = fail("statfs");
    shutdown();
    return r;
  }
  if (static_cast<unsigned long>(sfs.f_type) != BTRFS_SUPER_MAGIC) {
    last_error_ = path + " is not a btrfs filesystem";
    std::fprintf(stderr, "check_btrfs: BtrfsCollector: %s\n", last_error_.c_str());
    shutdown();
    return false;
  }
  if (debug_) std::fprintf(stderr, "check_btrfs: BtrfsCollector: opened %s\n", path.c_str());
  return true;
}

void BtrfsCollector::shutdown() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

bool BtrfsCollector::read_space_info(std::vector<SpaceInfo>& out) {
  out.clear();
  // First call with zero slots only reports how many entries exist.
  btrfs_ioctl_space_args probe{};
  if (::ioctl(fd_, BTRFS_IOC_SPACE_INFO, &probe) < 0) return fail("BTRFS_IOC_SPACE_INFO");
  if (probe.total_spaces == 0) return true;

  const size_t slots = static_cast<size_t>(probe.total_spaces);
  std::vector<unsigned char> buf(sizeof(btrfs_ioctl_space_args) + slots * sizeof(btrfs_ioctl_space_info));
  auto* args = reinterpret_cast<btrfs_ioctl_space_args*>(buf.data());
  args->space_slots = slots;
  if (::ioctl(fd_, BTRFS_IOC_SPACE_INFO, args) < 0) return fail("BTRFS_IOC_SPACE_INFO");

  const size_t n = std::min<size_t>(slots, static_cast<size_t>(args->total_spaces));
  out.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    const auto& s = args->spaces[i];
    out.push_back(SpaceInfo{s.flags, s.total_bytes, s.used_bytes});
  }
  return true;
}

bool BtrfsCollector::sample_devices(std::vector<btrcheck::model::DeviceInfo>& out) {
  out.clear();
  btrfs_ioctl_fs_info_args fi{};
  if (::ioctl(fd_, BTRFS_IOC_FS_INFO, &fi) < 0) return fail("BTRFS_IOC_FS_INFO");

  // devids may have holes after device removal; probe each up to max_id.
  for (uint64_t devid = 1; devid <= fi.max_id; ++devid) {
    btrfs_ioctl_dev_info_args di{};
    di.devid = devid;
    if (::ioctl(fd_, BTRFS_IOC_DEV_INFO, &di) < 0) {
      if (errno == ENODEV) continue;
      return fail("BTRFS_IOC_DEV_INFO");
    }
    btrcheck::model::DeviceInfo d;
    d.devid = di.devid;
    d.path.assign(reinterpret_cast<const char*>(di.path),
                  ::strnlen(reinterpret_cast<const char*>(di.path), sizeof(di.path)));
    d.total_bytes = di.total_bytes;
    d.bytes_used = di.bytes_used;
    if (debug_) {
      std::fprintf(stderr, "check_btrfs: BtrfsCollector: devid %" PRIu64 " %s size=%" PRIu64 " allocated=%" PRIu64 "\n",
                   d.devid, d.path.c_str(), d.total_bytes, d.bytes_used);
    }
    out.push_back(std::move(d));
  }
  return true;
}

bool BtrfsCollector::sample_usage(const std::vector<btrcheck::model::DeviceInfo>& devices,
                                  btrcheck::model::UsageSnapshot& out) {
  out = {};
  std::vector<SpaceInfo> spaces;
  if (!read_space_info(spaces)) return false;
  out = summarize_usage(devices, spaces);

  if (debug_) {
    const auto& profile = data_profile(spaces);
    std::fprintf(stderr,
                 "check_btrfs: BtrfsCollector: profile=%.*s size=%" PRIu64 " allocated=%" PRIu64
                 " used=%" PRIu64 " wasted_hard=%" PRIu64 " wasted_soft=%" PRIu64 "\n",
                 static_cast<int>(profile.name.size()), profile.name.data(),
                 out.device_size, out.allocated, out.used, out.wasted_hard, out.wasted_soft);
  }
  return true;
}

bool BtrfsCollector::sample_device_stats(uint64_t devid, btrcheck::model::DeviceStats& out) {
  out.counters.clear();
  btrfs_ioctl_get_dev_stats st{};
  st.devid = devid;
  st.nr_items = BTRFS_DEV_STAT_VALUES_MAX;
  st.flags = 0;
  if (::ioctl(fd_, BTRFS_IOC_GET_DEV_STATS, &st) < 0) return fail("BTRFS_IOC_GET_DEV_STATS");

  // Older kernels may report fewer counters than this header knows about.
  const uint64_t n = std::min<uint64_t>({st.nr_items, BTRFS_DEV_STAT_VALUES_MAX, std::size(kDevStatNames)});
  for (uint64_t i = 0; i < n; ++i) out.counters.emplace_back(kDevStatNames[i], st.values[i]);
  return true;
}

} // namespace btrcheck::collectors
