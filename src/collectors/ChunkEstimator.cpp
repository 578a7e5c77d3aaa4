#include "collectors/ChunkEstimator.hpp"

#include <linux/btrfs_tree.h>
#include <algorithm>
#include <functional>
#include <numeric>

namespace btrcheck::collectors {

static constexpr uint64_t kMiB = 1024ULL * 1024ULL;
static constexpr uint64_t kGiB = 1024ULL * kMiB;
// Smallest stripe worth placing; anything below is left over.
static constexpr uint64_t kMinStripe = kMiB;
// Data chunks are at most 1GiB per stripe.
static constexpr uint64_t kMaxStripe = kGiB;

static constexpr RaidProfile kProfiles[] = {
  //  name       flag                        min max inc stripes copies parity
  {"single",  0,                            1,  1,  1,  1,      1,     0},
  {"dup",     BTRFS_BLOCK_GROUP_DUP,        1,  1,  1,  2,      2,     0},
  {"raid0",   BTRFS_BLOCK_GROUP_RAID0,      1,  0,  1,  1,      1,     0},
  {"raid1",   BTRFS_BLOCK_GROUP_RAID1,      2,  2,  2,  1,      2,     0},
  {"raid1c3", BTRFS_BLOCK_GROUP_RAID1C3,    3,  3,  3,  1,      3,     0},
  {"raid1c4", BTRFS_BLOCK_GROUP_RAID1C4,    4,  4,  4,  1,      4,     0},
  {"raid10",  BTRFS_BLOCK_GROUP_RAID10,     2,  0,  2,  1,      2,     0},
  {"raid5",   BTRFS_BLOCK_GROUP_RAID5,      2,  0,  1,  1,      1,     1},
  {"raid6",   BTRFS_BLOCK_GROUP_RAID6,      3,  0,  1,  1,      1,     2},
};

const RaidProfile& profile_for_flags(uint64_t flags) {
  const uint64_t bits = flags & BTRFS_BLOCK_GROUP_PROFILE_MASK;
  for (const auto& p : kProfiles) {
    if (p.flag != 0 && (bits & p.flag) == p.flag) return p;
  }
  return kProfiles[0];
}

uint64_t raw_bytes(const RaidProfile& p, uint64_t logical, uint64_t num_devices) {
  if (p.nparity == 0) return logical * static_cast<uint64_t>(p.ncopies);
  const uint64_t parity = static_cast<uint64_t>(p.nparity);
  if (num_devices <= parity) return logical * (parity + 1);
  // logical * n / (n - parity) without overflowing for large filesystems
  const uint64_t data_devs = num_devices - parity;
  return (logical / data_devs) * num_devices + (logical % data_devs) * num_devices / data_devs;
}

uint64_t unallocatable_bytes(const RaidProfile& p, std::vector<uint64_t> free_per_device) {
  // Single-device profiles place every chunk on one device, so devices never
  // interact and each can be drained in one step.
  if (p.devs_max == 1 && free_per_device.size() > 1) {
    uint64_t left = 0;
    for (uint64_t f : free_per_device) left += unallocatable_bytes(p, {f});
    return left;
  }
  const uint64_t stripes = static_cast<uint64_t>(p.dev_stripes);
  const uint64_t min_free = kMinStripe * stripes;
  auto& free = free_per_device;
  for (;;) {
    std::sort(free.begin(), free.end(), std::greater<>());
    size_t eligible = 0;
    while (eligible < free.size() && free[eligible] >= min_free) ++eligible;
    size_t ndevs = eligible;
    if (p.devs_max > 0) ndevs = std::min<size_t>(ndevs, static_cast<size_t>(p.devs_max));
    ndevs -= ndevs % static_cast<size_t>(p.devs_increment);
    if (ndevs == 0 || ndevs < static_cast<size_t>(p.devs_min)) break;

    uint64_t stripe = free[ndevs - 1] / stripes;
    // With a choice of devices, placement order matters: keep steps chunk-sized
    // so the greedy choice is re-evaluated the way the kernel would.
    if (ndevs < eligible) stripe = std::min(stripe, kMaxStripe);
    for (size_t i = 0; i < ndevs; ++i) free[i] -= stripe * stripes;
  }
  return std::accumulate(free.begin(), free.end(), uint64_t{0});
}

const RaidProfile& data_profile(const std::vector<SpaceInfo>& spaces) {
  uint64_t data_flags = 0, data_total = 0;
  for (const auto& s : spaces) {
    if (s.flags & BTRFS_SPACE_INFO_GLOBAL_RSV) continue;
    if ((s.flags & BTRFS_BLOCK_GROUP_DATA) && s.total_bytes >= data_total) {
      data_total = s.total_bytes;
      data_flags = s.flags;
    }
  }
  return profile_for_flags(data_flags);
}

btrcheck::model::UsageSnapshot summarize_usage(const std::vector<btrcheck::model::DeviceInfo>& devices,
                                               const std::vector<SpaceInfo>& spaces) {
  btrcheck::model::UsageSnapshot out{};
  std::vector<uint64_t> sizes, unallocated;
  sizes.reserve(devices.size());
  unallocated.reserve(devices.size());
  for (const auto& d : devices) {
    out.device_size += d.total_bytes;
    out.allocated += d.bytes_used;
    sizes.push_back(d.total_bytes);
    unallocated.push_back(d.total_bytes > d.bytes_used ? d.total_bytes - d.bytes_used : 0ULL);
  }

  const uint64_t ndevs = devices.size();
  for (const auto& s : spaces) {
    if (s.flags & BTRFS_SPACE_INFO_GLOBAL_RSV) continue;
    out.used += raw_bytes(profile_for_flags(s.flags), s.used_bytes, ndevs);
  }

  const auto& profile = data_profile(spaces);
  out.wasted_hard = unallocatable_bytes(profile, sizes);
  const uint64_t stuck = unallocatable_bytes(profile, unallocated);
  out.wasted_soft = stuck > out.wasted_hard ? stuck - out.wasted_hard : 0ULL;
  return out;
}

} // namespace btrcheck::collectors
