#pragma once
#include "model/Fs.hpp"
#include <cstdint>
#include <string_view>
#include <vector>

namespace btrcheck::collectors {

// Chunk placement rules of one btrfs block group profile, mirroring the
// kernel's btrfs_raid_array.
struct RaidProfile {
  std::string_view name;
  uint64_t flag{};         // BTRFS_BLOCK_GROUP_* bit, 0 for single
  int devs_min{1};
  int devs_max{1};         // 0 = as many as have free space
  int devs_increment{1};
  int dev_stripes{1};      // stripes per device (2 for dup)
  int ncopies{1};
  int nparity{0};
};

// One BTRFS_IOC_SPACE_INFO entry.
struct SpaceInfo {
  uint64_t flags{};
  uint64_t total_bytes{};
  uint64_t used_bytes{};
};

// Profile for a block group flag set; single when no profile bit is set.
[[nodiscard]] const RaidProfile& profile_for_flags(uint64_t flags);

// Raw bytes consumed on disk to store 'logical' bytes with profile p across
// num_devices devices.
[[nodiscard]] uint64_t raw_bytes(const RaidProfile& p, uint64_t logical, uint64_t num_devices);

// Place chunks greedily on the devices with the most free space until the
// profile cannot place another one, then return the free space left over.
[[nodiscard]] uint64_t unallocatable_bytes(const RaidProfile& p, std::vector<uint64_t> free_per_device);

// Profile new data chunks are allocated with: the DATA entry holding the most
// space, single when there is none. The global reserve is not a block group.
[[nodiscard]] const RaidProfile& data_profile(const std::vector<SpaceInfo>& spaces);

// Filesystem-wide usage from per-device allocation and space-info entries.
[[nodiscard]] btrcheck::model::UsageSnapshot summarize_usage(const std::vector<btrcheck::model::DeviceInfo>& devices,
                                                             const std::vector<SpaceInfo>& spaces);

} // namespace btrcheck::collectors
