#include "minitest.hpp"
#include "FakeFsCollector.hpp"
#include "app/Checks.hpp"

using btrcheck::app::Thresholds;
using btrcheck::app::check_usage;
using btrcheck::app::rounded_percent;
using btrcheck::model::Severity;
using btrcheck::model::UsageSnapshot;

static UsageSnapshot usage_gib(uint64_t size, uint64_t allocated, uint64_t used) {
  UsageSnapshot u{};
  u.device_size = size * kGiB;
  u.allocated = allocated * kGiB;
  u.used = used * kGiB;
  return u;
}

static Thresholds limits(long long warn_gib, long long crit_gib, long long warn_pct, long long crit_pct) {
  Thresholds t;
  t.allocated_warning_gib = warn_gib;
  t.allocated_critical_gib = crit_gib;
  t.allocated_warning_percent = warn_pct;
  t.allocated_critical_percent = crit_pct;
  return t;
}

TEST(usage_derived_quantities) {
  UsageSnapshot u{};
  u.device_size = 100 * kGiB;
  u.allocated = 60 * kGiB;
  u.used = 40 * kGiB;
  u.wasted_hard = 4 * kGiB;
  u.wasted_soft = 6 * kGiB;
  ASSERT_EQ(u.wasted(), 10 * kGiB);
  ASSERT_EQ(u.total(), 90 * kGiB);
  ASSERT_EQ(u.unallocated(), 30 * kGiB);
  ASSERT_EQ(u.unused(), 50 * kGiB);
}

TEST(usage_derived_quantities_saturate) {
  UsageSnapshot u{};
  u.device_size = 10;
  u.wasted_hard = 20;
  u.allocated = 5;
  ASSERT_EQ(u.total(), 0u);
  ASSERT_EQ(u.unallocated(), 0u);
  ASSERT_EQ(u.unused(), 0u);
}

TEST(rounded_percent_half_up) {
  ASSERT_EQ(rounded_percent(0, 100), 0);
  ASSERT_EQ(rounded_percent(95, 100), 95);
  ASSERT_EQ(rounded_percent(1, 200), 1);     // 0.5 rounds up
  ASSERT_EQ(rounded_percent(1, 201), 0);     // 0.497
  ASSERT_EQ(rounded_percent(199, 200), 100); // 99.5 rounds up
  ASSERT_EQ(rounded_percent(2, 3), 67);
  ASSERT_EQ(rounded_percent(5, 0), 0);
  ASSERT_EQ(rounded_percent(300, 100), 100); // clamped
}

TEST(rounded_percent_huge_values_do_not_overflow) {
  const uint64_t whole = UINT64_MAX;
  ASSERT_EQ(rounded_percent(whole, whole), 100);
  ASSERT_EQ(rounded_percent(whole / 2, whole), 50);
}

TEST(rounded_percent_stays_in_range) {
  const uint64_t totals[] = {1, 3, 7, 1000, 12345677, 1ULL << 40};
  for (auto total : totals) {
    for (uint64_t step = 0; step <= 16; ++step) {
      uint64_t part = total / 16 * step;
      int p = rounded_percent(part, total);
      ASSERT_TRUE(p >= 0 && p <= 100);
    }
  }
}

TEST(usage_warning_percent_example) {
  auto r = check_usage(usage_gib(100, 95, 50), limits(0, 0, 90, 98));
  ASSERT_EQ(r.severity, Severity::Warning);
  ASSERT_EQ(r.alerts.size(), 1u);
  ASSERT_EQ(r.alerts[0], std::string("Allocated space 95% reached warning limit 90%"));
}

TEST(usage_critical_percent) {
  auto r = check_usage(usage_gib(100, 98, 50), limits(0, 0, 90, 98));
  ASSERT_EQ(r.severity, Severity::Critical);
  ASSERT_EQ(r.alerts.size(), 1u);
  ASSERT_CONTAINS(r.alerts[0], "reached critical limit 98%");
}

TEST(usage_critical_floor_beats_percent) {
  // unallocated = 0.5GiB, critical floor 1GiB, percent limits far away
  UsageSnapshot u{};
  u.device_size = 100 * kGiB;
  u.allocated = 100 * kGiB - kGiB / 2;
  u.used = 10 * kGiB;
  auto r = check_usage(u, limits(2, 1, 100, 100));
  ASSERT_EQ(r.severity, Severity::Critical);
  ASSERT_EQ(r.alerts[0], std::string("Unallocated space 512.00MiB below critical limit 1GiB"));
}

TEST(usage_critical_floor_regardless_of_percent_limits) {
  UsageSnapshot u = usage_gib(10, 9, 1);  // 1GiB unallocated, 90% allocated
  for (long long warn = 0; warn <= 100; warn += 10) {
    for (long long crit = warn; crit <= 100; crit += 10) {
      auto r = check_usage(u, limits(2, 2, warn, crit));
      ASSERT_EQ(r.severity, Severity::Critical);
    }
  }
}

TEST(usage_warning_floor) {
  auto r = check_usage(usage_gib(100, 97, 50), limits(5, 2, 100, 100));
  ASSERT_EQ(r.severity, Severity::Warning);
  ASSERT_EQ(r.alerts.size(), 1u);
  ASSERT_EQ(r.alerts[0], std::string("Unallocated space 3.00GiB below warning limit 5GiB"));
}

TEST(usage_both_rules_contribute) {
  auto r = check_usage(usage_gib(100, 97, 50), limits(5, 2, 90, 99));
  ASSERT_EQ(r.severity, Severity::Warning);
  ASSERT_EQ(r.alerts.size(), 2u);
  ASSERT_CONTAINS(r.alerts[0], "Unallocated space");
  ASSERT_CONTAINS(r.alerts[1], "Allocated space 97%");
}

TEST(usage_ok_with_defaults) {
  auto r = check_usage(usage_gib(100, 40, 30), Thresholds{});
  ASSERT_EQ(r.severity, Severity::Ok);
  ASSERT_TRUE(r.alerts.empty());
  ASSERT_EQ(r.summary.size(), 3u);
  ASSERT_EQ(r.summary[0], std::string("Total size 100.00GiB"));
  ASSERT_EQ(r.summary[1], std::string("Allocated 40.00GiB (40%)"));
  ASSERT_EQ(r.summary[2], std::string("Used 30.00GiB (30%)"));
}

TEST(usage_default_percent_trips_when_full) {
  auto r = check_usage(usage_gib(100, 100, 30), Thresholds{});
  ASSERT_EQ(r.severity, Severity::Critical);
  ASSERT_CONTAINS(r.alerts[0], "Allocated space 100% reached critical limit 100%");
}

TEST(usage_wasted_line_only_when_wasted) {
  UsageSnapshot u = usage_gib(110, 40, 30);
  u.wasted_hard = 8 * kGiB;
  u.wasted_soft = 2 * kGiB;
  auto r = check_usage(u, Thresholds{});
  ASSERT_EQ(r.summary.size(), 4u);
  ASSERT_EQ(r.summary[0], std::string("Total size 100.00GiB"));
  ASSERT_EQ(r.summary[3], std::string("Wasted 10.00GiB (hard 8.00GiB, soft 2.00GiB)"));
}
