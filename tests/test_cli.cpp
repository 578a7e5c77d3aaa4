#include "minitest.hpp"
#include "app/Cli.hpp"

#include <string>
#include <vector>

using btrcheck::app::CliArgs;
using btrcheck::app::CliStatus;
using btrcheck::app::parse_cli;

static CliStatus parse(std::vector<std::string> args, CliArgs& out, std::string& err) {
  args.insert(args.begin(), "check_btrfs");
  std::vector<char*> argv;
  for (auto& a : args) argv.push_back(a.data());
  argv.push_back(nullptr);
  return parse_cli(static_cast<int>(args.size()), argv.data(), out, err);
}

TEST(cli_long_flags) {
  CliArgs a; std::string err;
  auto st = parse({"--mountpoint", "/srv", "--allocated-warning-gib", "10", "--allocated-critical-gib", "5",
                   "--allocated-warning-percent", "90", "--allocated-critical-percent", "98"}, a, err);
  ASSERT_EQ(st, CliStatus::Run);
  ASSERT_EQ(*a.mountpoint, std::string("/srv"));
  ASSERT_EQ(*a.allocated_warning_gib, 10);
  ASSERT_EQ(*a.allocated_critical_gib, 5);
  ASSERT_EQ(*a.allocated_warning_percent, 90);
  ASSERT_EQ(*a.allocated_critical_percent, 98);
  ASSERT_FALSE(a.debug);
}

TEST(cli_equals_and_short_forms) {
  CliArgs a; std::string err;
  auto st = parse({"-m", "/data", "--allocated-warning-percent=80", "-C", "95", "--debug", "--config=/etc/b.toml"}, a, err);
  ASSERT_EQ(st, CliStatus::Run);
  ASSERT_EQ(*a.mountpoint, std::string("/data"));
  ASSERT_EQ(*a.allocated_warning_percent, 80);
  ASSERT_EQ(*a.allocated_critical_percent, 95);
  ASSERT_EQ(*a.config_path, std::string("/etc/b.toml"));
  ASSERT_TRUE(a.debug);
  ASSERT_FALSE(a.allocated_warning_gib.has_value());
}

TEST(cli_negative_value_parses_for_later_validation) {
  CliArgs a; std::string err;
  ASSERT_EQ(parse({"-m", "/", "-w", "-3"}, a, err), CliStatus::Run);
  ASSERT_EQ(*a.allocated_warning_gib, -3);
}

TEST(cli_rejects_non_integer) {
  CliArgs a; std::string err;
  ASSERT_EQ(parse({"-m", "/", "--allocated-warning-gib", "ten"}, a, err), CliStatus::Error);
  ASSERT_CONTAINS(err, "invalid int value: 'ten'");
  ASSERT_EQ(parse({"-m", "/", "-W", "12.5"}, a, err), CliStatus::Error);
}

TEST(cli_rejects_unknown_and_missing_value) {
  CliArgs a; std::string err;
  ASSERT_EQ(parse({"--frobnicate"}, a, err), CliStatus::Error);
  ASSERT_CONTAINS(err, "unrecognized argument");
  ASSERT_EQ(parse({"--mountpoint"}, a, err), CliStatus::Error);
  ASSERT_CONTAINS(err, "expected one argument");
}

TEST(cli_help_and_version) {
  CliArgs a; std::string err;
  ASSERT_EQ(parse({"-m", "/", "--help"}, a, err), CliStatus::Help);
  ASSERT_EQ(parse({"--version"}, a, err), CliStatus::Version);
  ASSERT_CONTAINS(btrcheck::app::usage_text("check_btrfs"), "--allocated-critical-percent");
}
