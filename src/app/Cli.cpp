#include "app/Cli.hpp"
#include "util/TomlReader.hpp"

#include <optional>
#include <sstream>
#include <string_view>

namespace btrcheck::app {

namespace {

enum class Flag { Mountpoint, WarnGib, CritGib, WarnPct, CritPct, Config };

struct FlagDef { const char* long_name; const char* short_name; Flag flag; };

constexpr FlagDef kFlags[] = {
  {"--mountpoint",                 "-m", Flag::Mountpoint},
  {"--allocated-warning-gib",      "-w", Flag::WarnGib},
  {"--allocated-critical-gib",     "-c", Flag::CritGib},
  {"--allocated-warning-percent",  "-W", Flag::WarnPct},
  {"--allocated-critical-percent", "-C", Flag::CritPct},
  {"--config",                     nullptr, Flag::Config},
};

const FlagDef* find_flag(std::string_view name) {
  for (const auto& f : kFlags) {
    if (name == f.long_name || (f.short_name && name == f.short_name)) return &f;
  }
  return nullptr;
}

bool assign(const FlagDef& def, const std::string& value, CliArgs& out, std::string& err) {
  auto as_int = [&](std::optional<long long>& slot) {
    auto v = btrcheck::util::TomlReader::parse_integer(value);
    if (!v) { err = std::string("argument ") + def.long_name + ": invalid int value: '" + value + "'"; return false; }
    slot = *v;
    return true;
  };
  switch (def.flag) {
    case Flag::Mountpoint: out.mountpoint = value; return true;
    case Flag::Config:     out.config_path = value; return true;
    case Flag::WarnGib:    return as_int(out.allocated_warning_gib);
    case Flag::CritGib:    return as_int(out.allocated_critical_gib);
    case Flag::WarnPct:    return as_int(out.allocated_warning_percent);
    case Flag::CritPct:    return as_int(out.allocated_critical_percent);
  }
  return false;
}

} // namespace

CliStatus parse_cli(int argc, char** argv, CliArgs& out, std::string& err) {
  out = CliArgs{};
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "-h" || a == "--help") return CliStatus::Help;
    if (a == "--version") return CliStatus::Version;
    if (a == "--debug") { out.debug = true; continue; }

    std::string name = a, value;
    bool inline_value = false;
    if (a.rfind("--", 0) == 0) {
      if (auto eq = a.find('='); eq != std::string::npos) {
        name = a.substr(0, eq);
        value = a.substr(eq + 1);
        inline_value = true;
      }
    }
    const FlagDef* def = find_flag(name);
    if (!def) {
      err = "unrecognized argument: " + a;
      return CliStatus::Error;
    }
    if (!inline_value) {
      if (i + 1 >= argc) {
        err = std::string("argument ") + def->long_name + ": expected one argument";
        return CliStatus::Error;
      }
      value = argv[++i];
    }
    if (!assign(*def, value, out, err)) return CliStatus::Error;
  }
  return CliStatus::Run;
}

std::string usage_text(const char* prog) {
  std::ostringstream os;
  os << "usage: " << (prog ? prog : "check_btrfs") << " --mountpoint PATH [options]\n"
     << "\n"
     << "Check btrfs allocation and device error counters (monitoring plugin).\n"
     << "\n"
     << "  -m, --mountpoint PATH               filesystem to check\n"
     << "  -w, --allocated-warning-gib N       WARNING when unallocated space < N GiB (default 0)\n"
     << "  -c, --allocated-critical-gib N      CRITICAL when unallocated space < N GiB (default 0)\n"
     << "  -W, --allocated-warning-percent N   WARNING when allocated >= N% (default 100)\n"
     << "  -C, --allocated-critical-percent N  CRITICAL when allocated >= N% (default 100)\n"
     << "      --config PATH                   TOML config file\n"
     << "      --debug                         diagnostics on stderr\n"
     << "  -h, --help                          show this help\n"
     << "      --version                       show version\n"
     << "\n"
     << "Exit status: 0 OK, 1 WARNING, 2 CRITICAL, 3 UNKNOWN.\n";
  return os.str();
}

} // namespace btrcheck::app
