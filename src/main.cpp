#include "app/Cli.hpp"
#include "app/Config.hpp"
#include "app/Plugin.hpp"
#include "app/Report.hpp"
#include "collectors/BtrfsCollector.hpp"
#include "model/Severity.hpp"
#include "util/TomlReader.hpp"

#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

using btrcheck::model::Severity;
using btrcheck::model::exit_code;

static int usage_error(const char* prog, const std::string& msg) {
  std::cerr << btrcheck::app::usage_text(prog) << prog << ": error: " << msg << "\n";
  return exit_code(Severity::Unknown);
}

static int emit(const btrcheck::app::Report& r) {
  std::cout << r.line << "\n" << std::flush;
  return exit_code(r.severity);
}

int main(int argc, char** argv) {
  const char* prog = argc > 0 ? argv[0] : "check_btrfs";

  btrcheck::app::CliArgs cli;
  std::string err;
  switch (btrcheck::app::parse_cli(argc, argv, cli, err)) {
    case btrcheck::app::CliStatus::Help:
      std::cout << btrcheck::app::usage_text(prog);
      return 0;
    case btrcheck::app::CliStatus::Version:
      std::cout << "check_btrfs " << btrcheck::app::kVersion << "\n";
      return 0;
    case btrcheck::app::CliStatus::Error:
      return usage_error(prog, err);
    case btrcheck::app::CliStatus::Run:
      break;
  }

  // An explicit --config must load; the default location is optional.
  btrcheck::util::TomlReader toml;
  bool have_toml = false;
  if (cli.config_path) {
    have_toml = toml.load(*cli.config_path);
    if (!have_toml) return usage_error(prog, "cannot read config file " + *cli.config_path);
  } else if (auto path = btrcheck::app::config_file_path(); !path.empty()) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) have_toml = toml.load(path);
  }

  auto opts = btrcheck::app::resolve_options(cli, toml, have_toml);
  if (opts.mountpoint.empty()) return usage_error(prog, "the following arguments are required: --mountpoint");

  try {
    btrcheck::collectors::BtrfsCollector fs(opts.debug);
    return emit(btrcheck::app::run_plugin(opts, fs));
  } catch (const std::exception& e) {
    std::fprintf(stderr, "check_btrfs: unexpected error: %s\n", e.what());
    return emit(btrcheck::app::failure_report(Severity::Unknown, {std::string("unexpected error: ") + e.what()}));
  }
}
