#pragma once
#include "app/Config.hpp"
#include "app/Report.hpp"
#include "collectors/IFsCollector.hpp"
#include <string>
#include <vector>

namespace btrcheck::app {

// Precondition diagnostics: config problems, mountpoint access, threshold
// ranges. Empty when the check may run.
[[nodiscard]] std::vector<std::string> validate(const Options& opts);

// One full check run. Validation failures are CRITICAL and never touch fs;
// collector failures are UNKNOWN.
[[nodiscard]] Report run_plugin(const Options& opts, btrcheck::collectors::IFsCollector& fs);

} // namespace btrcheck::app
