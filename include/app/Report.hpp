#pragma once
#include "app/Checks.hpp"
#include "model/Severity.hpp"
#include <string>
#include <vector>

namespace btrcheck::app {

struct Report {
  btrcheck::model::Severity severity{btrcheck::model::Severity::Ok};
  std::string line;  // single stdout line, no trailing newline
};

// Worst severity of all results; line is the severity name, every alert,
// then every summary, in result order, joined by ", ".
[[nodiscard]] Report build_report(const std::vector<CheckResult>& results);

// Report for a run that could not reach the checks.
[[nodiscard]] Report failure_report(btrcheck::model::Severity s, const std::vector<std::string>& messages);

} // namespace btrcheck::app
