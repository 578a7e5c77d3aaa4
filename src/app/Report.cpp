#include "app/Report.hpp"

namespace btrcheck::app {

using btrcheck::model::Severity;

static std::string join_parts(const std::vector<std::string>& parts) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i) out += ", ";
    out += parts[i];
  }
  return out;
}

Report build_report(const std::vector<CheckResult>& results) {
  Report rep;
  std::vector<std::string> parts;
  for (const auto& r : results) rep.severity = btrcheck::model::worst(rep.severity, r.severity);
  parts.emplace_back(btrcheck::model::severity_name(rep.severity));
  for (const auto& r : results) parts.insert(parts.end(), r.alerts.begin(), r.alerts.end());
  for (const auto& r : results) parts.insert(parts.end(), r.summary.begin(), r.summary.end());
  rep.line = join_parts(parts);
  return rep;
}

Report failure_report(Severity s, const std::vector<std::string>& messages) {
  std::vector<std::string> parts;
  parts.emplace_back(btrcheck::model::severity_name(s));
  parts.insert(parts.end(), messages.begin(), messages.end());
  return Report{s, join_parts(parts)};
}

} // namespace btrcheck::app
