#pragma once
#include <algorithm>
#include <string_view>

namespace btrcheck::model {

// Ordered: the aggregate of several results is the most severe one.
// Numeric values double as the plugin exit code.
enum class Severity : int { Ok = 0, Warning = 1, Critical = 2, Unknown = 3 };

[[nodiscard]] constexpr std::string_view severity_name(Severity s) {
  switch (s) {
    case Severity::Ok:       return "OK";
    case Severity::Warning:  return "WARNING";
    case Severity::Critical: return "CRITICAL";
    case Severity::Unknown:  return "UNKNOWN";
  }
  return "UNKNOWN";
}

[[nodiscard]] constexpr int exit_code(Severity s) { return static_cast<int>(s); }

[[nodiscard]] constexpr Severity worst(Severity a, Severity b) {
  return std::max(a, b);
}

} // namespace btrcheck::model
