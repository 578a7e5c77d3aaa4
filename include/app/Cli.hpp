#pragma once

#include "app/Config.hpp"
#include <string>

namespace btrcheck::app {

enum class CliStatus { Run, Help, Version, Error };

// Parse argv into out. On Error, err holds the reason.
// Accepts "--flag value" and "--flag=value".
[[nodiscard]] CliStatus parse_cli(int argc, char** argv, CliArgs& out, std::string& err);

std::string usage_text(const char* prog);

inline constexpr const char* kVersion = "1.0.0";

} // namespace btrcheck::app
