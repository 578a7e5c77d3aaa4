#pragma once

#include <cstdint>
#include <string>

namespace btrcheck::util {

// Binary-unit size with two decimals, e.g. 95.00GiB; below 1KiB plain bytes (512B).
std::string human_bytes(uint64_t bytes);

// "1 device", "3 devices"
std::string count_noun(uint64_t n, const char* singular, const char* plural);

} // namespace btrcheck::util
