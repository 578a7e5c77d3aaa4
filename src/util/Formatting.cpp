#include "util/Formatting.hpp"

#include <iomanip>
#include <sstream>

namespace btrcheck::util {

std::string human_bytes(uint64_t bytes) {
  static constexpr const char* units[] = {"KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};
  if (bytes < 1024ULL) return std::to_string(bytes) + "B";
  double v = static_cast<double>(bytes) / 1024.0;
  size_t u = 0;
  // Step up once the value would print as 1024.00 at two decimals.
  while (v >= 1023.995 && u + 1 < sizeof(units) / sizeof(units[0])) {
    v /= 1024.0;
    ++u;
  }
  std::ostringstream os;
  os.setf(std::ios::fixed);
  os << std::setprecision(2) << v << units[u];
  return os.str();
}

std::string count_noun(uint64_t n, const char* singular, const char* plural) {
  return std::to_string(n) + " " + (n == 1 ? singular : plural);
}

} // namespace btrcheck::util
