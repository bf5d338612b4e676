#include "shared/WeftNumberFormat.h"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace weft {

namespace {

constexpr double kPlainIntegerLimit = 1e21;

} // namespace

std::string numberToString(double value) {
  if (std::isnan(value) || !std::isfinite(value)) {
    return std::string{};
  }
  if (value == 0) {
    return "0";
  }

  std::ostringstream oss;
  if (std::floor(value) == value && std::fabs(value) < kPlainIntegerLimit) {
    oss << std::fixed << std::setprecision(0) << value;
  } else {
    oss << value;
  }
  return oss.str();
}

} // namespace weft
