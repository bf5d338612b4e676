#pragma once

#include <string>

namespace weft {

// Text form of a number as it appears in the host tree. Whole numbers below
// 1e21 print without exponent or decimals; NaN and infinities print empty.
std::string numberToString(double value);

} // namespace weft
