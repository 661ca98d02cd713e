#pragma once

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace dpos {

// Monetary amounts are fractional: fees and commissions are rates of amounts
using Amount = double;

constexpr Amount AMOUNT_EPSILON = 1e-9;

// Fixed-precision rendering used wherever an amount enters a hash
inline std::string canonicalAmount(Amount amount) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(9) << amount;
  return oss.str();
}

} // namespace dpos
