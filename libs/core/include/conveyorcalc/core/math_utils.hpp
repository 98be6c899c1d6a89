/**
 * @file math_utils.hpp
 * @brief Shared scalar math helpers.
 * @author Watosn
 */
#pragma once

#include <algorithm>
#include <cmath>
#include <numbers>

namespace conveyorcalc::core {

inline constexpr double kPi = std::numbers::pi;

inline double deg_to_rad(double deg) { return deg * kPi / 180.0; }
inline double rad_to_deg(double rad) { return rad * 180.0 / kPi; }

/**
 * @brief Round to a fixed number of decimal places (half away from zero).
 */
inline double round_to(double value, int decimals) {
  const double factor = std::pow(10.0, decimals);
  return std::round(value * factor) / factor;
}

/**
 * @brief Relative closeness test with an absolute floor for values near zero.
 */
inline bool nearly_equal(double a, double b, double rel, double abs_floor = 1e-12) {
  const double d = std::abs(a - b);
  return d <= abs_floor || d <= rel * std::max(std::abs(a), std::abs(b));
}

}  // namespace conveyorcalc::core
