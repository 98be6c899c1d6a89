/**
 * @file legacy_geometry.cpp
 * @brief Deprecated incline helpers.
 * @author Watosn
 */

#include "conveyorcalc/geometry/legacy_geometry.hpp"

#include <cmath>

#include "conveyorcalc/core/math_utils.hpp"

namespace conveyorcalc::geometry::legacy {

double implied_angle_deg(double tail_tob_in, double drive_tob_in, double axis_length_in) {
  if (axis_length_in <= 0.0) {
    return 0.0;
  }
  return core::rad_to_deg(std::atan((drive_tob_in - tail_tob_in) / axis_length_in));
}

double opposite_tob(double reference_tob_in, double angle_deg, double axis_length_in, schema::EndSide reference_end) {
  const double rise = std::tan(core::deg_to_rad(angle_deg)) * axis_length_in;
  switch (reference_end) {
    case schema::EndSide::Tail:
      return reference_tob_in + rise;
    case schema::EndSide::Drive:
      return reference_tob_in - rise;
  }
  return reference_tob_in;
}

bool has_angle_mismatch(double implied_deg, double entered_deg, double tol_deg) {
  return std::abs(implied_deg - entered_deg) > tol_deg;
}

}  // namespace conveyorcalc::geometry::legacy
