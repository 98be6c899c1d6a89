/**
 * @file tensions.cpp
 * @brief Drive pulley belt tensions.
 * @author Watosn
 */

#include "conveyorcalc/formulas/tensions.hpp"

#include <cmath>

#include "conveyorcalc/core/math_utils.hpp"

namespace conveyorcalc::formulas {

PulleyTensions pulley_tensions(double total_belt_pull_lb, const schema::Parameters& p) {
  const double te = total_belt_pull_lb * p.tension_service_factor;
  const double wrap = core::deg_to_rad(p.pulley_wrap_angle_deg);
  const double ratio = std::exp(p.pulley_lagging_friction * wrap);
  if (te <= 0.0 || ratio <= 1.0) {
    return PulleyTensions{};
  }

  const double t2 = te / (ratio - 1.0);
  const double t1 = t2 * ratio;
  const double radial = std::sqrt(t1 * t1 + t2 * t2 - 2.0 * t1 * t2 * std::cos(wrap));
  return PulleyTensions{.t1_lbf = core::round_to(t1, 1),
                        .t2_lbf = core::round_to(t2, 1),
                        .radial_lbf = core::round_to(radial, 1)};
}

}  // namespace conveyorcalc::formulas
