/**
 * @file tube_stress.cpp
 * @brief PCI pulley tube bending stress check.
 * @author Watosn
 */

#include "conveyorcalc/formulas/tube_stress.hpp"

#include <cmath>

#include "conveyorcalc/core/math_utils.hpp"

namespace conveyorcalc::formulas {

TubeStressResult tube_stress(const TubeStressInput& in, double limit_psi, bool hub_centers_estimated, bool enforce) {
  using schema::TubeStressStatus;

  const double od = in.tube_od_in;
  const double wall = in.tube_wall_in;
  if (od <= 0.0 || wall <= 0.0) {
    return TubeStressResult{.check = TubeStressStatus::Incomplete, .status = core::Status::DataUnavailable};
  }

  const double id = od - 2.0 * wall;
  if (id <= 0.0) {
    return TubeStressResult{.check = TubeStressStatus::Error,
                            .error_message = "Invalid tube geometry: wall thickness (" +
                                             core::format_value(core::FieldValue{wall}) + "\") exceeds radius (" +
                                             core::format_value(core::FieldValue{od / 2.0}) + "\")",
                            .status = core::Status::InvalidInput};
  }

  const double od4 = std::pow(od, 4);
  const double id4 = std::pow(id, 4);
  if (od4 - id4 <= 0.0) {
    return TubeStressResult{.check = TubeStressStatus::Error,
                            .error_message = "Invalid tube geometry: OD^4 - ID^4 <= 0",
                            .status = core::Status::InvalidInput};
  }

  const double stress = 8.0 * od * in.radial_load_lbf * in.hub_centers_in / (core::kPi * (od4 - id4));
  if (!std::isfinite(stress)) {
    return TubeStressResult{.check = TubeStressStatus::Error, .status = core::Status::NumericalError};
  }

  TubeStressStatus check = TubeStressStatus::Pass;
  if (stress > limit_psi) {
    check = enforce ? TubeStressStatus::Fail : TubeStressStatus::Warn;
  } else if (hub_centers_estimated) {
    check = TubeStressStatus::Estimated;
  }
  return TubeStressResult{.stress_psi = std::round(stress), .check = check};
}

double tube_stress_limit_psi(bool is_v_groove) {
  return is_v_groove ? kTubeStressLimitVGroovePsi : kTubeStressLimitDrumPsi;
}

}  // namespace conveyorcalc::formulas
