/**
 * @file tube_stress.hpp
 * @brief PCI pulley tube bending stress check.
 * @author Watosn
 */
#pragma once

#include <optional>
#include <string>

#include "conveyorcalc/core/types.hpp"
#include "conveyorcalc/schema/outputs.hpp"

namespace conveyorcalc::formulas {

inline constexpr double kTubeStressLimitDrumPsi = 10000.0;
inline constexpr double kTubeStressLimitVGroovePsi = 3400.0;

struct TubeStressInput {
  double tube_od_in{};
  double tube_wall_in{};
  double hub_centers_in{};
  double radial_load_lbf{};
};

struct TubeStressResult {
  std::optional<double> stress_psi{};
  schema::TubeStressStatus check{schema::TubeStressStatus::Incomplete};
  std::optional<std::string> error_message{};
  core::Status status{core::Status::Ok};
};

/**
 * @brief sigma = 8 OD F H / (pi (OD^4 - ID^4)), rounded to whole psi.
 *
 * Non-positive OD or wall is `Incomplete` (DataUnavailable). A wall that
 * consumes the bore is `Error` (InvalidInput). Above the limit the check is
 * `Fail` when enforced and `Warn` otherwise; an estimated hub spacing turns a
 * pass into `Estimated`.
 */
TubeStressResult tube_stress(const TubeStressInput& in, double limit_psi, bool hub_centers_estimated, bool enforce);

/// V-groove pulleys are V-guided belts with a selected V-guide profile.
double tube_stress_limit_psi(bool is_v_groove);

}  // namespace conveyorcalc::formulas
