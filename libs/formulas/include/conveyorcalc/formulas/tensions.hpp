/**
 * @file tensions.hpp
 * @brief Drive pulley belt tensions (Euler-Eytelwein capstan relation).
 * @author Watosn
 */
#pragma once

#include "conveyorcalc/schema/parameters.hpp"

namespace conveyorcalc::formulas {

struct PulleyTensions {
  double t1_lbf{};      ///< tight side
  double t2_lbf{};      ///< slack side
  double radial_lbf{};  ///< resultant load on the pulley shaft
};

/**
 * @brief Tight/slack side tensions and shaft radial load for a given total belt pull.
 *
 * Effective tension is the pull times the service factor; wrap angle and
 * lagging friction come from `Parameters`. Values are rounded to 0.1 lbf. A
 * non-positive effective tension gives all zeros.
 */
PulleyTensions pulley_tensions(double total_belt_pull_lb, const schema::Parameters& p);

}  // namespace conveyorcalc::formulas
