/**
 * @file calculate.hpp
 * @brief Dependency-ordered formula pipeline.
 * @author Watosn
 */
#pragma once

#include "conveyorcalc/schema/inputs.hpp"
#include "conveyorcalc/schema/outputs.hpp"
#include "conveyorcalc/schema/parameters.hpp"

namespace conveyorcalc::formulas {

/**
 * @brief Compute every output for a normalized input.
 *
 * Pure, total and deterministic: geometry is resolved first, then belt and
 * load, pulls, speed and drive, throughput, tracking, shafts, frame, rollers,
 * tensions, tube stress and belt minimum pulley checks, in that order. Invalid
 * geometry yields zero length-dependent outputs rather than an exception.
 */
schema::Output calculate(const schema::CanonicalInput& in, const schema::Parameters& p);

}  // namespace conveyorcalc::formulas
