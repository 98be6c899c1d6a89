/**
 * @file rules.hpp
 * @brief Configuration validation rules.
 * @author Watosn
 */
#pragma once

#include <vector>

#include "conveyorcalc/core/types.hpp"
#include "conveyorcalc/schema/inputs.hpp"
#include "conveyorcalc/schema/outputs.hpp"
#include "conveyorcalc/schema/parameters.hpp"

namespace conveyorcalc::validation {

/// Incline above which sliderbed conveyors are rejected.
inline constexpr double kMaxInclineDeg = 45.0;
inline constexpr double kPositiveEngagementInclineDeg = 35.0;
inline constexpr double kRetentionInclineDeg = 20.0;
inline constexpr double kMinPulleyDiameterIn = 2.5;
/// Allowed difference between entered and TOB-implied incline.
inline constexpr double kAngleMismatchTolDeg = 0.5;

/**
 * @brief Field presence and range checks for the active modes.
 */
std::vector<core::Finding> check_structure(const schema::CanonicalInput& in, const schema::Output& out);

/**
 * @brief Sanity limits on engineering constants.
 */
std::vector<core::Finding> check_parameters(const schema::Parameters& p);

/**
 * @brief Cross-field consistency checks.
 */
std::vector<core::Finding> check_consistency(const schema::CanonicalInput& in, const schema::Output& out);

/**
 * @brief Engineering limits, incompatibilities and application advisories.
 */
std::vector<core::Finding> check_domain(const schema::CanonicalInput& in, const schema::Output& out);

/**
 * @brief All rule groups in fixed order: structure, parameters, consistency, domain.
 *
 * Depends only on its arguments, so repeated calls return identical findings in
 * identical order.
 */
std::vector<core::Finding> validate(const schema::CanonicalInput& in,
                                    const schema::Parameters& p,
                                    const schema::Output& out);

}  // namespace conveyorcalc::validation
