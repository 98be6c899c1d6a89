/**
 * @file migrate.hpp
 * @brief Schema migration and normalization of raw conveyor inputs.
 * @author Watosn
 *
 * Every step is a pure `RawInput -> RawInput` function that only fills fields
 * that are absent, so each step and the composed `migrate` are idempotent.
 */
#pragma once

#include <optional>
#include <string>

#include "conveyorcalc/core/raw_input.hpp"
#include "conveyorcalc/schema/inputs.hpp"

namespace conveyorcalc::migrate {

/// Legacy pulley diameter fallback.
inline constexpr double kDefaultPulleyDiameterIn = 4.0;
/// Default cleat pitch when cleats are enabled without one.
inline constexpr double kDefaultCleatCentersIn = 12.0;

/**
 * @brief Step 0: `conveyor_width_in` -> `belt_width_in`, default `material_form = PARTS`.
 */
core::RawInput rename_legacy_fields(const core::RawInput& in);

/**
 * @brief Step 1: resolve drive/tail pulley diameters from the legacy single diameter.
 */
core::RawInput unify_pulley_diameters(const core::RawInput& in);

/**
 * @brief Step 2: sync `cleats_enabled`/`cleats_mode`; strip or default cleat sub-fields.
 */
core::RawInput default_cleats(const core::RawInput& in);

/**
 * @brief Step 3: map legacy `support_option`/`support_method` onto per-end support types.
 */
core::RawInput migrate_support(const core::RawInput& in);

/**
 * @brief Step 4: delete TOB and leg/caster fields when the conveyor is not floor supported.
 *
 * TOBs survive in `H_TOB` geometry mode, which needs them to derive the incline.
 */
core::RawInput strip_inapplicable_fields(const core::RawInput& in);

/**
 * @brief Step 5: infer `speed_mode` and keep `drive_rpm` in sync with `drive_rpm_input`.
 */
core::RawInput migrate_speed_mode(const core::RawInput& in);

/**
 * @brief Step 6: default `geometry_mode` and derive `horizontal_run_in` from axis length.
 */
core::RawInput default_geometry_mode(const core::RawInput& in);

/**
 * @brief Step 7: default frame construction and clear sub-fields of other construction types.
 */
core::RawInput default_frame_construction(const core::RawInput& in);

/**
 * @brief All steps in fixed order. Never throws.
 */
core::RawInput migrate(const core::RawInput& in);

/**
 * @brief `migrate` followed by typed conversion.
 */
schema::CanonicalInput normalize(const core::RawInput& in);

/**
 * @brief One-line cleat description for quotes, or nullopt when cleats are disabled.
 */
std::optional<std::string> cleats_summary(const schema::CanonicalInput& in);

}  // namespace conveyorcalc::migrate
