/**
 * @file legacy_geometry.hpp
 * @brief Deprecated incline helpers retained for older saved configurations.
 * @author Watosn
 *
 * **Known incorrect for inclined conveyors.** These helpers treat the axis
 * (center-to-center) length as if it were the horizontal run and compare
 * top-of-belt heights directly without removing pulley radii. They are kept only
 * so historical numbers can be reproduced and are never used by the calculation
 * pipeline. Use `implied_angle_from_tobs` and `opposite_tob_from_angle` in
 * geometry.hpp instead.
 */
#pragma once

#include "conveyorcalc/schema/enums.hpp"

namespace conveyorcalc::geometry::legacy {

/**
 * @deprecated Rise is divided by axis length and pulley diameters are ignored.
 * @return atan((drive_tob - tail_tob) / axis_length) in degrees, 0 if axis_length <= 0.
 */
[[deprecated("uses axis length as horizontal run; use implied_angle_from_tobs")]] [[nodiscard]] double
implied_angle_deg(double tail_tob_in, double drive_tob_in, double axis_length_in);

/**
 * @deprecated Rise is tan(angle) * axis length and pulley diameters are ignored.
 */
[[deprecated("uses axis length as horizontal run; use opposite_tob_from_angle")]] [[nodiscard]] double
opposite_tob(double reference_tob_in, double angle_deg, double axis_length_in, schema::EndSide reference_end);

/**
 * @brief True when the TOB-implied incline differs from the entered one by more than `tol_deg`.
 */
[[nodiscard]] bool has_angle_mismatch(double implied_deg, double entered_deg, double tol_deg = 0.5);

}  // namespace conveyorcalc::geometry::legacy
