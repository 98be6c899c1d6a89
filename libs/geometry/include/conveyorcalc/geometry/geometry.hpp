/**
 * @file geometry.hpp
 * @brief Conveyor incline geometry resolver.
 * @author Watosn
 */
#pragma once

#include <optional>
#include <string>

#include <Eigen/Dense>

#include "conveyorcalc/schema/enums.hpp"
#include "conveyorcalc/schema/inputs.hpp"

namespace conveyorcalc::geometry {

/// Angles closer to zero than this are treated as exactly horizontal.
inline constexpr double kHorizontalThresholdDeg = 0.01;
/// Derived incline is clamped to +/- this value.
inline constexpr double kMaxInclineDeg = 45.0;
/// Pulley diameter used when nothing else is supplied.
inline constexpr double kDefaultPulleyDiameterIn = 4.0;
/// Rises smaller than this are reported as a horizontal conveyor.
inline constexpr double kMinRiseIn = 0.001;
/// Cosine floor protecting axis length near vertical angles.
inline constexpr double kMinCosine = 0.01;

/**
 * @brief Canonical derived geometry.
 */
struct DerivedGeometry {
  schema::GeometryMode mode{schema::GeometryMode::LengthAngle};
  double L_cc_in{};     ///< axis (center-to-center) length along the incline
  double H_cc_in{};     ///< horizontal run between pulley centers
  double theta_deg{};   ///< incline angle
  double rise_in{};     ///< drive centerline minus tail centerline
  std::optional<double> tail_cl_in{};
  std::optional<double> drive_cl_in{};
  double drive_pulley_dia_in{kDefaultPulleyDiameterIn};
  double tail_pulley_dia_in{kDefaultPulleyDiameterIn};
  bool is_valid{true};
  std::optional<std::string> error{};

  bool operator==(const DerivedGeometry&) const = default;
};

/**
 * @brief Resolver result: derived record plus the input fields it normalizes.
 */
struct GeometryResolution {
  schema::CanonicalInput normalized{};
  DerivedGeometry derived{};
};

/**
 * @brief Tail and drive pulley center points in the conveyor side plane.
 *
 * x runs horizontally from the tail center; y is elevation. Requires centerline
 * heights to place the tail vertically, otherwise the tail sits at y = 0.
 */
struct PulleyCenters {
  Eigen::Vector2d tail{Eigen::Vector2d::Zero()};
  Eigen::Vector2d drive{Eigen::Vector2d::Zero()};
};

[[nodiscard]] bool is_effectively_horizontal(double angle_deg);

[[nodiscard]] double axis_from_horizontal(double horizontal_in, double angle_deg);
[[nodiscard]] double horizontal_from_axis(double axis_in, double angle_deg);
[[nodiscard]] double rise_from_axis_and_angle(double axis_in, double angle_deg);
[[nodiscard]] double rise_from_horizontal_and_angle(double horizontal_in, double angle_deg);

[[nodiscard]] inline double tob_to_centerline(double tob_in, double pulley_dia_in) { return tob_in - pulley_dia_in / 2.0; }
[[nodiscard]] inline double centerline_to_tob(double cl_in, double pulley_dia_in) { return cl_in + pulley_dia_in / 2.0; }

/**
 * @brief Incline implied by two centerline heights over a horizontal run, clamped to +/-45 deg.
 */
[[nodiscard]] double angle_from_centerlines(double tail_cl_in, double drive_cl_in, double horizontal_in);

/**
 * @brief Incline implied by two top-of-belt heights, accounting for unequal pulleys.
 */
[[nodiscard]] double implied_angle_from_tobs(double tail_tob_in,
                                             double drive_tob_in,
                                             double horizontal_in,
                                             double tail_pulley_dia_in,
                                             double drive_pulley_dia_in);

/**
 * @brief Top-of-belt at the opposite end given one end's TOB and the incline.
 */
[[nodiscard]] double opposite_tob_from_angle(double reference_tob_in,
                                             double angle_deg,
                                             double horizontal_in,
                                             double reference_pulley_dia_in,
                                             double opposite_pulley_dia_in,
                                             schema::EndSide reference_end);

/**
 * @brief Resolve canonical geometry from whichever mode is active.
 * @throws std::invalid_argument when `geometry_mode` holds a value outside the enumeration.
 */
[[nodiscard]] GeometryResolution resolve_geometry(const schema::CanonicalInput& in);

/**
 * @brief Pulley center points of a derived geometry.
 */
[[nodiscard]] PulleyCenters pulley_centers(const DerivedGeometry& g);

/**
 * @brief True when two derivations describe the same conveyor within `rel_tol`.
 *
 * Compares (axis length, horizontal run, rise) as a vector.
 */
[[nodiscard]] bool agree(const DerivedGeometry& a, const DerivedGeometry& b, double rel_tol = 1e-5);

}  // namespace conveyorcalc::geometry
