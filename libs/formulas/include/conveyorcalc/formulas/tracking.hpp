/**
 * @file tracking.hpp
 * @brief Belt tracking mode recommendation from geometry and disturbance factors.
 * @author Watosn
 *
 * Guidance only: the recommendation never blocks a calculation and says
 * nothing about crown geometry or groove machining.
 */
#pragma once

#include <optional>
#include <string>

#include "conveyorcalc/schema/enums.hpp"

namespace conveyorcalc::formulas {

/// Upper L/W ratio (inclusive) of the low band.
inline constexpr double kLwBandLowMax = 5.0;
/// Upper L/W ratio (inclusive) of the medium band.
inline constexpr double kLwBandMediumMax = 10.0;
/// Disturbance count at which severity becomes significant.
inline constexpr int kSignificantDisturbanceCount = 3;

struct TrackingInput {
  double conveyor_length_cc_in{};
  double belt_width_in{};
  std::optional<schema::ApplicationClass> application_class{};
  std::optional<schema::BeltConstruction> belt_construction{};
  bool reversing_operation{};
  bool disturbance_side_loading{};
  bool disturbance_load_variability{};
  bool disturbance_environment{};
  bool disturbance_installation_risk{};
  schema::TrackingPreference preference{schema::TrackingPreference::Auto};
};

struct TrackingMatrixCell {
  schema::TrackingMode mode{schema::TrackingMode::Crowned};
  bool with_note{};
};

struct TrackingRecommendation {
  double lw_ratio{};
  schema::LwBand lw_band{schema::LwBand::Low};
  int disturbance_count{};
  schema::DisturbanceSeverity severity_raw{schema::DisturbanceSeverity::Minimal};
  schema::DisturbanceSeverity severity_modified{schema::DisturbanceSeverity::Minimal};
  schema::TrackingMode mode{schema::TrackingMode::Crowned};
  std::optional<std::string> note{};
  std::string rationale{};
};

/// Length over width rounded to 0.1; infinite for a non-positive width.
double lw_ratio(double length_in, double width_in);

schema::LwBand lw_band(double ratio);

int count_disturbances(const TrackingInput& in);

/**
 * @brief Minimal with no disturbances, moderate with one or two, significant
 * with three or more. Reversing together with side loading is always significant.
 */
schema::DisturbanceSeverity raw_severity(const TrackingInput& in);

/**
 * @brief Bulk handling and stiff or profiled belts each nudge severity one step worse, capped at significant.
 */
schema::DisturbanceSeverity apply_severity_modifiers(schema::DisturbanceSeverity severity,
                                                     std::optional<schema::ApplicationClass> application_class,
                                                     std::optional<schema::BeltConstruction> belt_construction);

/**
 * @brief Band x severity decision matrix.
 *
 *            minimal         moderate        significant
 *   low      crowned         crowned + note  hybrid
 *   medium   crowned + note  hybrid          v-guided
 *   high     hybrid          v-guided        v-guided
 */
TrackingMatrixCell recommended_mode(schema::LwBand band, schema::DisturbanceSeverity severity);

/**
 * @brief Full recommendation. A non-auto preference replaces the computed mode;
 * choosing less constraint than recommended produces a cautionary note.
 */
TrackingRecommendation recommend_tracking(const TrackingInput& in);

}  // namespace conveyorcalc::formulas
