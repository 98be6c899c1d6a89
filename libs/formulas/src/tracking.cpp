/**
 * @file tracking.cpp
 * @brief Belt tracking mode recommendation.
 * @author Watosn
 */

#include "conveyorcalc/formulas/tracking.hpp"

#include <limits>

#include "conveyorcalc/core/math_utils.hpp"

namespace conveyorcalc::formulas {
namespace {

using schema::DisturbanceSeverity;
using schema::LwBand;
using schema::TrackingMode;
using schema::TrackingPreference;

DisturbanceSeverity nudge_worse(DisturbanceSeverity s) {
  return s == DisturbanceSeverity::Minimal ? DisturbanceSeverity::Moderate : DisturbanceSeverity::Significant;
}

std::optional<TrackingMode> preferred_mode(TrackingPreference preference) {
  switch (preference) {
    case TrackingPreference::PreferCrowned:
      return TrackingMode::Crowned;
    case TrackingPreference::PreferHybrid:
      return TrackingMode::Hybrid;
    case TrackingPreference::PreferVGuided:
      return TrackingMode::VGuided;
    case TrackingPreference::Auto:
      break;
  }
  return std::nullopt;
}

std::string display_name(TrackingMode mode) {
  switch (mode) {
    case TrackingMode::Crowned:
      return "Crowned pulleys";
    case TrackingMode::Hybrid:
      return "Hybrid (crowned pulleys + V-guide)";
    case TrackingMode::VGuided:
      return "V-guided (flat pulleys + V-guide)";
  }
  return "Crowned pulleys";
}

const char* band_text(LwBand band) {
  switch (band) {
    case LwBand::Low:
      return "favorable";
    case LwBand::Medium:
      return "moderate";
    case LwBand::High:
      return "high";
  }
  return "high";
}

std::string build_rationale(LwBand band, DisturbanceSeverity severity, TrackingMode mode, TrackingMode computed) {
  if (mode != computed) {
    return "User preference applied. " + display_name(mode) + " selected. System would recommend " +
           display_name(computed) + " for these conditions.";
  }
  switch (mode) {
    case TrackingMode::Crowned:
      if (severity == DisturbanceSeverity::Minimal) {
        return std::string("Crowned pulleys are appropriate. L/W ratio is ") + band_text(band) +
               " and disturbance factors are minimal.";
      }
      return "Crowned pulleys are appropriate for this geometry. Selected conditions may reduce tracking margin.";
    case TrackingMode::Hybrid:
      return std::string(
                 "Hybrid adds tracking margin by combining crowned pulleys with a V-guide. Recommended given ") +
             band_text(band) + " L/W ratio and selected conditions.";
    case TrackingMode::VGuided:
      return "V-guided provides positive belt constraint. Recommended when geometry and conditions increase "
             "tracking sensitivity.";
  }
  return {};
}

std::optional<std::string> build_note(bool with_note, TrackingMode mode, TrackingMode computed) {
  if (mode != computed) {
    // TrackingMode is ordered by increasing constraint.
    if (mode < computed) {
      return "Selected mode provides less tracking control than recommended. Tracking margin may be reduced.";
    }
    return std::nullopt;
  }
  if (with_note) {
    return "Conditions may reduce tracking margin. Consider Hybrid if issues appear in service.";
  }
  return std::nullopt;
}

}  // namespace

double lw_ratio(double length_in, double width_in) {
  if (width_in <= 0.0) {
    return std::numeric_limits<double>::infinity();
  }
  return core::round_to(length_in / width_in, 1);
}

LwBand lw_band(double ratio) {
  if (ratio <= kLwBandLowMax) {
    return LwBand::Low;
  }
  if (ratio <= kLwBandMediumMax) {
    return LwBand::Medium;
  }
  return LwBand::High;
}

int count_disturbances(const TrackingInput& in) {
  return static_cast<int>(in.reversing_operation) + static_cast<int>(in.disturbance_side_loading) +
         static_cast<int>(in.disturbance_load_variability) + static_cast<int>(in.disturbance_environment) +
         static_cast<int>(in.disturbance_installation_risk);
}

DisturbanceSeverity raw_severity(const TrackingInput& in) {
  if (in.reversing_operation && in.disturbance_side_loading) {
    return DisturbanceSeverity::Significant;
  }
  const int count = count_disturbances(in);
  if (count >= kSignificantDisturbanceCount) {
    return DisturbanceSeverity::Significant;
  }
  return count >= 1 ? DisturbanceSeverity::Moderate : DisturbanceSeverity::Minimal;
}

DisturbanceSeverity apply_severity_modifiers(DisturbanceSeverity severity,
                                             std::optional<schema::ApplicationClass> application_class,
                                             std::optional<schema::BeltConstruction> belt_construction) {
  if (application_class == schema::ApplicationClass::BulkHandling) {
    severity = nudge_worse(severity);
  }
  if (belt_construction == schema::BeltConstruction::SteelCordOrVeryStiff ||
      belt_construction == schema::BeltConstruction::ProfiledSidewallOrHighCleat) {
    severity = nudge_worse(severity);
  }
  return severity;
}

TrackingMatrixCell recommended_mode(LwBand band, DisturbanceSeverity severity) {
  switch (band) {
    case LwBand::Low:
      switch (severity) {
        case DisturbanceSeverity::Minimal:
          return {TrackingMode::Crowned, false};
        case DisturbanceSeverity::Moderate:
          return {TrackingMode::Crowned, true};
        case DisturbanceSeverity::Significant:
          return {TrackingMode::Hybrid, false};
      }
      break;
    case LwBand::Medium:
      switch (severity) {
        case DisturbanceSeverity::Minimal:
          return {TrackingMode::Crowned, true};
        case DisturbanceSeverity::Moderate:
          return {TrackingMode::Hybrid, false};
        case DisturbanceSeverity::Significant:
          return {TrackingMode::VGuided, false};
      }
      break;
    case LwBand::High:
      switch (severity) {
        case DisturbanceSeverity::Minimal:
          return {TrackingMode::Hybrid, false};
        case DisturbanceSeverity::Moderate:
        case DisturbanceSeverity::Significant:
          return {TrackingMode::VGuided, false};
      }
      break;
  }
  return {TrackingMode::Crowned, false};
}

TrackingRecommendation recommend_tracking(const TrackingInput& in) {
  TrackingRecommendation r{};
  r.lw_ratio = lw_ratio(in.conveyor_length_cc_in, in.belt_width_in);
  r.lw_band = lw_band(r.lw_ratio);
  r.disturbance_count = count_disturbances(in);
  r.severity_raw = raw_severity(in);
  r.severity_modified = apply_severity_modifiers(r.severity_raw, in.application_class, in.belt_construction);

  const auto cell = recommended_mode(r.lw_band, r.severity_modified);
  r.mode = preferred_mode(in.preference).value_or(cell.mode);
  r.rationale = build_rationale(r.lw_band, r.severity_modified, r.mode, cell.mode);
  r.note = build_note(cell.with_note, r.mode, cell.mode);
  return r;
}

}  // namespace conveyorcalc::formulas
