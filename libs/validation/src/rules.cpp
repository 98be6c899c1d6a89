/**
 * @file rules.cpp
 * @brief Configuration validation rules.
 * @author Watosn
 */

#include "conveyorcalc/validation/rules.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <optional>
#include <string>
#include <utility>

#include "conveyorcalc/core/math_utils.hpp"
#include "conveyorcalc/formulas/formulas.hpp"
#include "conveyorcalc/formulas/frame.hpp"
#include "conveyorcalc/geometry/geometry.hpp"
#include "conveyorcalc/geometry/legacy_geometry.hpp"

namespace conveyorcalc::validation {
namespace {

using core::Finding;
using core::Severity;

class Findings {
 public:
  void error(std::string field, std::string message) { add(std::move(field), std::move(message), Severity::Error); }
  void warn(std::string field, std::string message) { add(std::move(field), std::move(message), Severity::Warning); }
  void info(std::string field, std::string message) { add(std::move(field), std::move(message), Severity::Info); }

  std::vector<Finding> take() { return std::move(items_); }

 private:
  void add(std::string field, std::string message, Severity s) {
    items_.push_back(Finding{.field = std::move(field), .message = std::move(message), .severity = s});
  }

  std::vector<Finding> items_{};
};

std::string num(double v) { return core::format_value(core::FieldValue{v}); }

bool below(const std::optional<double>& v, double limit) { return v && *v < limit; }
bool missing_or_nonpositive(const std::optional<double>& v) { return !v || *v <= 0.0; }
bool is_whole(double v) { return std::floor(v) == v; }

void check_range(Findings& f,
                 const char* field,
                 const char* label,
                 const std::optional<double>& v,
                 double lo,
                 double hi,
                 const char* unit = "") {
  if (v && (*v < lo || *v > hi)) {
    f.error(field, std::string(label) + " must be between " + num(lo) + unit + " and " + num(hi) + unit);
  }
}

const char* geometry_field(const schema::CanonicalInput& in, schema::GeometryMode mode) {
  switch (mode) {
    case schema::GeometryMode::LengthAngle:
      return "conveyor_length_cc_in";
    case schema::GeometryMode::HorizontalAngle:
      return "horizontal_run_in";
    case schema::GeometryMode::HorizontalTob:
      if (missing_or_nonpositive(in.horizontal_run_in.has_value() ? in.horizontal_run_in : in.conveyor_length_cc_in)) {
        return "horizontal_run_in";
      }
      return in.tail_tob_in ? "drive_tob_in" : "tail_tob_in";
  }
  return "geometry_mode";
}

void check_geometry(Findings& f, const schema::CanonicalInput& in, const schema::Output& out) {
  const auto g = geometry::resolve_geometry(in).derived;
  if (!g.is_valid) {
    f.error(geometry_field(in, g.mode), g.error.value_or("Invalid conveyor geometry"));
  } else if (out.conveyor_length_cc_in <= 0.0) {
    f.error("conveyor_length_cc_in", "Conveyor Length (C-C) must be greater than 0");
  }
  if (missing_or_nonpositive(in.belt_width_in)) {
    f.error("belt_width_in", "Belt Width must be greater than 0");
  }
  if (below(in.conveyor_incline_deg, 0.0)) {
    f.error("conveyor_incline_deg", "Incline Angle must be >= 0");
  }
  if (out.drive_pulley_diameter_in < kMinPulleyDiameterIn) {
    f.error("drive_pulley_diameter_in", "Drive pulley diameter must be at least 2.5\"");
  }
  if (out.tail_pulley_diameter_in < kMinPulleyDiameterIn) {
    f.error("tail_pulley_diameter_in", "Tail pulley diameter must be at least 2.5\"");
  }
  if (below(in.tail_tob_in, 0.0)) {
    f.error("tail_tob_in", "Tail TOB height must be >= 0");
  }
  if (below(in.drive_tob_in, 0.0)) {
    f.error("drive_tob_in", "Drive TOB height must be >= 0");
  }
}

void check_speed_and_throughput(Findings& f, const schema::CanonicalInput& in) {
  switch (in.speed_mode.value_or(schema::SpeedMode::BeltSpeed)) {
    case schema::SpeedMode::BeltSpeed:
      if (missing_or_nonpositive(in.belt_speed_fpm)) {
        f.error("belt_speed_fpm", "Belt Speed must be greater than 0");
      }
      break;
    case schema::SpeedMode::DriveRpm:
      if (missing_or_nonpositive(in.drive_rpm_input.has_value() ? in.drive_rpm_input : in.drive_rpm)) {
        f.error("drive_rpm_input", "Drive RPM must be greater than 0");
      }
      break;
  }
  if (below(in.required_throughput_pph, 0.0)) {
    f.error("required_throughput_pph", "Required throughput must be >= 0");
  }
  if (below(in.throughput_margin_pct, 0.0)) {
    f.error("throughput_margin_pct", "Throughput margin must be >= 0");
  }
}

void check_material(Findings& f, const schema::CanonicalInput& in) {
  if (!in.material_form) {
    if (in.unrecognized.count("material_form") == 0) {
      f.error("material_form", "Material form is required");
    }
    return;
  }
  switch (*in.material_form) {
    case schema::MaterialForm::Parts:
      if (missing_or_nonpositive(in.part_weight_lbs)) {
        f.error("part_weight_lbs", "Part Weight must be greater than 0");
      }
      if (missing_or_nonpositive(in.part_length_in)) {
        f.error("part_length_in", "Part Length must be greater than 0");
      }
      if (missing_or_nonpositive(in.part_width_in)) {
        f.error("part_width_in", "Part Width must be greater than 0");
      }
      if (below(in.part_spacing_in, 0.0)) {
        f.error("part_spacing_in", "Part Spacing must be >= 0");
      }
      break;
    case schema::MaterialForm::Bulk:
      break;
  }
  if (below(in.drop_height_in, 0.0)) {
    f.error("drop_height_in", "Drop height cannot be negative.");
  }
}

void check_overrides(Findings& f, const schema::CanonicalInput& in) {
  check_range(f, "safety_factor", "Safety factor", in.safety_factor, 1.0, 5.0);

  const std::pair<const char*, const std::optional<double>*> coeffs[] = {
      {"belt_coeff_piw", &in.belt_coeff_piw},
      {"belt_coeff_pil", &in.belt_coeff_pil},
      {"belt_piw_override", &in.belt_piw_override},
      {"belt_pil_override", &in.belt_pil_override},
  };
  for (const auto& [field, value] : coeffs) {
    if (!*value) {
      continue;
    }
    if (**value <= 0.0) {
      f.error(field, std::string(field) + " must be > 0");
    } else {
      check_range(f, field, field, *value, 0.05, 0.30);
    }
  }

  check_range(f, "starting_belt_pull_lb", "Starting belt pull", in.starting_belt_pull_lb, 0.0, 2000.0, " lb");
  check_range(f, "friction_coeff", "Friction coefficient", in.friction_coeff, 0.05, 0.6);
  check_range(f, "motor_rpm", "Motor RPM", in.motor_rpm, 800.0, 3600.0);
}

void check_frame(Findings& f, const schema::CanonicalInput& in) {
  if (in.frame_height_mode == schema::FrameHeightMode::Custom) {
    if (!in.custom_frame_height_in) {
      f.error("custom_frame_height_in", "Custom frame height is required when frame height mode is Custom");
    } else if (*in.custom_frame_height_in <= 0.0) {
      f.error("custom_frame_height_in", "Custom frame height must be greater than 0");
    } else if (*in.custom_frame_height_in < formulas::kMinFrameHeightIn) {
      f.error("custom_frame_height_in", "Custom frame height must be at least 3.0\"");
    }
  }

  if (in.frame_construction_type) {
    switch (*in.frame_construction_type) {
      case schema::FrameConstructionType::SheetMetal:
        if (!in.frame_sheet_metal_gauge) {
          f.error("frame_sheet_metal_gauge", "Sheet metal gauge is required for sheet metal frames");
        }
        break;
      case schema::FrameConstructionType::StructuralChannel:
        if (!in.frame_structural_channel_series) {
          f.error("frame_structural_channel_series", "Channel series is required for structural channel frames");
        }
        break;
      case schema::FrameConstructionType::Special:
        break;
    }
  }
}

void check_cleats(Findings& f, const schema::CanonicalInput& in) {
  if (!in.cleats_enabled.value_or(false)) {
    return;
  }
  const auto height = in.cleat_height_in.has_value()
                          ? in.cleat_height_in
                          : (in.cleat_size ? formulas::parse_cleat_size_in(*in.cleat_size) : std::nullopt);
  if (!height) {
    f.error("cleat_height_in", "Cleat height is required when cleats are enabled");
  } else {
    check_range(f, "cleat_height_in", "Cleat height", height, 0.5, 6.0, "\"");
  }
  check_range(f, "cleat_spacing_in", "Cleat spacing", in.cleat_spacing_in, 2.0, 48.0, "\"");
  check_range(f, "cleat_edge_offset_in", "Cleat edge offset", in.cleat_edge_offset_in, 0.0, 12.0, "\"");
}

void check_shafts(Findings& f, const schema::CanonicalInput& in) {
  if (in.shaft_diameter_mode != schema::ShaftDiameterMode::Manual) {
    return;
  }
  check_range(f, "drive_shaft_diameter_in", "Drive shaft diameter", in.drive_shaft_diameter_in, 0.5, 4.0, "\"");
  check_range(f, "tail_shaft_diameter_in", "Tail shaft diameter", in.tail_shaft_diameter_in, 0.5, 4.0, "\"");
}

void check_support(Findings& f, const schema::CanonicalInput& in) {
  if (in.support_method != schema::SupportMethod::FloorSupported) {
    return;
  }
  const auto ref = in.reference_end.value_or(schema::EndSide::Tail);
  switch (ref) {
    case schema::EndSide::Tail:
      if (!in.tail_tob_in) {
        f.error("tail_tob_in", "Tail TOB height is required for floor supported conveyors referenced at the tail");
      }
      break;
    case schema::EndSide::Drive:
      if (!in.drive_tob_in) {
        f.error("drive_tob_in", "Drive TOB height is required for floor supported conveyors referenced at the drive");
      }
      break;
  }

  if (in.include_legs.value_or(false) && !in.leg_model_key) {
    f.error("leg_model_key", "Leg model is required when legs are included");
  }
  if (in.include_casters.value_or(false)) {
    const double rigid = in.caster_rigid_qty.value_or(0.0);
    const double swivel = in.caster_swivel_qty.value_or(0.0);
    if (rigid + swivel <= 0.0) {
      f.error("caster_rigid_qty", "At least one caster is required when casters are included");
    }
    if (rigid > 0.0 && !in.caster_rigid_model_key) {
      f.error("caster_rigid_model_key", "Rigid caster model is required when rigid casters are specified");
    }
    if (swivel > 0.0 && !in.caster_swivel_model_key) {
      f.error("caster_swivel_model_key", "Swivel caster model is required when swivel casters are specified");
    }
  }
}

void check_drive_arrangement(Findings& f, const schema::CanonicalInput& in) {
  if (in.belt_tracking_method == schema::BeltTrackingMethod::VGuided && !in.v_guide_key) {
    f.error("v_guide_key", "V-guide profile is required for V-guided tracking");
  }
  if (in.gearmotor_mounting_style != schema::GearmotorMountingStyle::BottomMount) {
    return;
  }
  const std::pair<const char*, const std::optional<double>*> sprockets[] = {
      {"gm_sprocket_teeth", &in.gm_sprocket_teeth},
      {"drive_shaft_sprocket_teeth", &in.drive_shaft_sprocket_teeth},
  };
  for (const auto& [field, teeth] : sprockets) {
    if (!*teeth) {
      continue;
    }
    if (**teeth <= 0.0) {
      f.error(field, "Sprocket tooth count must be greater than 0");
    } else if (!is_whole(**teeth)) {
      f.error(field, "Sprocket tooth count must be a whole number");
    }
  }
}

}  // namespace

std::vector<Finding> check_structure(const schema::CanonicalInput& in, const schema::Output& out) {
  Findings f;
  check_geometry(f, in, out);
  check_speed_and_throughput(f, in);
  check_material(f, in);
  check_overrides(f, in);
  check_frame(f, in);
  check_cleats(f, in);
  check_shafts(f, in);
  check_support(f, in);
  check_drive_arrangement(f, in);
  for (const auto& [field, text] : in.unrecognized) {
    f.error(field, "Unrecognized value '" + text + "'");
  }
  return f.take();
}

std::vector<Finding> check_parameters(const schema::Parameters& p) {
  Findings f;
  if (p.friction_coeff < 0.1 || p.friction_coeff > 1.0) {
    f.error("friction_coeff", "Friction coefficient must be between 0.1 and 1.0");
  }
  if (p.safety_factor < 1.0) {
    f.error("safety_factor", "Safety factor must be >= 1.0");
  }
  if (p.starting_belt_pull_lb < 0.0) {
    f.error("starting_belt_pull_lb", "Starting belt pull must be >= 0");
  }
  if (p.motor_rpm <= 0.0) {
    f.error("motor_rpm", "Motor RPM must be greater than 0");
  }
  if (p.gravity_in_per_s2 <= 0.0) {
    f.error("gravity_in_per_s2", "Gravity constant must be greater than 0");
  }
  return f.take();
}

std::vector<Finding> check_consistency(const schema::CanonicalInput& in, const schema::Output& out) {
  Findings f;

  const auto largest_lump = in.largest_lump_size_in.has_value() ? in.largest_lump_size_in : in.max_lump_size_in;
  if (below(in.smallest_lump_size_in, 0.0)) {
    f.error("smallest_lump_size_in", "Smallest lump size cannot be negative");
  }
  if (below(largest_lump, 0.0)) {
    f.error("largest_lump_size_in", "Largest lump size cannot be negative");
  }
  if (in.smallest_lump_size_in && largest_lump && *in.smallest_lump_size_in > *largest_lump) {
    f.error("smallest_lump_size_in", "Smallest lump size cannot exceed largest lump size");
  }

  if (in.tail_tob_in && in.drive_tob_in && in.geometry_mode != schema::GeometryMode::HorizontalTob &&
      out.horizontal_run_in > 0.0) {
    const double implied = geometry::implied_angle_from_tobs(*in.tail_tob_in, *in.drive_tob_in, out.horizontal_run_in,
                                                             out.tail_pulley_diameter_in, out.drive_pulley_diameter_in);
    const double entered = in.conveyor_incline_deg.value_or(0.0);
    if (geometry::legacy::has_angle_mismatch(implied, entered, kAngleMismatchTolDeg)) {
      f.warn("conveyor_incline_deg", "Entered incline (" + num(core::round_to(entered, 2)) +
                                         " deg) differs from the incline implied by TOB heights (" +
                                         num(core::round_to(implied, 2)) + " deg)");
    }
  }

  if (in.gearmotor_mounting_style == schema::GearmotorMountingStyle::BottomMount) {
    if (out.chain_ratio < 0.5 || out.chain_ratio > 3.0) {
      f.warn("drive_shaft_sprocket_teeth",
             "Drive chain ratio " + num(core::round_to(out.chain_ratio, 3)) + " is outside the 0.5 to 3.0 range");
    }
    if (below(in.gm_sprocket_teeth, 12.0) && *in.gm_sprocket_teeth > 0.0) {
      f.warn("gm_sprocket_teeth", "Sprockets with fewer than 12 teeth wear quickly");
    }
    if (below(in.drive_shaft_sprocket_teeth, 12.0) && *in.drive_shaft_sprocket_teeth > 0.0) {
      f.warn("drive_shaft_sprocket_teeth", "Sprockets with fewer than 12 teeth wear quickly");
    }
  }

  if (in.cleats_enabled.value_or(false)) {
    const double travel = formulas::travel_dimension_in(in.part_length_in.value_or(0.0), in.part_width_in.value_or(0.0),
                                                        in.orientation.value_or(schema::Orientation::Lengthwise));
    if (in.cleat_spacing_in && travel > 0.0 && *in.cleat_spacing_in < travel) {
      f.warn("cleat_spacing_in", "Cleat spacing is smaller than the part travel dimension");
    }
    if (in.cleat_edge_offset_in && in.belt_width_in && *in.cleat_edge_offset_in > *in.belt_width_in / 2.0) {
      f.warn("cleat_edge_offset_in", "Cleat edge offsets from both sides overlap on this belt width");
    }
  }

  if (out.drive_pulley_meets_minimum == false) {
    f.warn("drive_pulley_diameter_in", "Drive pulley is below belt minimum pulley diameter (" +
                                           num(out.min_pulley_drive_required_in.value_or(0.0)) + "\")");
  }
  if (out.tail_pulley_meets_minimum == false) {
    f.warn("tail_pulley_diameter_in", "Tail pulley is below belt minimum pulley diameter (" +
                                          num(out.min_pulley_tail_required_in.value_or(0.0)) + "\")");
  }
  return f.take();
}

std::vector<Finding> check_domain(const schema::CanonicalInput& in, const schema::Output& out) {
  using schema::TubeStressStatus;
  Findings f;

  if (in.part_temperature_class == schema::PartTemperatureClass::RedHot) {
    f.error("part_temperature_class", "Do not use sliderbed conveyor for red hot parts");
  }
  if (in.part_temperature_class == schema::PartTemperatureClass::Hot) {
    f.warn("part_temperature_class", "Consider high-temperature belt");
  }
  if (in.fluid_type == schema::FluidType::ConsiderableOilLiquid) {
    f.warn("fluid_type", "Consider ribbed or specialty belt");
  }
  if (in.fluid_type == schema::FluidType::MinimalResidualOil) {
    f.info("fluid_type", "Minimal residual oil present");
  }
  if (out.conveyor_length_cc_in > 120.0) {
    f.warn("conveyor_length_cc_in", "Consider multi-section body");
  }
  if (in.drop_height_in && *in.drop_height_in >= 24.0) {
    f.warn("drop_height_in", "Drop height is high. Consider impact or wear protection.");
  }

  const double incline = out.incline_deg;
  if (incline > kMaxInclineDeg) {
    f.error("conveyor_incline_deg",
            "Incline exceeds 45°. Sliderbed conveyor without positive engagement is not supported by this model.");
  } else if (incline > kPositiveEngagementInclineDeg) {
    f.warn("conveyor_incline_deg",
           "Incline exceeds 35°. Product retention by friction alone is unlikely. Cleats or positive engagement "
           "features are required for reliable operation.");
  } else if (incline > kRetentionInclineDeg) {
    f.warn("conveyor_incline_deg",
           "Incline exceeds 20°. Product retention by friction alone may be insufficient. Cleats or other retention "
           "features are typically required at this angle.");
  }

  if (in.frame_height_mode == schema::FrameHeightMode::LowProfile && out.cleats_enabled) {
    f.error("frame_height_mode",
            "Low Profile not compatible with cleats: Low Profile frames use snub rollers, which cleated belts cannot "
            "run over");
  }

  const auto side = in.side_loading_direction.value_or(schema::SideLoadingDirection::None);
  if (side != schema::SideLoadingDirection::None) {
    if (in.side_loading_severity == schema::SideLoadingSeverity::Heavy) {
      if (!out.is_v_guided) {
        f.error("belt_tracking_method", "Heavy side loading requires V-guided tracking");
      }
      f.warn("side_loading_severity", "Heavy side loading typically requires a V-guide for reliable tracking.");
    } else if (in.side_loading_severity == schema::SideLoadingSeverity::Moderate) {
      f.warn("side_loading_severity", "Moderate side loading may require a V-guide for reliable tracking.");
    }
  }

  if (in.finger_safe.value_or(false)) {
    if (in.end_guards.value_or(schema::EndGuards::None) == schema::EndGuards::None) {
      f.warn("end_guards", "Finger safety may require end guards depending on layout.");
    }
    if (!in.bottom_covers.value_or(false)) {
      f.warn("bottom_covers", "Bottom covers may be required to achieve finger-safe access underneath.");
    }
  }
  if (in.lacing_style == schema::LacingStyle::ClipperLacing) {
    f.warn("lacing_style", "Clipper lacing may interfere with end guards due to protrusion.");
  }
  if (in.start_stop_application.value_or(false) && below(in.cycle_time_seconds, 10.0)) {
    f.warn("cycle_time_seconds", "Frequent start/stop applications may require a higher-duty gearbox.");
  }

  if (out.cost_flag_design_review) {
    f.warn("frame_height_mode", "Design review required: frame height " + num(out.effective_frame_height_in) +
                                    "\" is below 4\"");
  }
  if (out.requires_snub_rollers) {
    f.info("frame_height_mode", "Snub rollers will be required at both ends for this frame height");
  }
  if (out.cleats_enabled && out.frame_height_breakdown.cleat_height_in > 0.0) {
    f.info("cleats_enabled", "Frame height includes 2x cleat height (" +
                                 num(out.frame_height_breakdown.cleat_adder_in) + "\")");
  }

  if (out.belt_speed_fpm > 300.0) {
    f.warn("belt_speed_fpm", "Belt speed above 300 FPM is outside typical sliderbed range");
  }
  if (out.gear_ratio > 0.0 && (out.gear_ratio < 5.0 || out.gear_ratio > 60.0)) {
    f.warn("gear_ratio", "Gear ratio " + num(core::round_to(out.gear_ratio, 2)) +
                             " is outside the typical 5 to 60 gearmotor range");
  }

  const std::string stress_msg =
      "PCI tube stress " + num(std::max(out.pci_drive_tube_stress_psi.value_or(0.0),
                                        out.pci_tail_tube_stress_psi.value_or(0.0))) +
      " psi exceeds the " + num(out.pci_tube_stress_limit_psi) + " psi limit";
  switch (out.pci_tube_stress_status) {
    case TubeStressStatus::Fail:
      f.error("pci_tube_stress_status", stress_msg);
      break;
    case TubeStressStatus::Warn:
      f.warn("pci_tube_stress_status", stress_msg);
      break;
    case TubeStressStatus::Error:
      f.error("pci_tube_stress_status", out.pci_tube_stress_error_message.value_or("Invalid tube geometry"));
      break;
    case TubeStressStatus::Estimated:
      f.info("hub_centers_in", "PCI tube stress uses belt width as hub centers; enter hub centers to confirm");
      break;
    case TubeStressStatus::Incomplete:
    case TubeStressStatus::Pass:
      break;
  }
  return f.take();
}

std::vector<Finding> validate(const schema::CanonicalInput& in, const schema::Parameters& p, const schema::Output& out) {
  std::vector<Finding> all = check_structure(in, out);
  auto append = [&all](std::vector<Finding> more) {
    all.insert(all.end(), std::make_move_iterator(more.begin()), std::make_move_iterator(more.end()));
  };
  append(check_parameters(p));
  append(check_consistency(in, out));
  append(check_domain(in, out));
  return all;
}

}  // namespace conveyorcalc::validation
