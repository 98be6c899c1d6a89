/**
 * @file inputs.hpp
 * @brief Canonical, normalized conveyor input record.
 * @author Watosn
 */
#pragma once

#include <map>
#include <optional>
#include <string>

#include "conveyorcalc/core/raw_input.hpp"
#include "conveyorcalc/schema/enums.hpp"

namespace conveyorcalc::schema {

/**
 * @brief Fully normalized conveyor description.
 *
 * Produced once per call by `migrate::normalize`. Fields that do not apply to
 * the active modes are `std::nullopt`. Enumerated fields whose text was not
 * recognized are kept verbatim in `unrecognized` so that validation can report
 * them and `to_raw` can re-emit them unchanged.
 */
struct CanonicalInput {
  // geometry
  std::optional<GeometryMode> geometry_mode{};
  std::optional<double> conveyor_length_cc_in{};
  std::optional<double> horizontal_run_in{};
  std::optional<double> conveyor_incline_deg{};
  std::optional<double> tail_tob_in{};
  std::optional<double> drive_tob_in{};
  std::optional<EndSide> reference_end{};
  std::optional<double> belt_width_in{};

  // pulleys
  std::optional<double> pulley_diameter_in{};
  std::optional<double> drive_pulley_diameter_in{};
  std::optional<double> tail_pulley_diameter_in{};
  std::optional<bool> pulley_diameters_linked{};

  // speed and throughput
  std::optional<SpeedMode> speed_mode{};
  std::optional<double> belt_speed_fpm{};
  std::optional<double> drive_rpm{};
  std::optional<double> drive_rpm_input{};
  std::optional<double> required_throughput_pph{};
  std::optional<double> throughput_margin_pct{};

  // material
  std::optional<MaterialForm> material_form{};
  std::optional<double> part_weight_lbs{};
  std::optional<double> part_length_in{};
  std::optional<double> part_width_in{};
  std::optional<double> part_spacing_in{};
  std::optional<Orientation> orientation{};
  std::optional<double> drop_height_in{};
  std::optional<PartTemperatureClass> part_temperature_class{};
  std::optional<FluidType> fluid_type{};
  std::optional<double> smallest_lump_size_in{};
  std::optional<double> largest_lump_size_in{};
  std::optional<double> max_lump_size_in{};

  // power-user overrides of Parameters
  std::optional<double> safety_factor{};
  std::optional<double> starting_belt_pull_lb{};
  std::optional<double> friction_coeff{};
  std::optional<double> motor_rpm{};

  // belt
  std::optional<double> belt_coeff_piw{};
  std::optional<double> belt_coeff_pil{};
  std::optional<double> belt_piw_override{};
  std::optional<double> belt_pil_override{};
  std::optional<double> belt_piw{};
  std::optional<double> belt_pil{};
  std::optional<double> belt_min_pulley_dia_no_vguide_in{};
  std::optional<double> belt_min_pulley_dia_with_vguide_in{};
  std::optional<BeltTrackingMethod> belt_tracking_method{};
  std::optional<std::string> v_guide_key{};

  // shafts
  std::optional<ShaftDiameterMode> shaft_diameter_mode{};
  std::optional<double> drive_shaft_diameter_in{};
  std::optional<double> tail_shaft_diameter_in{};

  // frame
  std::optional<FrameHeightMode> frame_height_mode{};
  std::optional<double> custom_frame_height_in{};
  std::optional<double> frame_clearance_in{};
  std::optional<FrameConstructionType> frame_construction_type{};
  std::optional<std::string> frame_sheet_metal_gauge{};
  std::optional<std::string> frame_structural_channel_series{};

  // cleats
  std::optional<bool> cleats_enabled{};
  std::optional<std::string> cleats_mode{};
  std::optional<double> cleat_height_in{};
  std::optional<double> cleat_spacing_in{};
  std::optional<double> cleat_edge_offset_in{};
  std::optional<std::string> cleat_size{};
  std::optional<std::string> cleat_profile{};
  std::optional<std::string> cleat_style{};
  std::optional<double> cleat_centers_in{};
  std::optional<std::string> cleat_pattern{};
  std::optional<std::string> cleat_material_family{};

  // support
  std::optional<SupportMethod> support_method{};
  std::optional<EndSupportType> tail_support_type{};
  std::optional<EndSupportType> drive_support_type{};
  std::optional<bool> include_legs{};
  std::optional<bool> include_casters{};
  std::optional<std::string> leg_model_key{};
  std::optional<double> caster_rigid_qty{};
  std::optional<std::string> caster_rigid_model_key{};
  std::optional<double> caster_swivel_qty{};
  std::optional<std::string> caster_swivel_model_key{};

  // drive arrangement
  std::optional<GearmotorMountingStyle> gearmotor_mounting_style{};
  std::optional<double> gm_sprocket_teeth{};
  std::optional<double> drive_shaft_sprocket_teeth{};

  // features and application
  std::optional<bool> finger_safe{};
  std::optional<EndGuards> end_guards{};
  std::optional<bool> bottom_covers{};
  std::optional<LacingStyle> lacing_style{};
  std::optional<bool> start_stop_application{};
  std::optional<double> cycle_time_seconds{};
  std::optional<SideLoadingDirection> side_loading_direction{};
  std::optional<SideLoadingSeverity> side_loading_severity{};

  // tracking recommendation
  std::optional<ApplicationClass> application_class{};
  std::optional<BeltConstruction> belt_construction{};
  std::optional<bool> reversing_operation{};
  std::optional<bool> disturbance_side_loading{};
  std::optional<bool> disturbance_load_variability{};
  std::optional<bool> disturbance_environment{};
  std::optional<bool> disturbance_installation_risk{};
  std::optional<TrackingPreference> tracking_preference{};

  // PCI tube geometry
  std::optional<double> drive_tube_od_in{};
  std::optional<double> drive_tube_wall_in{};
  std::optional<double> tail_tube_od_in{};
  std::optional<double> tail_tube_wall_in{};
  std::optional<double> hub_centers_in{};

  std::map<std::string, std::string> unrecognized{};

  bool operator==(const CanonicalInput&) const = default;
};

/**
 * @brief Visit every typed field of a canonical input as (name, member reference).
 *
 * Works for const and non-const records; `from_raw` and `to_raw` are both
 * built on this single list.
 */
template <typename Self, typename Visitor>
void visit_fields(Self& in, Visitor&& v) {
  v("geometry_mode", in.geometry_mode);
  v("conveyor_length_cc_in", in.conveyor_length_cc_in);
  v("horizontal_run_in", in.horizontal_run_in);
  v("conveyor_incline_deg", in.conveyor_incline_deg);
  v("tail_tob_in", in.tail_tob_in);
  v("drive_tob_in", in.drive_tob_in);
  v("reference_end", in.reference_end);
  v("belt_width_in", in.belt_width_in);

  v("pulley_diameter_in", in.pulley_diameter_in);
  v("drive_pulley_diameter_in", in.drive_pulley_diameter_in);
  v("tail_pulley_diameter_in", in.tail_pulley_diameter_in);
  v("pulley_diameters_linked", in.pulley_diameters_linked);

  v("speed_mode", in.speed_mode);
  v("belt_speed_fpm", in.belt_speed_fpm);
  v("drive_rpm", in.drive_rpm);
  v("drive_rpm_input", in.drive_rpm_input);
  v("required_throughput_pph", in.required_throughput_pph);
  v("throughput_margin_pct", in.throughput_margin_pct);

  v("material_form", in.material_form);
  v("part_weight_lbs", in.part_weight_lbs);
  v("part_length_in", in.part_length_in);
  v("part_width_in", in.part_width_in);
  v("part_spacing_in", in.part_spacing_in);
  v("orientation", in.orientation);
  v("drop_height_in", in.drop_height_in);
  v("part_temperature_class", in.part_temperature_class);
  v("fluid_type", in.fluid_type);
  v("smallest_lump_size_in", in.smallest_lump_size_in);
  v("largest_lump_size_in", in.largest_lump_size_in);
  v("max_lump_size_in", in.max_lump_size_in);

  v("safety_factor", in.safety_factor);
  v("starting_belt_pull_lb", in.starting_belt_pull_lb);
  v("friction_coeff", in.friction_coeff);
  v("motor_rpm", in.motor_rpm);

  v("belt_coeff_piw", in.belt_coeff_piw);
  v("belt_coeff_pil", in.belt_coeff_pil);
  v("belt_piw_override", in.belt_piw_override);
  v("belt_pil_override", in.belt_pil_override);
  v("belt_piw", in.belt_piw);
  v("belt_pil", in.belt_pil);
  v("belt_min_pulley_dia_no_vguide_in", in.belt_min_pulley_dia_no_vguide_in);
  v("belt_min_pulley_dia_with_vguide_in", in.belt_min_pulley_dia_with_vguide_in);
  v("belt_tracking_method", in.belt_tracking_method);
  v("v_guide_key", in.v_guide_key);

  v("shaft_diameter_mode", in.shaft_diameter_mode);
  v("drive_shaft_diameter_in", in.drive_shaft_diameter_in);
  v("tail_shaft_diameter_in", in.tail_shaft_diameter_in);

  v("frame_height_mode", in.frame_height_mode);
  v("custom_frame_height_in", in.custom_frame_height_in);
  v("frame_clearance_in", in.frame_clearance_in);
  v("frame_construction_type", in.frame_construction_type);
  v("frame_sheet_metal_gauge", in.frame_sheet_metal_gauge);
  v("frame_structural_channel_series", in.frame_structural_channel_series);

  v("cleats_enabled", in.cleats_enabled);
  v("cleats_mode", in.cleats_mode);
  v("cleat_height_in", in.cleat_height_in);
  v("cleat_spacing_in", in.cleat_spacing_in);
  v("cleat_edge_offset_in", in.cleat_edge_offset_in);
  v("cleat_size", in.cleat_size);
  v("cleat_profile", in.cleat_profile);
  v("cleat_style", in.cleat_style);
  v("cleat_centers_in", in.cleat_centers_in);
  v("cleat_pattern", in.cleat_pattern);
  v("cleat_material_family", in.cleat_material_family);

  v("support_method", in.support_method);
  v("tail_support_type", in.tail_support_type);
  v("drive_support_type", in.drive_support_type);
  v("include_legs", in.include_legs);
  v("include_casters", in.include_casters);
  v("leg_model_key", in.leg_model_key);
  v("caster_rigid_qty", in.caster_rigid_qty);
  v("caster_rigid_model_key", in.caster_rigid_model_key);
  v("caster_swivel_qty", in.caster_swivel_qty);
  v("caster_swivel_model_key", in.caster_swivel_model_key);

  v("gearmotor_mounting_style", in.gearmotor_mounting_style);
  v("gm_sprocket_teeth", in.gm_sprocket_teeth);
  v("drive_shaft_sprocket_teeth", in.drive_shaft_sprocket_teeth);

  v("finger_safe", in.finger_safe);
  v("end_guards", in.end_guards);
  v("bottom_covers", in.bottom_covers);
  v("lacing_style", in.lacing_style);
  v("start_stop_application", in.start_stop_application);
  v("cycle_time_seconds", in.cycle_time_seconds);
  v("side_loading_direction", in.side_loading_direction);
  v("side_loading_severity", in.side_loading_severity);

  v("application_class", in.application_class);
  v("belt_construction", in.belt_construction);
  v("reversing_operation", in.reversing_operation);
  v("disturbance_side_loading", in.disturbance_side_loading);
  v("disturbance_load_variability", in.disturbance_load_variability);
  v("disturbance_environment", in.disturbance_environment);
  v("disturbance_installation_risk", in.disturbance_installation_risk);
  v("tracking_preference", in.tracking_preference);

  v("drive_tube_od_in", in.drive_tube_od_in);
  v("drive_tube_wall_in", in.drive_tube_wall_in);
  v("tail_tube_od_in", in.tail_tube_od_in);
  v("tail_tube_wall_in", in.tail_tube_wall_in);
  v("hub_centers_in", in.hub_centers_in);
}

/**
 * @brief Build a typed record from a (migrated) raw map. Never throws.
 *
 * Unknown field names are dropped. Values of the wrong kind are treated as
 * absent, except enum text, which is preserved in `unrecognized`.
 */
CanonicalInput from_raw(const core::RawInput& raw);

/**
 * @brief Inverse of `from_raw` for every present field.
 */
core::RawInput to_raw(const CanonicalInput& in);

}  // namespace conveyorcalc::schema
