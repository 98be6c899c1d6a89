/**
 * @file outputs.cpp
 * @brief Output flattening.
 * @author Watosn
 */

#include "conveyorcalc/schema/outputs.hpp"

namespace conveyorcalc::schema {
namespace {

class FieldWriter {
 public:
  explicit FieldWriter(core::FieldMap& out) : out_(out) {}

  void put(const char* name, double v) { out_.insert_or_assign(name, core::FieldValue{v}); }
  void put(const char* name, int v) { put(name, static_cast<double>(v)); }
  void put(const char* name, bool v) { out_.insert_or_assign(name, core::FieldValue{v}); }
  void put(const char* name, const std::string& v) { out_.insert_or_assign(name, core::FieldValue{v}); }

  template <typename T>
  void put(const char* name, const std::optional<T>& v) {
    if (v) {
      put(name, *v);
    }
  }

 private:
  core::FieldMap& out_;
};

}  // namespace

const char* to_string(TubeStressStatus s) {
  switch (s) {
    case TubeStressStatus::Incomplete:
      return "incomplete";
    case TubeStressStatus::Pass:
      return "pass";
    case TubeStressStatus::Estimated:
      return "estimated";
    case TubeStressStatus::Warn:
      return "warn";
    case TubeStressStatus::Fail:
      return "fail";
    case TubeStressStatus::Error:
      return "error";
  }
  return "unknown";
}

core::FieldMap to_fields(const Output& o) {
  core::FieldMap out;
  FieldWriter w(out);

  w.put("geometry_mode_used", std::string(to_string(o.geometry_mode_used)));
  w.put("conveyor_length_cc_in", o.conveyor_length_cc_in);
  w.put("horizontal_run_in", o.horizontal_run_in);
  w.put("rise_in", o.rise_in);
  w.put("incline_deg", o.incline_deg);
  w.put("tail_centerline_in", o.tail_centerline_in);
  w.put("drive_centerline_in", o.drive_centerline_in);
  w.put("geometry_valid", o.geometry_valid);

  w.put("piw_used", o.piw_used);
  w.put("pil_used", o.pil_used);
  w.put("belt_piw_effective", o.belt_piw_effective);
  w.put("belt_pil_effective", o.belt_pil_effective);
  w.put("total_belt_length_in", o.total_belt_length_in);
  w.put("belt_weight_lbf", o.belt_weight_lbf);
  w.put("parts_on_belt", o.parts_on_belt);
  w.put("load_on_belt_lbf", o.load_on_belt_lbf);
  w.put("total_load_lbf", o.total_load_lbf);
  w.put("avg_load_per_ft_lbf", o.avg_load_per_ft_lbf);
  w.put("belt_pull_calc_lb", o.belt_pull_calc_lb);

  w.put("friction_pull_lb", o.friction_pull_lb);
  w.put("incline_pull_lb", o.incline_pull_lb);
  w.put("starting_belt_pull_lb", o.starting_belt_pull_lb);
  w.put("total_belt_pull_lb", o.total_belt_pull_lb);

  w.put("speed_mode_used", std::string(to_string(o.speed_mode_used)));
  w.put("belt_speed_fpm", o.belt_speed_fpm);
  w.put("drive_shaft_rpm", o.drive_shaft_rpm);
  w.put("torque_drive_shaft_inlbf", o.torque_drive_shaft_inlbf);
  w.put("gear_ratio", o.gear_ratio);
  w.put("chain_ratio", o.chain_ratio);
  w.put("gearmotor_output_rpm", o.gearmotor_output_rpm);
  w.put("total_drive_ratio", o.total_drive_ratio);
  w.put("pitch_in", o.pitch_in);
  w.put("capacity_pph", o.capacity_pph);
  w.put("target_pph", o.target_pph);
  w.put("meets_throughput", o.meets_throughput);
  w.put("rpm_required_for_target", o.rpm_required_for_target);
  w.put("throughput_margin_achieved_pct", o.throughput_margin_achieved_pct);

  w.put("safety_factor_used", o.safety_factor_used);
  w.put("starting_belt_pull_lb_used", o.starting_belt_pull_lb_used);
  w.put("friction_coeff_used", o.friction_coeff_used);
  w.put("motor_rpm_used", o.motor_rpm_used);

  w.put("drive_pulley_diameter_in", o.drive_pulley_diameter_in);
  w.put("tail_pulley_diameter_in", o.tail_pulley_diameter_in);
  w.put("largest_pulley_diameter_in", o.largest_pulley_diameter_in);
  w.put("is_v_guided", o.is_v_guided);
  w.put("pulley_requires_crown", o.pulley_requires_crown);
  w.put("pulley_face_extra_in", o.pulley_face_extra_in);
  w.put("pulley_face_length_in", o.pulley_face_length_in);
  w.put("drive_shaft_diameter_in", o.drive_shaft_diameter_in);
  w.put("tail_shaft_diameter_in", o.tail_shaft_diameter_in);
  w.put("min_pulley_base_in", o.min_pulley_base_in);
  w.put("min_pulley_drive_required_in", o.min_pulley_drive_required_in);
  w.put("min_pulley_tail_required_in", o.min_pulley_tail_required_in);
  w.put("drive_pulley_meets_minimum", o.drive_pulley_meets_minimum);
  w.put("tail_pulley_meets_minimum", o.tail_pulley_meets_minimum);

  w.put("tracking_lw_ratio", o.tracking_lw_ratio);
  w.put("tracking_lw_band", std::string(to_string(o.tracking_lw_band)));
  w.put("tracking_disturbance_count", o.tracking_disturbance_count);
  w.put("tracking_disturbance_severity_raw", std::string(to_string(o.tracking_disturbance_severity_raw)));
  w.put("tracking_disturbance_severity_modified", std::string(to_string(o.tracking_disturbance_severity_modified)));
  w.put("tracking_mode_recommended", std::string(to_string(o.tracking_mode_recommended)));
  w.put("tracking_recommendation_note", o.tracking_recommendation_note);
  w.put("tracking_recommendation_rationale", o.tracking_recommendation_rationale);

  w.put("drive_T1_lbf", o.drive_T1_lbf);
  w.put("drive_T2_lbf", o.drive_T2_lbf);
  w.put("radial_load_lbf", o.radial_load_lbf);

  w.put("cleats_enabled", o.cleats_enabled);
  w.put("cleats_summary", o.cleats_summary);
  w.put("required_frame_height_in", o.required_frame_height_in);
  w.put("reference_frame_height_in", o.reference_frame_height_in);
  w.put("effective_frame_height_in", o.effective_frame_height_in);
  w.put("clearance_for_selected_standard_in", o.clearance_for_selected_standard_in);
  const auto& b = o.frame_height_breakdown;
  w.put("frame_height_breakdown.largest_pulley_in", b.largest_pulley_in);
  w.put("frame_height_breakdown.cleat_height_in", b.cleat_height_in);
  w.put("frame_height_breakdown.cleat_adder_in", b.cleat_adder_in);
  w.put("frame_height_breakdown.return_roller_in", b.return_roller_in);
  w.put("frame_height_breakdown.required_in", b.required_in);
  w.put("frame_height_breakdown.clearance_in", b.clearance_in);
  w.put("frame_height_breakdown.total_in", b.total_in);
  w.put("frame_height_breakdown.formula", b.formula);
  w.put("requires_snub_rollers", o.requires_snub_rollers);
  w.put("cost_flag_low_profile", o.cost_flag_low_profile);
  w.put("cost_flag_custom_frame", o.cost_flag_custom_frame);
  w.put("cost_flag_snub_rollers", o.cost_flag_snub_rollers);
  w.put("cost_flag_design_review", o.cost_flag_design_review);
  w.put("frame_side_thickness_in", o.frame_side_thickness_in);

  w.put("gravity_roller_quantity", o.gravity_roller_quantity);
  w.put("gravity_roller_spacing_in", o.gravity_roller_spacing_in);
  w.put("snub_roller_quantity", o.snub_roller_quantity);

  w.put("pci_drive_tube_stress_psi", o.pci_drive_tube_stress_psi);
  w.put("pci_tail_tube_stress_psi", o.pci_tail_tube_stress_psi);
  w.put("pci_tube_stress_limit_psi", o.pci_tube_stress_limit_psi);
  w.put("pci_hub_centers_estimated", o.pci_hub_centers_estimated);
  w.put("pci_drive_tube_stress_status", std::string(to_string(o.pci_drive_tube_stress_status)));
  w.put("pci_tail_tube_stress_status", std::string(to_string(o.pci_tail_tube_stress_status)));
  w.put("pci_tube_stress_status", std::string(to_string(o.pci_tube_stress_status)));
  w.put("pci_tube_stress_error_message", o.pci_tube_stress_error_message);
  return out;
}

}  // namespace conveyorcalc::schema
