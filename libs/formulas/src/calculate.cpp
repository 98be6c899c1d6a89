/**
 * @file calculate.cpp
 * @brief Dependency-ordered formula pipeline.
 * @author Watosn
 */

#include "conveyorcalc/formulas/calculate.hpp"

#include <algorithm>

#include "conveyorcalc/formulas/formulas.hpp"
#include "conveyorcalc/formulas/frame.hpp"
#include "conveyorcalc/formulas/tensions.hpp"
#include "conveyorcalc/formulas/tracking.hpp"
#include "conveyorcalc/formulas/tube_stress.hpp"
#include "conveyorcalc/geometry/geometry.hpp"
#include "conveyorcalc/migrate/migrate.hpp"

namespace conveyorcalc::formulas {
namespace {

using schema::TubeStressStatus;

struct EndStress {
  std::optional<double> stress_psi{};
  TubeStressStatus check{TubeStressStatus::Incomplete};
  std::optional<std::string> error_message{};
};

EndStress end_stress(std::optional<double> od, std::optional<double> wall, double hub_centers_in, double radial_lbf,
                     double limit_psi, bool estimated, bool enforce) {
  if (!od || !wall) {
    return EndStress{};
  }
  const auto r = tube_stress(TubeStressInput{.tube_od_in = *od,
                                             .tube_wall_in = *wall,
                                             .hub_centers_in = hub_centers_in,
                                             .radial_load_lbf = radial_lbf},
                             limit_psi, estimated, enforce);
  return EndStress{.stress_psi = r.stress_psi, .check = r.check, .error_message = r.error_message};
}

}  // namespace

schema::Output calculate(const schema::CanonicalInput& raw_in, const schema::Parameters& p) {
  const auto resolution = geometry::resolve_geometry(raw_in);
  const auto& in = resolution.normalized;
  const auto& g = resolution.derived;

  schema::Output out{};

  const double L = g.L_cc_in;
  const double d_drive = g.drive_pulley_dia_in;
  const double d_tail = g.tail_pulley_dia_in;
  const double width = in.belt_width_in.value_or(0.0);

  // power-user overrides win over parameters
  const double sf = in.safety_factor.value_or(p.safety_factor);
  const double starting_pull = in.starting_belt_pull_lb.value_or(p.starting_belt_pull_lb);
  const double mu = in.friction_coeff.value_or(p.friction_coeff);
  const double motor_rpm = in.motor_rpm.value_or(p.motor_rpm);
  out.safety_factor_used = sf;
  out.starting_belt_pull_lb_used = starting_pull;
  out.friction_coeff_used = mu;
  out.motor_rpm_used = motor_rpm;

  // belt and load
  const auto coeff = belt_coefficients(d_drive, p, in.belt_piw_override, in.belt_pil_override, in.belt_piw,
                                       in.belt_pil, in.belt_coeff_piw, in.belt_coeff_pil);
  out.piw_used = coeff.piw;
  out.pil_used = coeff.pil;
  out.belt_piw_effective = coeff.belt_piw_effective;
  out.belt_pil_effective = coeff.belt_pil_effective;
  out.total_belt_length_in = total_belt_length_in(L, d_drive, d_tail);
  out.belt_weight_lbf = belt_weight_lbf(coeff.piw, coeff.pil, width, out.total_belt_length_in);

  const double travel = travel_dimension_in(in.part_length_in.value_or(0.0), in.part_width_in.value_or(0.0),
                                            in.orientation.value_or(schema::Orientation::Lengthwise));
  out.pitch_in = pitch_in(travel, in.part_spacing_in.value_or(0.0));
  out.parts_on_belt = parts_on_belt(L, out.pitch_in);
  out.load_on_belt_lbf = load_on_belt_lbf(out.parts_on_belt, in.part_weight_lbs.value_or(0.0));
  out.total_load_lbf = total_load_lbf(out.belt_weight_lbf, out.load_on_belt_lbf);
  out.avg_load_per_ft_lbf = avg_load_per_ft_lbf(out.total_load_lbf, L);
  out.belt_pull_calc_lb = belt_pull_calc_lb(out.avg_load_per_ft_lbf, mu, L);

  // pulls
  out.friction_pull_lb = friction_pull_lb(mu, out.total_load_lbf);
  out.incline_pull_lb = incline_pull_lb(out.total_load_lbf, g.theta_deg);
  out.starting_belt_pull_lb = starting_pull;
  out.total_belt_pull_lb = total_belt_pull_lb(out.friction_pull_lb, out.incline_pull_lb, starting_pull);

  // speed and drive
  out.speed_mode_used = in.speed_mode.value_or(schema::SpeedMode::BeltSpeed);
  switch (out.speed_mode_used) {
    case schema::SpeedMode::BeltSpeed:
      out.belt_speed_fpm = in.belt_speed_fpm.value_or(0.0);
      out.drive_shaft_rpm = drive_shaft_rpm(out.belt_speed_fpm, d_drive);
      break;
    case schema::SpeedMode::DriveRpm:
      out.drive_shaft_rpm = in.drive_rpm_input.value_or(in.drive_rpm.value_or(0.0));
      out.belt_speed_fpm = belt_speed_fpm(out.drive_shaft_rpm, d_drive);
      break;
  }
  out.torque_drive_shaft_inlbf = torque_drive_shaft_inlbf(out.total_belt_pull_lb, d_drive, sf);
  out.gear_ratio = gear_ratio(motor_rpm, out.drive_shaft_rpm);
  out.chain_ratio = chain_ratio(in.gearmotor_mounting_style.value_or(schema::GearmotorMountingStyle::ShaftMounted),
                                in.gm_sprocket_teeth, in.drive_shaft_sprocket_teeth);
  out.gearmotor_output_rpm = out.drive_shaft_rpm * out.chain_ratio;
  out.total_drive_ratio = out.gear_ratio * out.chain_ratio;

  // throughput
  out.capacity_pph = capacity_pph(out.belt_speed_fpm, out.pitch_in);
  if (in.required_throughput_pph && *in.required_throughput_pph > 0.0) {
    const double required = *in.required_throughput_pph;
    const double target = target_pph(required, in.throughput_margin_pct.value_or(0.0));
    out.target_pph = target;
    out.meets_throughput = out.capacity_pph >= target;
    out.rpm_required_for_target = rpm_required_for_target(target, out.pitch_in, d_drive);
    out.throughput_margin_achieved_pct = margin_achieved_pct(out.capacity_pph, required);
  }

  // tracking, pulleys and shafts
  out.drive_pulley_diameter_in = d_drive;
  out.tail_pulley_diameter_in = d_tail;
  out.largest_pulley_diameter_in = std::max(d_drive, d_tail);
  out.is_v_guided = in.belt_tracking_method.value_or(schema::BeltTrackingMethod::Crowned) ==
                    schema::BeltTrackingMethod::VGuided;
  out.pulley_requires_crown = !out.is_v_guided;
  out.pulley_face_extra_in = pulley_face_extra_in(out.is_v_guided, p);
  out.pulley_face_length_in = pulley_face_length_in(width, out.pulley_face_extra_in);

  const auto tracking = recommend_tracking(TrackingInput{
      .conveyor_length_cc_in = L,
      .belt_width_in = width,
      .application_class = in.application_class,
      .belt_construction = in.belt_construction,
      .reversing_operation = in.reversing_operation.value_or(false),
      .disturbance_side_loading = in.disturbance_side_loading.value_or(false),
      .disturbance_load_variability = in.disturbance_load_variability.value_or(false),
      .disturbance_environment = in.disturbance_environment.value_or(false),
      .disturbance_installation_risk = in.disturbance_installation_risk.value_or(false),
      .preference = in.tracking_preference.value_or(schema::TrackingPreference::Auto)});
  out.tracking_lw_ratio = tracking.lw_ratio;
  out.tracking_lw_band = tracking.lw_band;
  out.tracking_disturbance_count = tracking.disturbance_count;
  out.tracking_disturbance_severity_raw = tracking.severity_raw;
  out.tracking_disturbance_severity_modified = tracking.severity_modified;
  out.tracking_mode_recommended = tracking.mode;
  out.tracking_recommendation_note = tracking.note;
  out.tracking_recommendation_rationale = tracking.rationale;

  const auto shaft_mode = in.shaft_diameter_mode.value_or(schema::ShaftDiameterMode::Calculated);
  out.drive_shaft_diameter_in = shaft_diameter_in(shaft_mode, in.drive_shaft_diameter_in, width);
  out.tail_shaft_diameter_in = shaft_diameter_in(shaft_mode, in.tail_shaft_diameter_in, width);

  // frame
  out.cleats_enabled = in.cleats_enabled.value_or(false);
  out.cleats_summary = migrate::cleats_summary(in);
  double cleat_height = 0.0;
  if (out.cleats_enabled) {
    cleat_height = in.cleat_height_in.value_or(
        in.cleat_size ? parse_cleat_size_in(*in.cleat_size).value_or(0.0) : 0.0);
  }
  const auto frame_mode = in.frame_height_mode.value_or(schema::FrameHeightMode::Standard);
  const auto frame = frame_height(frame_mode, d_drive, d_tail, cleat_height, p.return_roller_diameter_in,
                                  in.frame_clearance_in.value_or(p.frame_clearance_in), in.custom_frame_height_in);
  out.required_frame_height_in = frame.required_in;
  out.reference_frame_height_in = frame.reference_in;
  out.effective_frame_height_in = frame.effective_in;
  out.clearance_for_selected_standard_in = frame.clearance_in;
  out.frame_height_breakdown = frame.breakdown;
  out.requires_snub_rollers = requires_snub_rollers(frame.effective_in, d_drive, d_tail);
  out.cost_flag_low_profile = frame_mode == schema::FrameHeightMode::LowProfile;
  out.cost_flag_custom_frame = frame_mode == schema::FrameHeightMode::Custom;
  out.cost_flag_snub_rollers = out.requires_snub_rollers;
  out.cost_flag_design_review = frame.effective_in < kDesignReviewThresholdIn;
  out.frame_side_thickness_in =
      frame_side_thickness_in(in.frame_construction_type.value_or(schema::FrameConstructionType::SheetMetal),
                              in.frame_sheet_metal_gauge, in.frame_structural_channel_series);

  // return rollers
  out.gravity_roller_spacing_in = p.gravity_roller_spacing_in;
  out.gravity_roller_quantity = gravity_roller_quantity(L, out.requires_snub_rollers, p.gravity_roller_spacing_in);
  out.snub_roller_quantity = snub_roller_quantity(out.requires_snub_rollers);

  // tensions
  const auto tensions = pulley_tensions(out.total_belt_pull_lb, p);
  out.drive_T1_lbf = tensions.t1_lbf;
  out.drive_T2_lbf = tensions.t2_lbf;
  out.radial_load_lbf = tensions.radial_lbf;

  // PCI tube stress
  const bool v_groove = out.is_v_guided && in.v_guide_key.has_value();
  out.pci_tube_stress_limit_psi = tube_stress_limit_psi(v_groove);
  out.pci_hub_centers_estimated = !in.hub_centers_in.has_value();
  const double hub_centers = in.hub_centers_in.value_or(width);
  const auto drive_end = end_stress(in.drive_tube_od_in, in.drive_tube_wall_in, hub_centers, out.radial_load_lbf,
                                    out.pci_tube_stress_limit_psi, out.pci_hub_centers_estimated, p.enforce_pci_checks);
  const auto tail_end = end_stress(in.tail_tube_od_in, in.tail_tube_wall_in, hub_centers, out.radial_load_lbf,
                                   out.pci_tube_stress_limit_psi, out.pci_hub_centers_estimated, p.enforce_pci_checks);
  out.pci_drive_tube_stress_psi = drive_end.stress_psi;
  out.pci_tail_tube_stress_psi = tail_end.stress_psi;
  out.pci_drive_tube_stress_status = drive_end.check;
  out.pci_tail_tube_stress_status = tail_end.check;
  // Incomplete sorts lowest, so an end without tube data never masks the other.
  out.pci_tube_stress_status = std::max(drive_end.check, tail_end.check);
  out.pci_tube_stress_error_message = drive_end.error_message ? drive_end.error_message : tail_end.error_message;

  // belt minimum pulley
  const auto min_base = out.is_v_guided ? in.belt_min_pulley_dia_with_vguide_in : in.belt_min_pulley_dia_no_vguide_in;
  if (min_base) {
    out.min_pulley_base_in = min_base;
    out.min_pulley_drive_required_in = min_base;
    out.min_pulley_tail_required_in = min_base;
    out.drive_pulley_meets_minimum = d_drive >= *min_base;
    out.tail_pulley_meets_minimum = d_tail >= *min_base;
  }

  // geometry echo
  out.geometry_mode_used = g.mode;
  out.conveyor_length_cc_in = L;
  out.horizontal_run_in = g.H_cc_in;
  out.rise_in = g.rise_in;
  out.incline_deg = g.theta_deg;
  out.tail_centerline_in = g.tail_cl_in;
  out.drive_centerline_in = g.drive_cl_in;
  out.geometry_valid = g.is_valid;
  return out;
}

}  // namespace conveyorcalc::formulas
