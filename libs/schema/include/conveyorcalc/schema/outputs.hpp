/**
 * @file outputs.hpp
 * @brief Computed engineering quantities for one conveyor.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "conveyorcalc/core/types.hpp"
#include "conveyorcalc/schema/enums.hpp"

namespace conveyorcalc::schema {

/**
 * @brief PCI tube-stress check outcome, ordered from least to most severe.
 */
enum class TubeStressStatus : std::uint8_t { Incomplete, Pass, Estimated, Warn, Fail, Error };

const char* to_string(TubeStressStatus s);

/**
 * @brief Components of the frame height, kept for display and diagnostics.
 */
struct FrameHeightBreakdown {
  double largest_pulley_in{};
  double cleat_height_in{};
  double cleat_adder_in{};
  double return_roller_in{};
  double required_in{};
  double clearance_in{};
  double total_in{};
  std::string formula{};

  bool operator==(const FrameHeightBreakdown&) const = default;
};

/**
 * @brief Full output record. Optional members are only computed when their inputs exist.
 */
struct Output {
  // geometry echo
  GeometryMode geometry_mode_used{GeometryMode::LengthAngle};
  double conveyor_length_cc_in{};
  double horizontal_run_in{};
  double rise_in{};
  double incline_deg{};
  std::optional<double> tail_centerline_in{};
  std::optional<double> drive_centerline_in{};
  bool geometry_valid{true};

  // belt and load
  double piw_used{};
  double pil_used{};
  double belt_piw_effective{};
  double belt_pil_effective{};
  double total_belt_length_in{};
  double belt_weight_lbf{};
  double parts_on_belt{};
  double load_on_belt_lbf{};
  double total_load_lbf{};
  double avg_load_per_ft_lbf{};
  double belt_pull_calc_lb{};

  // pulls
  double friction_pull_lb{};
  double incline_pull_lb{};
  double starting_belt_pull_lb{};
  double total_belt_pull_lb{};

  // speed, drive and throughput
  SpeedMode speed_mode_used{SpeedMode::BeltSpeed};
  double belt_speed_fpm{};
  double drive_shaft_rpm{};
  double torque_drive_shaft_inlbf{};
  double gear_ratio{};
  double chain_ratio{1.0};
  double gearmotor_output_rpm{};
  double total_drive_ratio{};
  double pitch_in{};
  double capacity_pph{};
  std::optional<double> target_pph{};
  std::optional<bool> meets_throughput{};
  std::optional<double> rpm_required_for_target{};
  std::optional<double> throughput_margin_achieved_pct{};

  double safety_factor_used{};
  double starting_belt_pull_lb_used{};
  double friction_coeff_used{};
  double motor_rpm_used{};

  // pulleys, tracking and shafts
  double drive_pulley_diameter_in{};
  double tail_pulley_diameter_in{};
  double largest_pulley_diameter_in{};
  bool is_v_guided{};
  bool pulley_requires_crown{};
  double pulley_face_extra_in{};
  double pulley_face_length_in{};
  double drive_shaft_diameter_in{};
  double tail_shaft_diameter_in{};
  std::optional<double> min_pulley_base_in{};
  std::optional<double> min_pulley_drive_required_in{};
  std::optional<double> min_pulley_tail_required_in{};
  std::optional<bool> drive_pulley_meets_minimum{};
  std::optional<bool> tail_pulley_meets_minimum{};

  // tracking recommendation
  double tracking_lw_ratio{};  ///< length / width to 0.1; infinite without a width
  LwBand tracking_lw_band{LwBand::Low};
  int tracking_disturbance_count{};
  DisturbanceSeverity tracking_disturbance_severity_raw{DisturbanceSeverity::Minimal};
  DisturbanceSeverity tracking_disturbance_severity_modified{DisturbanceSeverity::Minimal};
  TrackingMode tracking_mode_recommended{TrackingMode::Crowned};
  std::optional<std::string> tracking_recommendation_note{};
  std::string tracking_recommendation_rationale{};

  // belt tensions
  double drive_T1_lbf{};
  double drive_T2_lbf{};
  double radial_load_lbf{};

  // frame
  bool cleats_enabled{};
  std::optional<std::string> cleats_summary{};
  double required_frame_height_in{};
  double reference_frame_height_in{};
  double effective_frame_height_in{};
  double clearance_for_selected_standard_in{};
  FrameHeightBreakdown frame_height_breakdown{};
  bool requires_snub_rollers{};
  bool cost_flag_low_profile{};
  bool cost_flag_custom_frame{};
  bool cost_flag_snub_rollers{};
  bool cost_flag_design_review{};
  std::optional<double> frame_side_thickness_in{};

  // return rollers
  int gravity_roller_quantity{};
  double gravity_roller_spacing_in{};
  int snub_roller_quantity{};

  // PCI tube stress
  std::optional<double> pci_drive_tube_stress_psi{};
  std::optional<double> pci_tail_tube_stress_psi{};
  double pci_tube_stress_limit_psi{};
  bool pci_hub_centers_estimated{};
  TubeStressStatus pci_drive_tube_stress_status{TubeStressStatus::Incomplete};
  TubeStressStatus pci_tail_tube_stress_status{TubeStressStatus::Incomplete};
  TubeStressStatus pci_tube_stress_status{TubeStressStatus::Incomplete};
  std::optional<std::string> pci_tube_stress_error_message{};

  bool operator==(const Output&) const = default;
};

/**
 * @brief Flatten every present output into name -> value.
 *
 * Breakdown members are prefixed with `frame_height_breakdown.`; enumerated
 * values use their canonical spelling.
 */
core::FieldMap to_fields(const Output& out);

}  // namespace conveyorcalc::schema
