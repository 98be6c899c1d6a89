/**
 * @file formulas.cpp
 * @brief Individual sliderbed conveyor formulas.
 * @author Watosn
 */

#include "conveyorcalc/formulas/formulas.hpp"

#include <algorithm>
#include <cmath>

#include "conveyorcalc/core/math_utils.hpp"

namespace conveyorcalc::formulas {
namespace {

using core::kPi;

double safe_div(double num, double den) { return (den == 0.0) ? 0.0 : num / den; }

}  // namespace

BeltCoefficients belt_coefficients(double drive_pulley_dia_in,
                                   const schema::Parameters& p,
                                   std::optional<double> piw_override,
                                   std::optional<double> pil_override,
                                   std::optional<double> piw_catalog,
                                   std::optional<double> pil_catalog,
                                   std::optional<double> piw_advanced,
                                   std::optional<double> pil_advanced) {
  const bool small_pulley = drive_pulley_dia_in == 2.5;
  const auto piw_belt = piw_override ? piw_override : piw_catalog;
  const auto pil_belt = pil_override ? pil_override : pil_catalog;
  const double piw = piw_belt.value_or(piw_advanced.value_or(small_pulley ? p.piw_2p5 : p.piw_other));
  const double pil = pil_belt.value_or(pil_advanced.value_or(small_pulley ? p.pil_2p5 : p.pil_other));
  return BeltCoefficients{.piw = piw,
                          .pil = pil,
                          .belt_piw_effective = piw_belt.value_or(piw),
                          .belt_pil_effective = pil_belt.value_or(pil)};
}

double total_belt_length_in(double length_cc_in, double drive_pulley_dia_in, double tail_pulley_dia_in) {
  return 2.0 * length_cc_in + kPi * (drive_pulley_dia_in + tail_pulley_dia_in) / 2.0;
}

double belt_weight_lbf(double piw, double pil, double belt_width_in, double total_belt_length_in) {
  return piw * pil * belt_width_in * total_belt_length_in;
}

double travel_dimension_in(double part_length_in, double part_width_in, schema::Orientation orientation) {
  switch (orientation) {
    case schema::Orientation::Lengthwise:
      return part_length_in;
    case schema::Orientation::Crosswise:
      return part_width_in;
  }
  return part_length_in;
}

double pitch_in(double travel_in, double part_spacing_in) { return travel_in + part_spacing_in; }

double parts_on_belt(double length_cc_in, double pitch_in) { return safe_div(length_cc_in, pitch_in); }

double load_on_belt_lbf(double parts_on_belt, double part_weight_lbs) { return parts_on_belt * part_weight_lbs; }

double total_load_lbf(double belt_weight_lbf, double load_on_belt_lbf) { return belt_weight_lbf + load_on_belt_lbf; }

double avg_load_per_ft_lbf(double total_load_lbf, double length_cc_in) {
  return safe_div(total_load_lbf, length_cc_in / 12.0);
}

double belt_pull_calc_lb(double avg_load_per_ft_lbf, double friction_coeff, double length_cc_in) {
  return avg_load_per_ft_lbf * friction_coeff * (length_cc_in / 12.0);
}

double friction_pull_lb(double friction_coeff, double total_load_lbf) { return friction_coeff * total_load_lbf; }

double incline_pull_lb(double total_load_lbf, double incline_deg) {
  return total_load_lbf * std::sin(core::deg_to_rad(incline_deg));
}

double total_belt_pull_lb(double friction_pull_lb, double incline_pull_lb, double starting_belt_pull_lb) {
  return friction_pull_lb + incline_pull_lb + starting_belt_pull_lb;
}

double drive_shaft_rpm(double belt_speed_fpm, double pulley_dia_in) {
  return safe_div(belt_speed_fpm, (pulley_dia_in / 12.0) * kPi);
}

double belt_speed_fpm(double drive_shaft_rpm, double pulley_dia_in) {
  return drive_shaft_rpm * kPi * (pulley_dia_in / 12.0);
}

double torque_drive_shaft_inlbf(double total_belt_pull_lb, double pulley_dia_in, double safety_factor) {
  return total_belt_pull_lb * (pulley_dia_in / 2.0) * safety_factor;
}

double gear_ratio(double motor_rpm, double drive_shaft_rpm) { return safe_div(motor_rpm, drive_shaft_rpm); }

double chain_ratio(schema::GearmotorMountingStyle style,
                   std::optional<double> gm_sprocket_teeth,
                   std::optional<double> drive_shaft_sprocket_teeth) {
  switch (style) {
    case schema::GearmotorMountingStyle::ShaftMounted:
      return 1.0;
    case schema::GearmotorMountingStyle::BottomMount: {
      const double gm = gm_sprocket_teeth.value_or(18.0);
      const double driven = drive_shaft_sprocket_teeth.value_or(24.0);
      return (gm > 0.0) ? driven / gm : 1.0;
    }
  }
  return 1.0;
}

double capacity_pph(double belt_speed_fpm, double pitch_in) { return safe_div(belt_speed_fpm * 12.0 * 60.0, pitch_in); }

double target_pph(double required_pph, double margin_pct) { return required_pph * (1.0 + margin_pct / 100.0); }

double rpm_required_for_target(double target_pph, double pitch_in, double pulley_dia_in) {
  return safe_div(target_pph * pitch_in, 12.0 * 60.0 * kPi * (pulley_dia_in / 12.0));
}

double margin_achieved_pct(double capacity_pph, double required_pph) {
  if (required_pph == 0.0) {
    return 0.0;
  }
  return (capacity_pph / required_pph - 1.0) * 100.0;
}

double pulley_face_extra_in(bool is_v_guided, const schema::Parameters& p) {
  return is_v_guided ? p.pulley_face_extra_v_guided_in : p.pulley_face_extra_crowned_in;
}

double pulley_face_length_in(double belt_width_in, double face_extra_in) { return belt_width_in + face_extra_in; }

double shaft_diameter_in(schema::ShaftDiameterMode mode, std::optional<double> manual_in, double belt_width_in) {
  switch (mode) {
    case schema::ShaftDiameterMode::Manual:
      return manual_in.value_or(1.0);
    case schema::ShaftDiameterMode::Calculated:
      break;
  }
  if (belt_width_in <= 18.0) {
    return 1.0;
  }
  if (belt_width_in <= 36.0) {
    return 1.25;
  }
  return 1.5;
}

int gravity_roller_quantity(double length_cc_in, bool requires_snub_rollers, double spacing_in) {
  if (length_cc_in <= 0.0 || spacing_in <= 0.0) {
    return 0;
  }
  const int positions = static_cast<int>(std::floor(length_cc_in / spacing_in)) + 1;
  if (requires_snub_rollers) {
    return std::max(positions - 2, 0);
  }
  return std::max(positions, 2);
}

int snub_roller_quantity(bool requires_snub_rollers) { return requires_snub_rollers ? 2 : 0; }

}  // namespace conveyorcalc::formulas
