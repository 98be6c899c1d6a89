/**
 * @file formulas.hpp
 * @brief Individual sliderbed conveyor formulas.
 * @author Watosn
 *
 * Lengths are inches, forces pounds, speeds feet per minute. Every function is
 * pure; divisions by zero return 0.
 */
#pragma once

#include <optional>

#include "conveyorcalc/schema/enums.hpp"
#include "conveyorcalc/schema/parameters.hpp"

namespace conveyorcalc::formulas {

/**
 * @brief Belt weight coefficients after applying the override chain.
 */
struct BeltCoefficients {
  double piw{};
  double pil{};
  double belt_piw_effective{};
  double belt_pil_effective{};
};

/**
 * @brief Resolve PIW/PIL: user override, then catalog value, then advanced input, then defaults.
 *
 * Defaults depend on the drive pulley: exactly 2.5" uses the `*_2p5` parameters.
 */
BeltCoefficients belt_coefficients(double drive_pulley_dia_in,
                                   const schema::Parameters& p,
                                   std::optional<double> piw_override,
                                   std::optional<double> pil_override,
                                   std::optional<double> piw_catalog,
                                   std::optional<double> pil_catalog,
                                   std::optional<double> piw_advanced,
                                   std::optional<double> pil_advanced);

/// 2L + pi (d_drive + d_tail) / 2.
double total_belt_length_in(double length_cc_in, double drive_pulley_dia_in, double tail_pulley_dia_in);
double belt_weight_lbf(double piw, double pil, double belt_width_in, double total_belt_length_in);

/// Part dimension along the direction of travel.
double travel_dimension_in(double part_length_in, double part_width_in, schema::Orientation orientation);
double pitch_in(double travel_in, double part_spacing_in);
double parts_on_belt(double length_cc_in, double pitch_in);
double load_on_belt_lbf(double parts_on_belt, double part_weight_lbs);
double total_load_lbf(double belt_weight_lbf, double load_on_belt_lbf);
double avg_load_per_ft_lbf(double total_load_lbf, double length_cc_in);
/// Retained for compatibility with older reports.
double belt_pull_calc_lb(double avg_load_per_ft_lbf, double friction_coeff, double length_cc_in);

/// Friction acts on the full load regardless of incline.
double friction_pull_lb(double friction_coeff, double total_load_lbf);
double incline_pull_lb(double total_load_lbf, double incline_deg);
double total_belt_pull_lb(double friction_pull_lb, double incline_pull_lb, double starting_belt_pull_lb);

double drive_shaft_rpm(double belt_speed_fpm, double pulley_dia_in);
double belt_speed_fpm(double drive_shaft_rpm, double pulley_dia_in);
double torque_drive_shaft_inlbf(double total_belt_pull_lb, double pulley_dia_in, double safety_factor);
double gear_ratio(double motor_rpm, double drive_shaft_rpm);

/**
 * @brief Sprocket chain reduction between gearmotor and drive shaft.
 *
 * Bottom-mount drives use driven / driver teeth (24 / 18 by default); a
 * non-positive gearmotor tooth count or a shaft-mounted drive gives 1.
 */
double chain_ratio(schema::GearmotorMountingStyle style,
                   std::optional<double> gm_sprocket_teeth,
                   std::optional<double> drive_shaft_sprocket_teeth);

double capacity_pph(double belt_speed_fpm, double pitch_in);
double target_pph(double required_pph, double margin_pct);
double rpm_required_for_target(double target_pph, double pitch_in, double pulley_dia_in);
double margin_achieved_pct(double capacity_pph, double required_pph);

double pulley_face_extra_in(bool is_v_guided, const schema::Parameters& p);
double pulley_face_length_in(double belt_width_in, double face_extra_in);

/**
 * @brief Placeholder shaft sizing banded on belt width (<= 18: 1.0, <= 36: 1.25, else 1.5).
 *
 * Manual mode returns the supplied diameter or 1.0.
 */
double shaft_diameter_in(schema::ShaftDiameterMode mode, std::optional<double> manual_in, double belt_width_in);

/// Return-roller count; snub rollers replace the two end positions.
int gravity_roller_quantity(double length_cc_in, bool requires_snub_rollers, double spacing_in);
int snub_roller_quantity(bool requires_snub_rollers);

}  // namespace conveyorcalc::formulas
