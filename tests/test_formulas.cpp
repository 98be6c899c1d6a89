/**
 * @file test_formulas.cpp
 * @brief Formula pipeline tests.
 * @author Watosn
 */

#include <cmath>
#include <numbers>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "conveyorcalc/formulas/calculate.hpp"
#include "conveyorcalc/formulas/formulas.hpp"
#include "conveyorcalc/formulas/frame.hpp"
#include "conveyorcalc/formulas/tracking.hpp"
#include "conveyorcalc/migrate/migrate.hpp"

namespace {

bool approx(double a, double b, double rel) {
  const double d = std::abs(a - b);
  const double n = std::max(std::abs(b), 1e-30);
  return d / n <= rel;
}

conveyorcalc::core::RawInput base_inputs() {
  using conveyorcalc::core::FieldMap;
  return conveyorcalc::core::RawInput(FieldMap{
      {"conveyor_length_cc_in", 120.0},
      {"conveyor_incline_deg", 0.0},
      {"belt_width_in", 18.0},
      {"drive_pulley_diameter_in", 4.0},
      {"tail_pulley_diameter_in", 4.0},
      {"part_weight_lbs", 10.0},
      {"part_length_in", 12.0},
      {"part_width_in", 6.0},
      {"part_spacing_in", 12.0},
      {"orientation", std::string("Lengthwise")},
  });
}

}  // namespace

int main() {
  using namespace conveyorcalc;
  const schema::Parameters p{};

  if (!approx(formulas::total_belt_length_in(100.0, 2.5, 2.5), 207.854, 1e-5)) {
    spdlog::error("belt length mismatch");
    return 1;
  }
  if (formulas::parts_on_belt(120.0, formulas::pitch_in(12.0, 12.0)) != 5.0 ||
      formulas::parts_on_belt(120.0, 0.0) != 0.0) {
    spdlog::error("parts on belt mismatch");
    return 2;
  }
  if (formulas::travel_dimension_in(12.0, 6.0, schema::Orientation::Crosswise) != 6.0) {
    spdlog::error("crosswise travel mismatch");
    return 3;
  }

  const auto small = formulas::belt_coefficients(2.5, p, std::nullopt, std::nullopt, std::nullopt, std::nullopt,
                                                  std::nullopt, std::nullopt);
  const auto overridden = formulas::belt_coefficients(4.0, p, 0.2, std::nullopt, 0.15, 0.16, 0.11, 0.12);
  if (small.piw != p.piw_2p5 || overridden.piw != 0.2 || overridden.pil != 0.16 ||
      overridden.belt_piw_effective != 0.2) {
    spdlog::error("belt coefficient override chain mismatch");
    return 4;
  }

  if (!approx(formulas::incline_pull_lb(100.0, 30.0), 50.0, 1e-12) ||
      formulas::friction_pull_lb(0.25, 100.0) != 25.0 ||
      formulas::total_belt_pull_lb(25.0, 50.0, 75.0) != 150.0) {
    spdlog::error("pull formulas mismatch");
    return 5;
  }

  if (formulas::chain_ratio(schema::GearmotorMountingStyle::BottomMount, std::nullopt, std::nullopt) != 24.0 / 18.0 ||
      formulas::chain_ratio(schema::GearmotorMountingStyle::BottomMount, 0.0, 24.0) != 1.0 ||
      formulas::chain_ratio(schema::GearmotorMountingStyle::ShaftMounted, 10.0, 30.0) != 1.0) {
    spdlog::error("chain ratio mismatch");
    return 6;
  }

  if (formulas::shaft_diameter_in(schema::ShaftDiameterMode::Calculated, std::nullopt, 24.0) != 1.25 ||
      formulas::shaft_diameter_in(schema::ShaftDiameterMode::Manual, 1.75, 24.0) != 1.75) {
    spdlog::error("shaft diameter mismatch");
    return 7;
  }
  if (formulas::gravity_roller_quantity(120.0, false, 60.0) != 3 ||
      formulas::gravity_roller_quantity(120.0, true, 60.0) != 1 ||
      formulas::gravity_roller_quantity(24.0, false, 60.0) != 2 || formulas::snub_roller_quantity(true) != 2) {
    spdlog::error("return roller quantity mismatch");
    return 8;
  }

  // frame heights
  using schema::FrameHeightMode;
  const auto standard = formulas::frame_height(FrameHeightMode::Standard, 4.0, 4.0, 0.0, 2.0, 0.5, std::nullopt);
  if (standard.required_in != 6.0 || standard.reference_in != 6.5 || standard.effective_in != 6.5 ||
      formulas::requires_snub_rollers(standard.effective_in, 4.0, 4.0)) {
    spdlog::error("standard frame height mismatch");
    return 9;
  }
  const auto low = formulas::frame_height(FrameHeightMode::LowProfile, 4.0, 4.0, 0.0, 2.0, 0.5, std::nullopt);
  if (low.required_in != 4.0 || low.reference_in != 4.5 || !formulas::requires_snub_rollers(low.effective_in, 4.0, 4.0) ||
      low.breakdown.formula.find("snubs at ends") == std::string::npos) {
    spdlog::error("low profile frame height mismatch");
    return 10;
  }
  const auto cleated = formulas::frame_height(FrameHeightMode::Standard, 6.0, 4.0, 1.25, 1.9, 0.5, std::nullopt);
  if (!approx(cleated.required_in, 10.4, 1e-12) || cleated.breakdown.cleat_adder_in != 2.5 ||
      cleated.breakdown.largest_pulley_in != 6.0 || !approx(cleated.breakdown.total_in, 10.9, 1e-12)) {
    spdlog::error("cleated frame height mismatch");
    return 11;
  }
  const auto custom = formulas::frame_height(FrameHeightMode::Custom, 4.0, 4.0, 0.0, 2.0, 0.5, 5.0);
  if (custom.effective_in != 5.0 || custom.reference_in != 6.5) {
    spdlog::error("custom frame height mismatch");
    return 12;
  }
  if (formulas::requires_snub_rollers(6.5, 4.0, 4.0) || !formulas::requires_snub_rollers(5.5, 4.0, 4.0)) {
    spdlog::error("snub threshold mismatch");
    return 13;
  }
  if (formulas::parse_cleat_size_in(" 1.5\" ") != 1.5 || formulas::parse_cleat_size_in("large").has_value()) {
    spdlog::error("cleat size parse mismatch");
    return 14;
  }
  if (formulas::frame_side_thickness_in(schema::FrameConstructionType::SheetMetal, std::string("12_GA"), std::nullopt) !=
          0.1046 ||
      formulas::frame_side_thickness_in(schema::FrameConstructionType::Special, std::nullopt, std::nullopt).has_value()) {
    spdlog::error("frame side thickness mismatch");
    return 15;
  }

  // full pipeline, belt speed vs drive rpm
  const double rpm = 100.0;
  const double fpm = rpm * std::numbers::pi * (4.0 / 12.0);
  const auto by_speed = formulas::calculate(migrate::normalize(base_inputs().with("belt_speed_fpm", fpm)), p);
  const auto by_rpm = formulas::calculate(
      migrate::normalize(base_inputs().with("speed_mode", std::string("drive_rpm")).with("drive_rpm_input", rpm)), p);
  if (!approx(by_speed.drive_shaft_rpm, rpm, 1e-9) || !approx(by_rpm.belt_speed_fpm, fpm, 1e-9) ||
      !approx(by_speed.gear_ratio, by_rpm.gear_ratio, 1e-9) || !approx(by_speed.gear_ratio, 17.5, 1e-9)) {
    spdlog::error("speed mode equivalence failed");
    return 16;
  }
  if (by_rpm.speed_mode_used != schema::SpeedMode::DriveRpm) {
    spdlog::error("speed mode echo mismatch");
    return 17;
  }

  const auto& out = by_speed;
  const double belt_len = 240.0 + std::numbers::pi * 4.0;
  const double belt_weight = p.piw_other * p.pil_other * 18.0 * belt_len;
  if (!approx(out.total_belt_length_in, belt_len, 1e-12) || !approx(out.belt_weight_lbf, belt_weight, 1e-12) ||
      out.parts_on_belt != 5.0 || !approx(out.total_load_lbf, belt_weight + 50.0, 1e-12) ||
      !approx(out.total_belt_pull_lb, 0.25 * (belt_weight + 50.0) + 75.0, 1e-12) || out.incline_pull_lb != 0.0) {
    spdlog::error("pipeline belt/load values mismatch");
    return 18;
  }
  if (!approx(out.torque_drive_shaft_inlbf, out.total_belt_pull_lb * 2.0 * 2.0, 1e-12) ||
      !approx(out.capacity_pph, fpm * 720.0 / 24.0, 1e-12) || out.target_pph.has_value()) {
    spdlog::error("pipeline drive/throughput values mismatch");
    return 19;
  }
  if (out.pulley_face_length_in != 20.0 || !out.pulley_requires_crown || out.gravity_roller_quantity != 3 ||
      out.reference_frame_height_in != 6.5 || out.requires_snub_rollers || out.chain_ratio != 1.0 ||
      out.safety_factor_used != p.safety_factor || out.pci_tube_stress_status != schema::TubeStressStatus::Incomplete) {
    spdlog::error("pipeline pulley/frame values mismatch");
    return 20;
  }

  const auto throughput = formulas::calculate(
      migrate::normalize(base_inputs()
                             .with("belt_speed_fpm", 60.0)
                             .with("required_throughput_pph", 1500.0)
                             .with("throughput_margin_pct", 10.0)),
      p);
  if (!throughput.target_pph || !approx(*throughput.target_pph, 1650.0, 1e-12) || !throughput.meets_throughput ||
      *throughput.meets_throughput != true || !approx(*throughput.throughput_margin_achieved_pct, 20.0, 1e-12)) {
    spdlog::error("throughput outputs mismatch");
    return 21;
  }

  const auto inclined = formulas::calculate(
      migrate::normalize(base_inputs().with("belt_speed_fpm", 60.0).with("conveyor_incline_deg", 30.0)), p);
  if (!approx(inclined.incline_pull_lb, inclined.total_load_lbf * 0.5, 1e-12) ||
      !approx(inclined.friction_pull_lb, inclined.total_load_lbf * 0.25, 1e-12) ||
      !approx(inclined.rise_in, 60.0, 1e-12)) {
    spdlog::error("incline pull mismatch");
    return 22;
  }

  const auto overrides = formulas::calculate(
      migrate::normalize(base_inputs().with("belt_speed_fpm", 60.0).with("safety_factor", 3.0).with("motor_rpm", 1200.0)),
      p);
  if (overrides.safety_factor_used != 3.0 || overrides.motor_rpm_used != 1200.0) {
    spdlog::error("power-user overrides not applied");
    return 23;
  }

  const auto bottom = formulas::calculate(
      migrate::normalize(base_inputs()
                             .with("belt_speed_fpm", 60.0)
                             .with("gearmotor_mounting_style", std::string("bottom_mount"))
                             .with("gm_sprocket_teeth", 18.0)
                             .with("drive_shaft_sprocket_teeth", 36.0)),
      p);
  if (bottom.chain_ratio != 2.0 || !approx(bottom.total_drive_ratio, bottom.gear_ratio * 2.0, 1e-12) ||
      !approx(bottom.gearmotor_output_rpm, bottom.drive_shaft_rpm * 2.0, 1e-12)) {
    spdlog::error("bottom mount chain stage mismatch");
    return 24;
  }

  const auto minimum = formulas::calculate(
      migrate::normalize(base_inputs().with("belt_speed_fpm", 60.0).with("belt_min_pulley_dia_no_vguide_in", 5.0)), p);
  if (minimum.drive_pulley_meets_minimum != false || minimum.min_pulley_base_in != 5.0) {
    spdlog::error("belt minimum pulley check mismatch");
    return 25;
  }

  // tracking recommendation
  using schema::DisturbanceSeverity;
  using schema::LwBand;
  using schema::TrackingMode;
  if (formulas::lw_ratio(100.0, 20.0) != 5.0 || formulas::lw_ratio(100.0, 15.0) != 6.7 ||
      formulas::lw_ratio(100.0, 33.0) != 3.0 || !std::isinf(formulas::lw_ratio(100.0, 0.0))) {
    spdlog::error("L/W ratio mismatch");
    return 26;
  }
  if (formulas::lw_band(5.0) != LwBand::Low || formulas::lw_band(5.1) != LwBand::Medium ||
      formulas::lw_band(10.0) != LwBand::Medium || formulas::lw_band(10.1) != LwBand::High ||
      formulas::lw_band(formulas::lw_ratio(100.0, 0.0)) != LwBand::High) {
    spdlog::error("L/W band edges mismatch");
    return 27;
  }

  const formulas::TrackingInput calm{};
  formulas::TrackingInput one = calm;
  one.disturbance_environment = true;
  formulas::TrackingInput two = one;
  two.disturbance_load_variability = true;
  formulas::TrackingInput reversing_side{};
  reversing_side.reversing_operation = true;
  reversing_side.disturbance_side_loading = true;
  formulas::TrackingInput three = two;
  three.disturbance_installation_risk = true;
  if (formulas::raw_severity(calm) != DisturbanceSeverity::Minimal ||
      formulas::raw_severity(one) != DisturbanceSeverity::Moderate ||
      formulas::raw_severity(two) != DisturbanceSeverity::Moderate ||
      formulas::count_disturbances(reversing_side) != 2 ||
      formulas::raw_severity(reversing_side) != DisturbanceSeverity::Significant ||
      formulas::raw_severity(three) != DisturbanceSeverity::Significant) {
    spdlog::error("disturbance severity mismatch");
    return 28;
  }
  if (formulas::apply_severity_modifiers(DisturbanceSeverity::Minimal, schema::ApplicationClass::BulkHandling,
                                         schema::BeltConstruction::SteelCordOrVeryStiff) !=
          DisturbanceSeverity::Significant ||
      formulas::apply_severity_modifiers(DisturbanceSeverity::Minimal, schema::ApplicationClass::UnitHandling,
                                         schema::BeltConstruction::ProfiledSidewallOrHighCleat) !=
          DisturbanceSeverity::Moderate ||
      formulas::apply_severity_modifiers(DisturbanceSeverity::Significant, schema::ApplicationClass::BulkHandling,
                                         std::nullopt) != DisturbanceSeverity::Significant ||
      formulas::apply_severity_modifiers(DisturbanceSeverity::Moderate, std::nullopt,
                                         schema::BeltConstruction::FabricPly) != DisturbanceSeverity::Moderate) {
    spdlog::error("severity modifiers mismatch");
    return 29;
  }
  const auto cell = [](LwBand b, DisturbanceSeverity s) { return formulas::recommended_mode(b, s); };
  if (cell(LwBand::Low, DisturbanceSeverity::Minimal).mode != TrackingMode::Crowned ||
      cell(LwBand::Low, DisturbanceSeverity::Minimal).with_note ||
      !cell(LwBand::Low, DisturbanceSeverity::Moderate).with_note ||
      cell(LwBand::Low, DisturbanceSeverity::Significant).mode != TrackingMode::Hybrid ||
      cell(LwBand::Medium, DisturbanceSeverity::Minimal).mode != TrackingMode::Crowned ||
      !cell(LwBand::Medium, DisturbanceSeverity::Minimal).with_note ||
      cell(LwBand::Medium, DisturbanceSeverity::Moderate).mode != TrackingMode::Hybrid ||
      cell(LwBand::Medium, DisturbanceSeverity::Significant).mode != TrackingMode::VGuided ||
      cell(LwBand::High, DisturbanceSeverity::Minimal).mode != TrackingMode::Hybrid ||
      cell(LwBand::High, DisturbanceSeverity::Moderate).mode != TrackingMode::VGuided) {
    spdlog::error("tracking decision matrix mismatch");
    return 30;
  }

  // 120 x 18 is 6.7:1, the medium band.
  const auto tracked = [&](const core::RawInput& raw) { return formulas::calculate(migrate::normalize(raw), p); };
  const auto medium_calm = tracked(base_inputs().with("belt_speed_fpm", 60.0));
  if (medium_calm.tracking_lw_ratio != 6.7 || medium_calm.tracking_lw_band != LwBand::Medium ||
      medium_calm.tracking_mode_recommended != TrackingMode::Crowned || !medium_calm.tracking_recommendation_note ||
      medium_calm.tracking_recommendation_note->find("Consider Hybrid") == std::string::npos) {
    spdlog::error("medium band calm conveyor should be crowned with a note");
    return 31;
  }
  const auto low_calm = tracked(base_inputs().with("belt_speed_fpm", 60.0).with("belt_width_in", 24.0));
  if (low_calm.tracking_lw_band != LwBand::Low || low_calm.tracking_mode_recommended != TrackingMode::Crowned ||
      low_calm.tracking_recommendation_note.has_value() ||
      low_calm.tracking_recommendation_rationale !=
          "Crowned pulleys are appropriate. L/W ratio is favorable and disturbance factors are minimal.") {
    spdlog::error("low band calm conveyor recommendation mismatch");
    return 32;
  }
  const auto disturbed = tracked(base_inputs().with("belt_speed_fpm", 60.0).with("disturbance_environment", true));
  const auto reversing = tracked(
      base_inputs().with("belt_speed_fpm", 60.0).with("reversing_operation", true).with("disturbance_side_loading", true));
  const auto bulk = tracked(base_inputs()
                                .with("belt_speed_fpm", 60.0)
                                .with("disturbance_environment", true)
                                .with("application_class", std::string("bulk_handling")));
  if (disturbed.tracking_mode_recommended != TrackingMode::Hybrid || disturbed.tracking_disturbance_count != 1 ||
      disturbed.tracking_recommendation_rationale.find("moderate L/W ratio") == std::string::npos ||
      reversing.tracking_mode_recommended != TrackingMode::VGuided ||
      reversing.tracking_disturbance_severity_raw != DisturbanceSeverity::Significant ||
      bulk.tracking_disturbance_severity_raw != DisturbanceSeverity::Moderate ||
      bulk.tracking_disturbance_severity_modified != DisturbanceSeverity::Significant ||
      bulk.tracking_mode_recommended != TrackingMode::VGuided) {
    spdlog::error("severity-driven tracking mode mismatch");
    return 33;
  }
  const auto weaker = tracked(base_inputs()
                                  .with("belt_speed_fpm", 60.0)
                                  .with("disturbance_environment", true)
                                  .with("tracking_preference", std::string("prefer_crowned")));
  const auto stronger = tracked(base_inputs()
                                    .with("belt_speed_fpm", 60.0)
                                    .with("disturbance_environment", true)
                                    .with("tracking_preference", std::string("prefer_v_guided")));
  if (weaker.tracking_mode_recommended != TrackingMode::Crowned || !weaker.tracking_recommendation_note ||
      weaker.tracking_recommendation_note->find("less tracking control") == std::string::npos ||
      weaker.tracking_recommendation_rationale.rfind("User preference applied.", 0) != 0U ||
      stronger.tracking_mode_recommended != TrackingMode::VGuided ||
      stronger.tracking_recommendation_note.has_value()) {
    spdlog::error("tracking preference override mismatch");
    return 34;
  }

  const auto cleated_out = tracked(base_inputs()
                                   .with("belt_speed_fpm", 60.0)
                                   .with("cleats_enabled", true)
                                   .with("cleat_height_in", 1.0)
                                   .with("cleat_spacing_in", 12.0)
                                   .with("cleat_edge_offset_in", 0.5));
  if (cleated_out.cleats_summary != "Cleats: 1\" high @ 12\" c/c, 0.5\" from belt edge" ||
      by_speed.cleats_summary.has_value()) {
    spdlog::error("cleats summary output mismatch");
    return 35;
  }
  return 0;
}
