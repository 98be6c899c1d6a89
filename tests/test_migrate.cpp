/**
 * @file test_migrate.cpp
 * @brief Schema migration step and idempotence tests.
 * @author Watosn
 */

#include <cmath>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "conveyorcalc/migrate/migrate.hpp"

namespace {

using conveyorcalc::core::FieldMap;
using conveyorcalc::core::RawInput;

RawInput legacy_record() {
  return RawInput(FieldMap{
      {"conveyor_length_cc_in", 120.0},
      {"conveyor_incline_deg", 8.0},
      {"conveyor_width_in", 18.0},
      {"pulley_diameter_in", 4.0},
      {"belt_speed_fpm", 65.0},
      {"support_option", std::string("Floor Mounted")},
      {"height_input_mode", std::string("TOB")},
      {"tail_tob_in", 30.0},
      {"leg_model_key", std::string("LEG-24")},
      {"cleats_mode", std::string("cleated")},
      {"cleat_height_in", 1.0},
      {"cleat_spacing_in", 12.0},
      {"cleat_edge_offset_in", 1.5},
      {"part_weight_lbs", 5.0},
      {"part_length_in", 12.0},
      {"part_width_in", 6.0},
  });
}

}  // namespace

int main() {
  using namespace conveyorcalc;

  // pulley diameters
  const auto both = migrate::unify_pulley_diameters(RawInput(FieldMap{{"pulley_diameter_in", 6.0}}));
  if (both.get_number("drive_pulley_diameter_in") != 6.0 || both.get_number("tail_pulley_diameter_in") != 6.0 ||
      both.get_bool("pulley_diameters_linked") != true) {
    spdlog::error("legacy diameter not applied to both ends");
    return 1;
  }
  const auto defaulted = migrate::unify_pulley_diameters(RawInput{});
  if (defaulted.get_number("drive_pulley_diameter_in") != migrate::kDefaultPulleyDiameterIn) {
    spdlog::error("default pulley diameter mismatch");
    return 2;
  }
  const auto tail_only = migrate::unify_pulley_diameters(RawInput(FieldMap{{"tail_pulley_diameter_in", 5.0}}));
  if (tail_only.get_number("drive_pulley_diameter_in") != 5.0 || tail_only.get_number("pulley_diameter_in") != 5.0) {
    spdlog::error("tail-only diameter not copied to drive");
    return 3;
  }
  const auto unlinked = migrate::unify_pulley_diameters(
      RawInput(FieldMap{{"drive_pulley_diameter_in", 6.0}, {"tail_matches_drive", false}}));
  if (unlinked.contains("tail_pulley_diameter_in") || unlinked.contains("tail_matches_drive") ||
      unlinked.get_bool("pulley_diameters_linked") != false) {
    spdlog::error("tail_matches_drive=false should leave tail unset");
    return 4;
  }
  if (migrate::unify_pulley_diameters(unlinked) != unlinked) {
    spdlog::error("pulley step not idempotent");
    return 5;
  }

  // cleats
  const auto disabled = migrate::default_cleats(
      RawInput(FieldMap{{"cleats_enabled", false}, {"cleat_height_in", 2.0}, {"cleat_pattern", std::string("X")}}));
  if (disabled.contains("cleat_height_in") || disabled.contains("cleat_pattern") ||
      disabled.get_string("cleats_mode") != "none") {
    spdlog::error("disabled cleats must strip sub-fields");
    return 6;
  }
  const auto enabled = migrate::default_cleats(RawInput(FieldMap{{"cleats_mode", std::string("cleated")}}));
  if (enabled.get_bool("cleats_enabled") != true ||
      enabled.get_number("cleat_centers_in") != migrate::kDefaultCleatCentersIn ||
      enabled.get_string("cleat_style") != "SOLID") {
    spdlog::error("enabled cleat defaults mismatch");
    return 7;
  }

  // support
  const auto casters = migrate::migrate_support(RawInput(FieldMap{{"support_method", std::string("casters")}}));
  if (casters.get_string("support_method") != "floor_supported" ||
      casters.get_string("tail_support_type") != "Casters" || casters.get_bool("include_casters") != true ||
      casters.get_bool("include_legs") != false) {
    spdlog::error("legacy caster support not migrated");
    return 8;
  }
  const auto suspended = migrate::migrate_support(RawInput(FieldMap{{"support_option", std::string("Suspended")}}));
  if (suspended.get_string("support_method") != "external" || suspended.contains("support_option")) {
    spdlog::error("suspended support should be external");
    return 9;
  }

  // stripping
  const auto external = migrate::strip_inapplicable_fields(RawInput(FieldMap{{"support_method", std::string("external")},
                                                                             {"tail_tob_in", 30.0},
                                                                             {"reference_end", std::string("tail")},
                                                                             {"leg_model_key", std::string("L")}}));
  if (external.contains("tail_tob_in") || external.contains("reference_end") || external.contains("leg_model_key")) {
    spdlog::error("inapplicable support fields not stripped");
    return 10;
  }
  const auto htob = migrate::strip_inapplicable_fields(RawInput(FieldMap{{"support_method", std::string("external")},
                                                                         {"geometry_mode", std::string("H_TOB")},
                                                                         {"tail_tob_in", 30.0},
                                                                         {"drive_tob_in", 36.0}}));
  if (!htob.contains("tail_tob_in") || !htob.contains("drive_tob_in")) {
    spdlog::error("H_TOB geometry must keep TOB fields");
    return 11;
  }
  // Externally supported H_TOB conveyors keep their TOBs end to end; leg fields still go.
  const auto htob_canonical = migrate::normalize(RawInput(FieldMap{{"support_method", std::string("external")},
                                                                   {"geometry_mode", std::string("H_TOB")},
                                                                   {"horizontal_run_in", 96.0},
                                                                   {"tail_tob_in", 30.0},
                                                                   {"drive_tob_in", 36.0},
                                                                   {"reference_end", std::string("tail")},
                                                                   {"leg_model_key", std::string("L")}}));
  if (htob_canonical.tail_tob_in != 30.0 || htob_canonical.drive_tob_in != 36.0 ||
      htob_canonical.reference_end != schema::EndSide::Tail || htob_canonical.leg_model_key.has_value()) {
    spdlog::error("normalized external H_TOB input lost its TOB fields or kept leg fields");
    return 23;
  }

  // speed mode
  const auto rpm = migrate::migrate_speed_mode(RawInput(FieldMap{{"drive_rpm", 90.0}}));
  if (rpm.get_string("speed_mode") != "drive_rpm" || rpm.get_number("drive_rpm_input") != 90.0) {
    spdlog::error("drive rpm speed mode not inferred");
    return 12;
  }
  if (migrate::migrate_speed_mode(RawInput{}).get_string("speed_mode") != "belt_speed") {
    spdlog::error("default speed mode mismatch");
    return 13;
  }

  // geometry and frame defaults
  const auto geo = migrate::default_geometry_mode(
      RawInput(FieldMap{{"conveyor_length_cc_in", 100.0}, {"conveyor_incline_deg", 60.0}}));
  if (geo.get_string("geometry_mode") != "L_ANGLE" || !geo.get_number("horizontal_run_in") ||
      std::abs(*geo.get_number("horizontal_run_in") - 50.0) > 1e-9) {
    spdlog::error("geometry defaults mismatch");
    return 14;
  }
  const auto channel = migrate::default_frame_construction(
      RawInput(FieldMap{{"frame_construction_type", std::string("structural_channel")},
                        {"frame_sheet_metal_gauge", std::string("12_GA")},
                        {"frame_height_mode", std::string("Standard")},
                        {"custom_frame_height_in", 8.0}}));
  if (channel.contains("frame_sheet_metal_gauge") || channel.get_string("frame_structural_channel_series") != "C4" ||
      channel.contains("custom_frame_height_in")) {
    spdlog::error("frame construction defaults mismatch");
    return 15;
  }

  // full pipeline
  const auto legacy = legacy_record();
  const auto once = migrate::migrate(legacy);
  if (once.contains("conveyor_width_in") || once.get_number("belt_width_in") != 18.0 ||
      once.get_string("material_form") != "PARTS" || once.contains("height_input_mode") ||
      once.get_string("support_method") != "floor_supported" || once.get_number("tail_tob_in") != 30.0 ||
      once.get_bool("cleats_enabled") != true) {
    spdlog::error("legacy record not migrated");
    return 16;
  }
  if (migrate::migrate(once) != once) {
    spdlog::error("migrate is not idempotent");
    return 17;
  }
  if (migrate::normalize(once) != migrate::normalize(legacy)) {
    spdlog::error("normalize(migrate(x)) != normalize(x)");
    return 18;
  }

  const std::vector<RawInput> samples = {
      RawInput{},
      RawInput(FieldMap{{"drive_pulley_diameter_in", 6.0}, {"tail_pulley_diameter_in", 4.0}}),
      RawInput(FieldMap{{"support_method", std::string("legs")}, {"drive_tob_in", 40.0}, {"drive_rpm", 80.0}}),
      RawInput(FieldMap{{"frame_construction_type", std::string("special")}, {"cleats_enabled", true}}),
      RawInput(FieldMap{{"geometry_mode", std::string("H_TOB")}, {"horizontal_run_in", 90.0}, {"tail_tob_in", 24.0}}),
  };
  for (std::size_t i = 0; i < samples.size(); ++i) {
    const auto m = migrate::migrate(samples[i]);
    if (migrate::migrate(m) != m || migrate::normalize(m) != migrate::normalize(samples[i])) {
      spdlog::error("idempotence failed for sample {}", i);
      return 19;
    }
  }

  // cleat summaries
  const auto summary = migrate::cleats_summary(migrate::normalize(legacy));
  if (summary != "Cleats: 1\" high @ 12\" c/c, 1.5\" from belt edge") {
    spdlog::error("cleat summary mismatch: {}", summary.value_or("<none>"));
    return 20;
  }
  auto catalog = migrate::normalize(RawInput(FieldMap{{"cleats_enabled", true},
                                                      {"cleat_profile", std::string("T-Cleat")},
                                                      {"cleat_size", std::string("1\"")},
                                                      {"cleat_pattern", std::string("STRAIGHT_CROSS")},
                                                      {"cleat_style", std::string("DRILL_SIPED_1IN")}}));
  if (migrate::cleats_summary(catalog) != "T-Cleat 1\" STRAIGHT_CROSS (D&S) @ 12\" c/c") {
    spdlog::error("catalog cleat summary mismatch");
    return 21;
  }
  if (migrate::cleats_summary(migrate::normalize(RawInput(FieldMap{{"cleats_enabled", true}}))) !=
          "Cleats: Configuration incomplete" ||
      migrate::cleats_summary(migrate::normalize(RawInput{})).has_value()) {
    spdlog::error("incomplete/disabled cleat summary mismatch");
    return 22;
  }
  return 0;
}
