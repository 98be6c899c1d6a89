/**
 * @file migrate.cpp
 * @brief Schema migration steps.
 * @author Watosn
 */

#include "conveyorcalc/migrate/migrate.hpp"

#include <array>
#include <string_view>
#include <utility>

#include "conveyorcalc/geometry/geometry.hpp"
#include "conveyorcalc/schema/enums.hpp"

namespace conveyorcalc::migrate {
namespace {

using core::FieldValue;
using core::RawInput;
using schema::EndSupportType;

constexpr std::array<std::string_view, 9> kCleatSubFields = {
    "cleat_height_in", "cleat_spacing_in", "cleat_edge_offset_in", "cleat_size", "cleat_profile",
    "cleat_style", "cleat_centers_in", "cleat_pattern", "cleat_material_family"};

constexpr std::array<std::string_view, 5> kLegCasterSubFields = {
    "leg_model_key", "caster_rigid_qty", "caster_rigid_model_key", "caster_swivel_qty", "caster_swivel_model_key"};

template <typename E>
std::optional<E> enum_field(const RawInput& in, std::string_view key) {
  const auto text = in.get_string(key);
  if (!text) {
    return std::nullopt;
  }
  return schema::parse_enum<E>(*text);
}

template <typename E>
std::string enum_text(E value) {
  return std::string(schema::to_string(value));
}

bool positive(const RawInput& in, std::string_view key) {
  const auto v = in.get_number(key);
  return v && *v > 0.0;
}

void set_default(RawInput& r, std::string_view key, FieldValue value) {
  if (!r.contains(key)) {
    r.set(std::string(key), std::move(value));
  }
}

struct EndPair {
  EndSupportType tail;
  EndSupportType drive;
};

EndPair support_option_ends(std::string_view option) {
  if (option == "Floor Mounted") {
    return {EndSupportType::Legs, EndSupportType::Legs};
  }
  if (option == "Casters") {
    return {EndSupportType::Casters, EndSupportType::Casters};
  }
  // "Suspended", "Integrated Frame" and anything unknown
  return {EndSupportType::External, EndSupportType::External};
}

bool is_floor(EndSupportType t) { return t == EndSupportType::Legs || t == EndSupportType::Casters; }

}  // namespace

RawInput rename_legacy_fields(const RawInput& in) {
  RawInput r = in;
  if (const auto* width = in.find("conveyor_width_in"); width != nullptr) {
    set_default(r, "belt_width_in", *width);
    r.erase("conveyor_width_in");
  }
  set_default(r, "material_form", enum_text(schema::MaterialForm::Parts));
  return r;
}

RawInput unify_pulley_diameters(const RawInput& in) {
  RawInput r = in;
  const bool has_drive = positive(in, "drive_pulley_diameter_in");
  const bool has_tail = positive(in, "tail_pulley_diameter_in");
  const bool tail_matches_drive =
      in.get_bool("tail_matches_drive").value_or(in.get_bool("pulley_diameters_linked").value_or(true));

  if (!has_drive && !has_tail) {
    const auto legacy = in.get_number("pulley_diameter_in");
    const double d = (legacy && *legacy > 0.0) ? *legacy : kDefaultPulleyDiameterIn;
    r.set("drive_pulley_diameter_in", d);
    r.set("tail_pulley_diameter_in", d);
    set_default(r, "pulley_diameters_linked", true);
  } else if (has_tail && !has_drive) {
    r.set("drive_pulley_diameter_in", *in.get_number("tail_pulley_diameter_in"));
    set_default(r, "pulley_diameters_linked", true);
  } else if (has_drive && !has_tail) {
    if (tail_matches_drive) {
      r.set("tail_pulley_diameter_in", *in.get_number("drive_pulley_diameter_in"));
    }
    set_default(r, "pulley_diameters_linked", tail_matches_drive);
  }

  r.erase("tail_matches_drive");
  if (const auto drive = r.get_number("drive_pulley_diameter_in")) {
    r.set("pulley_diameter_in", *drive);
  }
  return r;
}

RawInput default_cleats(const RawInput& in) {
  RawInput r = in;
  bool enabled = false;
  if (const auto flag = in.get_bool("cleats_enabled")) {
    enabled = *flag;
  } else {
    enabled = in.get_string("cleats_mode").value_or("none") == "cleated";
  }
  r.set("cleats_enabled", enabled);
  r.set("cleats_mode", std::string(enabled ? "cleated" : "none"));

  if (!enabled) {
    for (const auto key : kCleatSubFields) {
      r.erase(key);
    }
    return r;
  }
  set_default(r, "cleat_material_family", std::string("PVC_HOT_WELDED"));
  set_default(r, "cleat_style", std::string("SOLID"));
  set_default(r, "cleat_centers_in", kDefaultCleatCentersIn);
  set_default(r, "cleat_pattern", std::string("STRAIGHT_CROSS"));
  return r;
}

RawInput migrate_support(const RawInput& in) {
  RawInput r = in;

  if (const auto option = in.get_string("support_option")) {
    const auto ends = support_option_ends(*option);
    set_default(r, "tail_support_type", enum_text(ends.tail));
    set_default(r, "drive_support_type", enum_text(ends.drive));
    r.erase("support_option");
  }

  // Early revisions stored the leg/caster choice directly in support_method.
  if (const auto method = enum_field<schema::SupportMethod>(r, "support_method")) {
    if (*method == schema::SupportMethod::Legs || *method == schema::SupportMethod::Casters) {
      const bool legs = *method == schema::SupportMethod::Legs;
      const auto end_type = legs ? EndSupportType::Legs : EndSupportType::Casters;
      set_default(r, "tail_support_type", enum_text(end_type));
      set_default(r, "drive_support_type", enum_text(end_type));
      set_default(r, legs ? "include_legs" : "include_casters", true);
      r.set("support_method", enum_text(schema::SupportMethod::FloorSupported));
    }
  }

  set_default(r, "tail_support_type", enum_text(EndSupportType::External));
  set_default(r, "drive_support_type", enum_text(EndSupportType::External));

  const auto tail = enum_field<EndSupportType>(r, "tail_support_type").value_or(EndSupportType::External);
  const auto drive = enum_field<EndSupportType>(r, "drive_support_type").value_or(EndSupportType::External);
  set_default(r, "support_method",
              enum_text((is_floor(tail) || is_floor(drive)) ? schema::SupportMethod::FloorSupported
                                                            : schema::SupportMethod::External));
  set_default(r, "include_legs", tail == EndSupportType::Legs || drive == EndSupportType::Legs);
  set_default(r, "include_casters", tail == EndSupportType::Casters || drive == EndSupportType::Casters);

  r.erase("height_input_mode");
  return r;
}

RawInput strip_inapplicable_fields(const RawInput& in) {
  RawInput r = in;
  const auto method = enum_field<schema::SupportMethod>(in, "support_method");
  if (method == schema::SupportMethod::FloorSupported) {
    return r;
  }
  for (const auto key : kLegCasterSubFields) {
    r.erase(key);
  }
  if (enum_field<schema::GeometryMode>(in, "geometry_mode") != schema::GeometryMode::HorizontalTob) {
    r.erase("tail_tob_in");
    r.erase("drive_tob_in");
    r.erase("reference_end");
  }
  return r;
}

RawInput migrate_speed_mode(const RawInput& in) {
  RawInput r = in;
  if (!in.contains("speed_mode")) {
    if (positive(in, "drive_rpm")) {
      r.set("speed_mode", enum_text(schema::SpeedMode::DriveRpm));
      set_default(r, "drive_rpm_input", *in.get_number("drive_rpm"));
    } else {
      r.set("speed_mode", enum_text(schema::SpeedMode::BeltSpeed));
    }
  }
  if (enum_field<schema::SpeedMode>(r, "speed_mode") == schema::SpeedMode::DriveRpm) {
    if (const auto rpm = r.get_number("drive_rpm_input")) {
      r.set("drive_rpm", *rpm);
    }
  }
  return r;
}

RawInput default_geometry_mode(const RawInput& in) {
  RawInput r = in;
  set_default(r, "geometry_mode", enum_text(schema::GeometryMode::LengthAngle));
  if (!r.contains("horizontal_run_in") && positive(r, "conveyor_length_cc_in")) {
    const double L = *r.get_number("conveyor_length_cc_in");
    const double angle = r.get_number("conveyor_incline_deg").value_or(0.0);
    r.set("horizontal_run_in", geometry::horizontal_from_axis(L, angle));
  }
  return r;
}

RawInput default_frame_construction(const RawInput& in) {
  RawInput r = in;
  if (!r.contains("frame_construction_type")) {
    r.set("frame_construction_type", enum_text(schema::FrameConstructionType::SheetMetal));
  }
  const auto type = enum_field<schema::FrameConstructionType>(r, "frame_construction_type");
  if (type) {
    switch (*type) {
      case schema::FrameConstructionType::SheetMetal:
        set_default(r, "frame_sheet_metal_gauge", std::string("12_GA"));
        r.erase("frame_structural_channel_series");
        break;
      case schema::FrameConstructionType::StructuralChannel:
        set_default(r, "frame_structural_channel_series", std::string("C4"));
        r.erase("frame_sheet_metal_gauge");
        break;
      case schema::FrameConstructionType::Special:
        r.erase("frame_sheet_metal_gauge");
        r.erase("frame_structural_channel_series");
        break;
    }
  }

  const auto height_mode = enum_field<schema::FrameHeightMode>(r, "frame_height_mode");
  if (height_mode && *height_mode != schema::FrameHeightMode::Custom) {
    r.erase("custom_frame_height_in");
  }
  return r;
}

RawInput migrate(const RawInput& in) {
  auto r = rename_legacy_fields(in);
  r = unify_pulley_diameters(r);
  r = default_cleats(r);
  r = migrate_support(r);
  r = strip_inapplicable_fields(r);
  r = migrate_speed_mode(r);
  r = default_geometry_mode(r);
  r = default_frame_construction(r);
  return r;
}

schema::CanonicalInput normalize(const RawInput& in) { return schema::from_raw(migrate(in)); }

std::optional<std::string> cleats_summary(const schema::CanonicalInput& in) {
  if (!in.cleats_enabled.value_or(false)) {
    return std::nullopt;
  }
  const auto num = [](double v) { return core::format_value(FieldValue{v}); };

  if (in.cleat_profile && in.cleat_size && in.cleat_pattern) {
    const std::string style = (in.cleat_style == "DRILL_SIPED_1IN") ? " (D&S)" : "";
    return *in.cleat_profile + " " + *in.cleat_size + " " + *in.cleat_pattern + style + " @ " +
           num(in.cleat_centers_in.value_or(kDefaultCleatCentersIn)) + "\" c/c";
  }
  if (!in.cleat_height_in || !in.cleat_spacing_in || !in.cleat_edge_offset_in) {
    return std::string("Cleats: Configuration incomplete");
  }
  return "Cleats: " + num(*in.cleat_height_in) + "\" high @ " + num(*in.cleat_spacing_in) + "\" c/c, " +
         num(*in.cleat_edge_offset_in) + "\" from belt edge";
}

}  // namespace conveyorcalc::migrate
