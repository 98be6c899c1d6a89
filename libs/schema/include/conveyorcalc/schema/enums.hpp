/**
 * @file enums.hpp
 * @brief Enumerated option sets shared by inputs, formulas and rules.
 * @author Watosn
 */
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace conveyorcalc::schema {

/**
 * @brief Which pair of quantities describes the conveyor incline.
 */
enum class GeometryMode : std::uint8_t {
  LengthAngle,      ///< axis length + incline angle
  HorizontalAngle,  ///< horizontal run + incline angle
  HorizontalTob,    ///< horizontal run + top-of-belt at both ends
};

/**
 * @brief Which speed quantity is the primary input.
 */
enum class SpeedMode : std::uint8_t { BeltSpeed, DriveRpm };

enum class FrameHeightMode : std::uint8_t { Standard, LowProfile, Custom };

/**
 * @brief Conveyor-level support method. `Legs`/`Casters` only appear in legacy input.
 */
enum class SupportMethod : std::uint8_t { External, FloorSupported, Legs, Casters };

enum class EndSupportType : std::uint8_t { External, Legs, Casters };

enum class EndSide : std::uint8_t { Tail, Drive };

enum class Orientation : std::uint8_t { Lengthwise, Crosswise };

enum class BeltTrackingMethod : std::uint8_t { Crowned, VGuided };

enum class ShaftDiameterMode : std::uint8_t { Calculated, Manual };

enum class FrameConstructionType : std::uint8_t { SheetMetal, StructuralChannel, Special };

enum class GearmotorMountingStyle : std::uint8_t { ShaftMounted, BottomMount };

enum class MaterialForm : std::uint8_t { Parts, Bulk };

enum class PartTemperatureClass : std::uint8_t { Ambient, Hot, RedHot };

enum class FluidType : std::uint8_t { None, MinimalResidualOil, ConsiderableOilLiquid };

enum class EndGuards : std::uint8_t { None, HeadEnd, TailEnd, BothEnds };

enum class LacingStyle : std::uint8_t { Endless, HiddenLacing, ClipperLacing };

enum class SideLoadingDirection : std::uint8_t { None, Left, Right, Both };

enum class SideLoadingSeverity : std::uint8_t { Light, Moderate, Heavy };

enum class ApplicationClass : std::uint8_t { UnitHandling, BulkHandling };

enum class BeltConstruction : std::uint8_t {
  General,
  FabricPly,
  ThermoplasticPvcPu,
  RubberCompound,
  SteelCordOrVeryStiff,
  ProfiledSidewallOrHighCleat,
};

/**
 * @brief User override of the recommended belt tracking mode. `Auto` keeps the recommendation.
 */
enum class TrackingPreference : std::uint8_t { Auto, PreferCrowned, PreferHybrid, PreferVGuided };

/**
 * @brief Recommended tracking arrangement, ordered by increasing belt constraint.
 */
enum class TrackingMode : std::uint8_t {
  Crowned,  ///< crowned pulleys
  Hybrid,   ///< crowned pulleys + V-guide
  VGuided,  ///< flat pulleys + V-guide
};

/**
 * @brief Length-to-width ratio band: low <= 5, medium <= 10, high above.
 */
enum class LwBand : std::uint8_t { Low, Medium, High };

enum class DisturbanceSeverity : std::uint8_t { Minimal, Moderate, Significant };

/**
 * @brief Text spellings for an enumeration.
 *
 * `entries` holds the canonical spelling first for each value; `aliases`
 * holds additional accepted spellings from older schema revisions.
 */
template <typename E>
struct EnumTraits;

template <typename E>
struct EnumEntry {
  E value;
  std::string_view text;
};

template <>
struct EnumTraits<GeometryMode> {
  static constexpr std::string_view kName = "geometry_mode";
  static constexpr std::array<EnumEntry<GeometryMode>, 3> entries{{
      {GeometryMode::LengthAngle, "L_ANGLE"},
      {GeometryMode::HorizontalAngle, "H_ANGLE"},
      {GeometryMode::HorizontalTob, "H_TOB"},
  }};
  static constexpr std::array<EnumEntry<GeometryMode>, 0> aliases{};
};

template <>
struct EnumTraits<SpeedMode> {
  static constexpr std::string_view kName = "speed_mode";
  static constexpr std::array<EnumEntry<SpeedMode>, 2> entries{{
      {SpeedMode::BeltSpeed, "belt_speed"},
      {SpeedMode::DriveRpm, "drive_rpm"},
  }};
  static constexpr std::array<EnumEntry<SpeedMode>, 0> aliases{};
};

template <>
struct EnumTraits<FrameHeightMode> {
  static constexpr std::string_view kName = "frame_height_mode";
  static constexpr std::array<EnumEntry<FrameHeightMode>, 3> entries{{
      {FrameHeightMode::Standard, "Standard"},
      {FrameHeightMode::LowProfile, "Low Profile"},
      {FrameHeightMode::Custom, "Custom"},
  }};
  static constexpr std::array<EnumEntry<FrameHeightMode>, 1> aliases{{
      {FrameHeightMode::LowProfile, "LOW_PROFILE"},
  }};
};

template <>
struct EnumTraits<SupportMethod> {
  static constexpr std::string_view kName = "support_method";
  static constexpr std::array<EnumEntry<SupportMethod>, 4> entries{{
      {SupportMethod::External, "external"},
      {SupportMethod::FloorSupported, "floor_supported"},
      {SupportMethod::Legs, "legs"},
      {SupportMethod::Casters, "casters"},
  }};
  static constexpr std::array<EnumEntry<SupportMethod>, 0> aliases{};
};

template <>
struct EnumTraits<EndSupportType> {
  static constexpr std::string_view kName = "end_support_type";
  static constexpr std::array<EnumEntry<EndSupportType>, 3> entries{{
      {EndSupportType::External, "External"},
      {EndSupportType::Legs, "Legs"},
      {EndSupportType::Casters, "Casters"},
  }};
  static constexpr std::array<EnumEntry<EndSupportType>, 0> aliases{};
};

template <>
struct EnumTraits<EndSide> {
  static constexpr std::string_view kName = "reference_end";
  static constexpr std::array<EnumEntry<EndSide>, 2> entries{{
      {EndSide::Tail, "tail"},
      {EndSide::Drive, "drive"},
  }};
  static constexpr std::array<EnumEntry<EndSide>, 0> aliases{};
};

template <>
struct EnumTraits<Orientation> {
  static constexpr std::string_view kName = "orientation";
  static constexpr std::array<EnumEntry<Orientation>, 2> entries{{
      {Orientation::Lengthwise, "Lengthwise"},
      {Orientation::Crosswise, "Crosswise"},
  }};
  static constexpr std::array<EnumEntry<Orientation>, 0> aliases{};
};

template <>
struct EnumTraits<BeltTrackingMethod> {
  static constexpr std::string_view kName = "belt_tracking_method";
  static constexpr std::array<EnumEntry<BeltTrackingMethod>, 2> entries{{
      {BeltTrackingMethod::Crowned, "Crowned"},
      {BeltTrackingMethod::VGuided, "V-guided"},
  }};
  static constexpr std::array<EnumEntry<BeltTrackingMethod>, 0> aliases{};
};

template <>
struct EnumTraits<ShaftDiameterMode> {
  static constexpr std::string_view kName = "shaft_diameter_mode";
  static constexpr std::array<EnumEntry<ShaftDiameterMode>, 2> entries{{
      {ShaftDiameterMode::Calculated, "Calculated"},
      {ShaftDiameterMode::Manual, "Manual"},
  }};
  static constexpr std::array<EnumEntry<ShaftDiameterMode>, 0> aliases{};
};

template <>
struct EnumTraits<FrameConstructionType> {
  static constexpr std::string_view kName = "frame_construction_type";
  static constexpr std::array<EnumEntry<FrameConstructionType>, 3> entries{{
      {FrameConstructionType::SheetMetal, "sheet_metal"},
      {FrameConstructionType::StructuralChannel, "structural_channel"},
      {FrameConstructionType::Special, "special"},
  }};
  static constexpr std::array<EnumEntry<FrameConstructionType>, 0> aliases{};
};

template <>
struct EnumTraits<GearmotorMountingStyle> {
  static constexpr std::string_view kName = "gearmotor_mounting_style";
  static constexpr std::array<EnumEntry<GearmotorMountingStyle>, 2> entries{{
      {GearmotorMountingStyle::ShaftMounted, "shaft_mounted"},
      {GearmotorMountingStyle::BottomMount, "bottom_mount"},
  }};
  static constexpr std::array<EnumEntry<GearmotorMountingStyle>, 0> aliases{};
};

template <>
struct EnumTraits<MaterialForm> {
  static constexpr std::string_view kName = "material_form";
  static constexpr std::array<EnumEntry<MaterialForm>, 2> entries{{
      {MaterialForm::Parts, "PARTS"},
      {MaterialForm::Bulk, "BULK"},
  }};
  static constexpr std::array<EnumEntry<MaterialForm>, 0> aliases{};
};

template <>
struct EnumTraits<PartTemperatureClass> {
  static constexpr std::string_view kName = "part_temperature_class";
  static constexpr std::array<EnumEntry<PartTemperatureClass>, 3> entries{{
      {PartTemperatureClass::Ambient, "Ambient"},
      {PartTemperatureClass::Hot, "Hot"},
      {PartTemperatureClass::RedHot, "Red Hot"},
  }};
  static constexpr std::array<EnumEntry<PartTemperatureClass>, 3> aliases{{
      {PartTemperatureClass::Ambient, "AMBIENT"},
      {PartTemperatureClass::Hot, "HOT"},
      {PartTemperatureClass::RedHot, "RED_HOT"},
  }};
};

template <>
struct EnumTraits<FluidType> {
  static constexpr std::string_view kName = "fluid_type";
  static constexpr std::array<EnumEntry<FluidType>, 3> entries{{
      {FluidType::None, "None"},
      {FluidType::MinimalResidualOil, "Minimal Residual Oil"},
      {FluidType::ConsiderableOilLiquid, "Considerable Oil / Liquid"},
  }};
  static constexpr std::array<EnumEntry<FluidType>, 3> aliases{{
      {FluidType::None, "NONE"},
      {FluidType::MinimalResidualOil, "MINIMAL"},
      {FluidType::ConsiderableOilLiquid, "CONSIDERABLE"},
  }};
};

template <>
struct EnumTraits<EndGuards> {
  static constexpr std::string_view kName = "end_guards";
  static constexpr std::array<EnumEntry<EndGuards>, 4> entries{{
      {EndGuards::None, "None"},
      {EndGuards::HeadEnd, "Head End"},
      {EndGuards::TailEnd, "Tail End"},
      {EndGuards::BothEnds, "Both Ends"},
  }};
  static constexpr std::array<EnumEntry<EndGuards>, 0> aliases{};
};

template <>
struct EnumTraits<LacingStyle> {
  static constexpr std::string_view kName = "lacing_style";
  static constexpr std::array<EnumEntry<LacingStyle>, 3> entries{{
      {LacingStyle::Endless, "Endless"},
      {LacingStyle::HiddenLacing, "Hidden Lacing"},
      {LacingStyle::ClipperLacing, "Clipper Lacing"},
  }};
  static constexpr std::array<EnumEntry<LacingStyle>, 0> aliases{};
};

template <>
struct EnumTraits<SideLoadingDirection> {
  static constexpr std::string_view kName = "side_loading_direction";
  static constexpr std::array<EnumEntry<SideLoadingDirection>, 4> entries{{
      {SideLoadingDirection::None, "None"},
      {SideLoadingDirection::Left, "Left"},
      {SideLoadingDirection::Right, "Right"},
      {SideLoadingDirection::Both, "Both"},
  }};
  static constexpr std::array<EnumEntry<SideLoadingDirection>, 0> aliases{};
};

template <>
struct EnumTraits<SideLoadingSeverity> {
  static constexpr std::string_view kName = "side_loading_severity";
  static constexpr std::array<EnumEntry<SideLoadingSeverity>, 3> entries{{
      {SideLoadingSeverity::Light, "Light"},
      {SideLoadingSeverity::Moderate, "Moderate"},
      {SideLoadingSeverity::Heavy, "Heavy"},
  }};
  static constexpr std::array<EnumEntry<SideLoadingSeverity>, 0> aliases{};
};

template <>
struct EnumTraits<ApplicationClass> {
  static constexpr std::string_view kName = "application_class";
  static constexpr std::array<EnumEntry<ApplicationClass>, 2> entries{{
      {ApplicationClass::UnitHandling, "unit_handling"},
      {ApplicationClass::BulkHandling, "bulk_handling"},
  }};
  static constexpr std::array<EnumEntry<ApplicationClass>, 0> aliases{};
};

template <>
struct EnumTraits<BeltConstruction> {
  static constexpr std::string_view kName = "belt_construction";
  static constexpr std::array<EnumEntry<BeltConstruction>, 6> entries{{
      {BeltConstruction::General, "general"},
      {BeltConstruction::FabricPly, "fabric_ply"},
      {BeltConstruction::ThermoplasticPvcPu, "thermoplastic_pvc_pu"},
      {BeltConstruction::RubberCompound, "rubber_compound"},
      {BeltConstruction::SteelCordOrVeryStiff, "steel_cord_or_very_stiff"},
      {BeltConstruction::ProfiledSidewallOrHighCleat, "profiled_sidewall_or_high_cleat"},
  }};
  static constexpr std::array<EnumEntry<BeltConstruction>, 0> aliases{};
};

template <>
struct EnumTraits<TrackingPreference> {
  static constexpr std::string_view kName = "tracking_preference";
  static constexpr std::array<EnumEntry<TrackingPreference>, 4> entries{{
      {TrackingPreference::Auto, "auto"},
      {TrackingPreference::PreferCrowned, "prefer_crowned"},
      {TrackingPreference::PreferHybrid, "prefer_hybrid"},
      {TrackingPreference::PreferVGuided, "prefer_v_guided"},
  }};
  static constexpr std::array<EnumEntry<TrackingPreference>, 0> aliases{};
};

template <>
struct EnumTraits<TrackingMode> {
  static constexpr std::string_view kName = "tracking_mode";
  static constexpr std::array<EnumEntry<TrackingMode>, 3> entries{{
      {TrackingMode::Crowned, "crowned"},
      {TrackingMode::Hybrid, "hybrid"},
      {TrackingMode::VGuided, "v_guided"},
  }};
  static constexpr std::array<EnumEntry<TrackingMode>, 0> aliases{};
};

template <>
struct EnumTraits<LwBand> {
  static constexpr std::string_view kName = "lw_band";
  static constexpr std::array<EnumEntry<LwBand>, 3> entries{{
      {LwBand::Low, "low"},
      {LwBand::Medium, "medium"},
      {LwBand::High, "high"},
  }};
  static constexpr std::array<EnumEntry<LwBand>, 0> aliases{};
};

template <>
struct EnumTraits<DisturbanceSeverity> {
  static constexpr std::string_view kName = "disturbance_severity";
  static constexpr std::array<EnumEntry<DisturbanceSeverity>, 3> entries{{
      {DisturbanceSeverity::Minimal, "minimal"},
      {DisturbanceSeverity::Moderate, "moderate"},
      {DisturbanceSeverity::Significant, "significant"},
  }};
  static constexpr std::array<EnumEntry<DisturbanceSeverity>, 0> aliases{};
};

/**
 * @brief Parse a canonical or legacy spelling. Returns nullopt for unknown text.
 */
template <typename E>
std::optional<E> parse_enum(std::string_view text) {
  for (const auto& e : EnumTraits<E>::entries) {
    if (e.text == text) {
      return e.value;
    }
  }
  for (const auto& e : EnumTraits<E>::aliases) {
    if (e.text == text) {
      return e.value;
    }
  }
  return std::nullopt;
}

/**
 * @brief Canonical spelling of an enum value.
 * @throws std::invalid_argument when the value is outside the enumeration.
 */
template <typename E>
std::string_view to_string(E value) {
  for (const auto& e : EnumTraits<E>::entries) {
    if (e.value == value) {
      return e.text;
    }
  }
  throw std::invalid_argument("unrecognized " + std::string(EnumTraits<E>::kName) + " value " +
                              std::to_string(static_cast<int>(value)));
}

}  // namespace conveyorcalc::schema
