/**
 * @file frame.cpp
 * @brief Frame height, snub roller and frame material rules.
 * @author Watosn
 */

#include "conveyorcalc/formulas/frame.hpp"

#include <algorithm>
#include <array>
#include <utility>
#include <variant>

#include "conveyorcalc/core/raw_input.hpp"

namespace conveyorcalc::formulas {
namespace {

using Entry = std::pair<std::string_view, double>;

constexpr std::array<Entry, 5> kSheetMetalGaugeIn = {{
    {"10_GA", 0.1345},
    {"12_GA", 0.1046},
    {"14_GA", 0.0747},
    {"16_GA", 0.0598},
    {"18_GA", 0.0478},
}};

// Web thickness of the channel section.
constexpr std::array<Entry, 6> kChannelWebIn = {{
    {"C3", 0.170},
    {"C4", 0.184},
    {"C5", 0.190},
    {"C6", 0.200},
    {"MC6", 0.180},
    {"MC8", 0.190},
}};

template <std::size_t N>
std::optional<double> lookup(const std::array<Entry, N>& table, const std::optional<std::string>& code) {
  if (!code) {
    return std::nullopt;
  }
  for (const auto& [key, value] : table) {
    if (key == *code) {
      return value;
    }
  }
  return std::nullopt;
}

std::string num(double v) { return core::format_value(core::FieldValue{v}); }

}  // namespace

std::optional<double> parse_cleat_size_in(std::string_view size) {
  auto text = core::trim(size);
  while (!text.empty() && text.back() == '"') {
    text.remove_suffix(1);
  }
  const auto value = core::parse_scalar(text);
  if (const auto* d = std::get_if<double>(&value)) {
    return *d;
  }
  return std::nullopt;
}

FrameHeight frame_height(schema::FrameHeightMode mode,
                         double drive_pulley_dia_in,
                         double tail_pulley_dia_in,
                         double cleat_height_in,
                         double return_roller_dia_in,
                         double clearance_in,
                         std::optional<double> custom_height_in) {
  const double largest = std::max(drive_pulley_dia_in, tail_pulley_dia_in);
  const double cleat_adder = 2.0 * cleat_height_in;
  const bool low_profile = mode == schema::FrameHeightMode::LowProfile;
  const double return_roller = low_profile ? 0.0 : return_roller_dia_in;

  FrameHeight out{};
  out.required_in = largest + cleat_adder + return_roller;
  out.reference_in = out.required_in + clearance_in;
  out.clearance_in = clearance_in;
  switch (mode) {
    case schema::FrameHeightMode::Standard:
    case schema::FrameHeightMode::LowProfile:
      out.effective_in = out.reference_in;
      break;
    case schema::FrameHeightMode::Custom:
      out.effective_in = custom_height_in.value_or(out.reference_in);
      break;
  }

  std::string formula = "Largest pulley (" + num(largest) + "\") + Cleats (2 x " + num(cleat_height_in) + "\" = " +
                        num(cleat_adder) + "\") + Return roller (";
  formula += low_profile ? "0\", snubs at ends" : num(return_roller) + "\"";
  formula += ") = Required " + num(out.required_in) + "\"; Reference " + num(out.reference_in) + "\" (Required + " +
             num(clearance_in) + "\" clearance)";

  out.breakdown = schema::FrameHeightBreakdown{.largest_pulley_in = largest,
                                               .cleat_height_in = cleat_height_in,
                                               .cleat_adder_in = cleat_adder,
                                               .return_roller_in = return_roller,
                                               .required_in = out.required_in,
                                               .clearance_in = clearance_in,
                                               .total_in = out.reference_in,
                                               .formula = std::move(formula)};
  return out;
}

bool requires_snub_rollers(double effective_frame_height_in, double drive_pulley_dia_in, double tail_pulley_dia_in) {
  return effective_frame_height_in < std::max(drive_pulley_dia_in, tail_pulley_dia_in) + kSnubClearanceIn;
}

std::optional<double> frame_side_thickness_in(schema::FrameConstructionType type,
                                              const std::optional<std::string>& gauge,
                                              const std::optional<std::string>& channel_series) {
  switch (type) {
    case schema::FrameConstructionType::SheetMetal:
      return lookup(kSheetMetalGaugeIn, gauge);
    case schema::FrameConstructionType::StructuralChannel:
      return lookup(kChannelWebIn, channel_series);
    case schema::FrameConstructionType::Special:
      return std::nullopt;
  }
  return std::nullopt;
}

}  // namespace conveyorcalc::formulas
