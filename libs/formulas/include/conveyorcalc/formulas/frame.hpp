/**
 * @file frame.hpp
 * @brief Frame height, snub roller and frame material rules.
 * @author Watosn
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "conveyorcalc/schema/enums.hpp"
#include "conveyorcalc/schema/outputs.hpp"

namespace conveyorcalc::formulas {

/// Frame must clear the largest pulley by this much to avoid snub rollers.
inline constexpr double kSnubClearanceIn = 2.5;
/// Frames below this height go to design review.
inline constexpr double kDesignReviewThresholdIn = 4.0;
/// Smallest custom frame height accepted.
inline constexpr double kMinFrameHeightIn = 3.0;

struct FrameHeight {
  double required_in{};
  double reference_in{};
  double effective_in{};
  double clearance_in{};
  schema::FrameHeightBreakdown breakdown{};
};

/**
 * @brief Numeric cleat height from a catalog size label such as `1"` or `1.5`.
 */
std::optional<double> parse_cleat_size_in(std::string_view size);

/**
 * @brief Required, reference and effective frame heights.
 *
 * Required is the largest pulley plus twice the cleat height plus the return
 * roller (Standard) or nothing (Low Profile, which uses snubs). Reference adds
 * the clearance. Custom mode uses the supplied height when present.
 */
FrameHeight frame_height(schema::FrameHeightMode mode,
                         double drive_pulley_dia_in,
                         double tail_pulley_dia_in,
                         double cleat_height_in,
                         double return_roller_dia_in,
                         double clearance_in,
                         std::optional<double> custom_height_in);

/// Strictly below largest pulley + 2.5".
bool requires_snub_rollers(double effective_frame_height_in, double drive_pulley_dia_in, double tail_pulley_dia_in);

/**
 * @brief Side plate thickness from the gauge or channel series code, nullopt if unknown.
 */
std::optional<double> frame_side_thickness_in(schema::FrameConstructionType type,
                                              const std::optional<std::string>& gauge,
                                              const std::optional<std::string>& channel_series);

}  // namespace conveyorcalc::formulas
