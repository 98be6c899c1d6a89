/**
 * @file engine.hpp
 * @brief Calculation entry point: normalize, calculate, validate.
 * @author Watosn
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "conveyorcalc/core/raw_input.hpp"
#include "conveyorcalc/core/types.hpp"
#include "conveyorcalc/schema/outputs.hpp"

namespace conveyorcalc::engine {

struct CalculationRequest {
  core::RawInput inputs{};
  core::RawInput parameters{};  ///< overrides merged onto default Parameters
  std::optional<std::string> model_version_id{};
};

struct CalculationMetadata {
  std::string model_key{};
  std::string model_version_id{};
  std::string calculated_at{};  ///< ISO 8601 UTC
};

/**
 * @brief Calculation envelope.
 *
 * `outputs` is always computed, even when `success` is false, so callers can
 * show diagnostics. `errors` is engaged only when at least one error finding
 * exists; `warnings` carries warning and info findings.
 */
struct CalculationResult {
  bool success{false};
  schema::Output outputs{};
  std::optional<std::vector<core::Finding>> errors{};
  std::vector<core::Finding> warnings{};
  CalculationMetadata metadata{};
};

/**
 * @brief ISO 8601 UTC timestamp with second resolution, e.g. `2026-01-31T12:00:00Z`.
 */
std::string format_utc_timestamp(std::chrono::system_clock::time_point t);

CalculationResult run_calculation(const CalculationRequest& request);

/**
 * @brief Same as above with an explicit calculation time.
 */
CalculationResult run_calculation(const CalculationRequest& request, std::chrono::system_clock::time_point now);

}  // namespace conveyorcalc::engine
