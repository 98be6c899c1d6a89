/**
 * @file comparator.hpp
 * @brief Tolerance comparison of computed outputs against recorded values.
 * @author Watosn
 */
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "conveyorcalc/core/types.hpp"
#include "conveyorcalc/schema/outputs.hpp"

namespace conveyorcalc::fixtures {

inline constexpr double kDefaultRelTolerance = 0.005;

/**
 * @brief Relative tolerance, globally and per field.
 */
struct Tolerance {
  double default_rel{kDefaultRelTolerance};
  std::map<std::string, double> per_field{};

  [[nodiscard]] double for_field(const std::string& field) const;
};

struct FieldFailure {
  std::string field{};
  core::FieldValue expected{};
  std::optional<core::FieldValue> actual{};  ///< nullopt when the output was not produced
  double abs_diff{};                         ///< numeric fields only
  double pct_diff{};                         ///< percent of |expected|; numeric fields only
};

struct ComparisonResult {
  bool passed{true};
  std::vector<FieldFailure> failures{};
};

/**
 * @brief Compare every expected field against `actual`.
 *
 * A numeric field fails when |actual - expected| > |expected| * tol, so a
 * difference exactly at the tolerance passes. Booleans and strings must match
 * exactly; a type mismatch or a missing actual field fails.
 */
ComparisonResult compare(const core::FieldMap& actual, const core::FieldMap& expected, const Tolerance& tol);

ComparisonResult compare(const schema::Output& actual, const core::FieldMap& expected, const Tolerance& tol);

/**
 * @brief One-line description of a failure for reports.
 */
std::string describe(const FieldFailure& failure);

}  // namespace conveyorcalc::fixtures
