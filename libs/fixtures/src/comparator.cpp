/**
 * @file comparator.cpp
 * @brief Tolerance comparison of computed outputs against recorded values.
 * @author Watosn
 */

#include "conveyorcalc/fixtures/comparator.hpp"

#include <cmath>
#include <limits>
#include <variant>

namespace conveyorcalc::fixtures {

double Tolerance::for_field(const std::string& field) const {
  const auto it = per_field.find(field);
  return (it == per_field.end()) ? default_rel : it->second;
}

ComparisonResult compare(const core::FieldMap& actual, const core::FieldMap& expected, const Tolerance& tol) {
  ComparisonResult out{};
  for (const auto& [field, want] : expected) {
    const auto it = actual.find(field);
    if (it == actual.end()) {
      out.failures.push_back(FieldFailure{.field = field, .expected = want});
      continue;
    }
    const auto& got = it->second;

    const auto* want_num = std::get_if<double>(&want);
    const auto* got_num = std::get_if<double>(&got);
    if (want_num != nullptr && got_num != nullptr) {
      const double diff = std::abs(*got_num - *want_num);
      if (diff > std::abs(*want_num) * tol.for_field(field)) {
        const double pct = (*want_num != 0.0) ? diff / std::abs(*want_num) * 100.0
                                              : std::numeric_limits<double>::infinity();
        out.failures.push_back(
            FieldFailure{.field = field, .expected = want, .actual = got, .abs_diff = diff, .pct_diff = pct});
      }
      continue;
    }
    if (want != got) {
      out.failures.push_back(FieldFailure{.field = field, .expected = want, .actual = got});
    }
  }
  out.passed = out.failures.empty();
  return out;
}

ComparisonResult compare(const schema::Output& actual, const core::FieldMap& expected, const Tolerance& tol) {
  return compare(schema::to_fields(actual), expected, tol);
}

std::string describe(const FieldFailure& failure) {
  std::string s = failure.field + ": expected " + core::format_value(failure.expected) + ", actual ";
  s += failure.actual ? core::format_value(*failure.actual) : std::string("<missing>");
  if (failure.actual && std::holds_alternative<double>(failure.expected) &&
      std::holds_alternative<double>(*failure.actual)) {
    s += " (diff " + core::format_value(core::FieldValue{failure.abs_diff}) + ", " +
         core::format_value(core::FieldValue{failure.pct_diff}) + "%)";
  }
  return s;
}

}  // namespace conveyorcalc::fixtures
