/**
 * @file test_comparator.cpp
 * @brief Fixture comparator tolerance tests.
 * @author Watosn
 */

#include <cmath>
#include <string>

#include <spdlog/spdlog.h>

#include "conveyorcalc/fixtures/comparator.hpp"

int main() {
  using namespace conveyorcalc;
  using core::FieldMap;

  const fixtures::Tolerance tol{.default_rel = 0.25, .per_field = {{"torque", 0.0}}};

  // |250 - 200| == 200 * 0.25 sits exactly on the boundary.
  const auto edge = fixtures::compare(FieldMap{{"load", 250.0}}, FieldMap{{"load", 200.0}}, tol);
  if (!edge.passed) {
    spdlog::error("difference equal to tolerance must pass");
    return 1;
  }
  const auto over = fixtures::compare(FieldMap{{"load", 250.5}}, FieldMap{{"load", 200.0}}, tol);
  if (over.passed || over.failures.size() != 1U || over.failures[0].abs_diff != 50.5 ||
      std::abs(over.failures[0].pct_diff - 25.25) > 1e-9) {
    spdlog::error("difference beyond tolerance must fail");
    return 2;
  }

  const auto per_field = fixtures::compare(FieldMap{{"torque", 100.0001}}, FieldMap{{"torque", 100.0}}, tol);
  if (per_field.passed) {
    spdlog::error("per-field tolerance not applied");
    return 3;
  }

  const auto zero = fixtures::compare(FieldMap{{"rise_in", 0.1}}, FieldMap{{"rise_in", 0.0}}, tol);
  if (zero.passed || !std::isinf(zero.failures[0].pct_diff)) {
    spdlog::error("non-zero actual against zero expected must fail");
    return 4;
  }

  const auto exact = fixtures::compare(FieldMap{{"is_v_guided", true}, {"speed_mode_used", std::string("belt_speed")}},
                                       FieldMap{{"is_v_guided", false}, {"speed_mode_used", std::string("belt_speed")}},
                                       tol);
  if (exact.passed || exact.failures.size() != 1U || exact.failures[0].field != "is_v_guided") {
    spdlog::error("boolean mismatch not reported");
    return 5;
  }

  const auto missing = fixtures::compare(FieldMap{}, FieldMap{{"target_pph", 1650.0}}, tol);
  if (missing.passed || missing.failures[0].actual.has_value()) {
    spdlog::error("missing output not reported");
    return 6;
  }
  const auto kind = fixtures::compare(FieldMap{{"x", std::string("5")}}, FieldMap{{"x", 5.0}}, tol);
  if (kind.passed) {
    spdlog::error("type mismatch must fail");
    return 7;
  }

  const auto text = fixtures::describe(over.failures[0]);
  if (text.find("load: expected 200, actual 250.5") != 0U || fixtures::describe(missing.failures[0]).find("<missing>") ==
                                                                 std::string::npos) {
    spdlog::error("failure description mismatch: {}", text);
    return 8;
  }

  const fixtures::Tolerance defaults{};
  if (defaults.for_field("anything") != fixtures::kDefaultRelTolerance) {
    spdlog::error("default tolerance mismatch");
    return 9;
  }

  // 0.4% off passes the default 0.5% band; 0.6% off does not.
  const FieldMap recorded{{"belt_speed_fpm", 10.0}};
  if (!fixtures::compare(FieldMap{{"belt_speed_fpm", 10.04}}, recorded, defaults).passed ||
      !fixtures::compare(FieldMap{{"belt_speed_fpm", 9.96}}, recorded, defaults).passed) {
    spdlog::error("value within default tolerance must pass");
    return 10;
  }
  const auto drifted = fixtures::compare(FieldMap{{"belt_speed_fpm", 10.06}}, recorded, defaults);
  if (drifted.passed || drifted.failures.size() != 1U || std::abs(drifted.failures[0].pct_diff - 0.6) > 1e-9) {
    spdlog::error("value beyond default tolerance must fail");
    return 11;
  }
  return 0;
}
