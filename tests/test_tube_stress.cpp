/**
 * @file test_tube_stress.cpp
 * @brief PCI tube stress and drive tension tests.
 * @author Watosn
 */

#include <cmath>
#include <numbers>

#include <spdlog/spdlog.h>

#include "conveyorcalc/formulas/tensions.hpp"
#include "conveyorcalc/formulas/tube_stress.hpp"

namespace {

bool approx(double a, double b, double rel) {
  const double d = std::abs(a - b);
  const double n = std::max(std::abs(b), 1e-30);
  return d / n <= rel;
}

}  // namespace

int main() {
  using namespace conveyorcalc;
  using schema::TubeStressStatus;

  const formulas::TubeStressInput drum{.tube_od_in = 6.0, .tube_wall_in = 0.134, .hub_centers_in = 24.0,
                                       .radial_load_lbf = 500.0};
  const auto ok = formulas::tube_stress(drum, formulas::kTubeStressLimitDrumPsi, false, false);
  const double id = 6.0 - 2.0 * 0.134;
  const double expected = 8.0 * 6.0 * 500.0 * 24.0 / (std::numbers::pi * (std::pow(6.0, 4) - std::pow(id, 4)));
  if (ok.status != core::Status::Ok || !ok.stress_psi || *ok.stress_psi <= 0.0 ||
      *ok.stress_psi != std::round(expected) || ok.check != TubeStressStatus::Pass) {
    spdlog::error("drum tube stress mismatch");
    return 1;
  }

  const auto estimated = formulas::tube_stress(drum, formulas::kTubeStressLimitDrumPsi, true, false);
  if (estimated.check != TubeStressStatus::Estimated) {
    spdlog::error("estimated hub centers not flagged");
    return 2;
  }

  formulas::TubeStressInput heavy = drum;
  heavy.radial_load_lbf = 20000.0;
  if (formulas::tube_stress(heavy, formulas::kTubeStressLimitVGroovePsi, false, false).check != TubeStressStatus::Warn ||
      formulas::tube_stress(heavy, formulas::kTubeStressLimitVGroovePsi, false, true).check != TubeStressStatus::Fail) {
    spdlog::error("over-limit tube stress status mismatch");
    return 3;
  }

  formulas::TubeStressInput solid = drum;
  solid.tube_wall_in = 3.5;
  const auto bad = formulas::tube_stress(solid, formulas::kTubeStressLimitDrumPsi, false, false);
  if (bad.status != core::Status::InvalidInput || bad.check != TubeStressStatus::Error ||
      bad.error_message != "Invalid tube geometry: wall thickness (3.5\") exceeds radius (3\")") {
    spdlog::error("invalid tube geometry mismatch: {}", bad.error_message.value_or("<none>"));
    return 4;
  }

  formulas::TubeStressInput empty = drum;
  empty.tube_od_in = 0.0;
  const auto incomplete = formulas::tube_stress(empty, formulas::kTubeStressLimitDrumPsi, false, false);
  if (incomplete.status != core::Status::DataUnavailable || incomplete.check != TubeStressStatus::Incomplete ||
      incomplete.stress_psi.has_value()) {
    spdlog::error("missing tube data should be incomplete");
    return 5;
  }
  if (formulas::tube_stress_limit_psi(true) != 3400.0 || formulas::tube_stress_limit_psi(false) != 10000.0) {
    spdlog::error("tube stress limit mismatch");
    return 6;
  }

  const schema::Parameters p{};
  const auto t = formulas::pulley_tensions(100.0, p);
  const double ratio = std::exp(0.3 * std::numbers::pi);
  const double te = 120.0;
  if (!approx(t.t1_lbf - t.t2_lbf, te, 1e-3) || !approx(t.t2_lbf, te / (ratio - 1.0), 1e-3) ||
      !approx(t.radial_lbf, t.t1_lbf + t.t2_lbf, 1e-3)) {
    spdlog::error("pulley tensions mismatch t1={} t2={} radial={}", t.t1_lbf, t.t2_lbf, t.radial_lbf);
    return 7;
  }
  const auto none = formulas::pulley_tensions(0.0, p);
  if (none.t1_lbf != 0.0 || none.t2_lbf != 0.0 || none.radial_lbf != 0.0) {
    spdlog::error("zero pull should give zero tensions");
    return 8;
  }
  return 0;
}
