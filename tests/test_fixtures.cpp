/**
 * @file test_fixtures.cpp
 * @brief Fixture file parsing and formula parity tests.
 * @author Watosn
 */

#include <filesystem>
#include <string>

#include <spdlog/spdlog.h>

#include "conveyorcalc/fixtures/fixture.hpp"

int main(int argc, char** argv) {
  using namespace conveyorcalc;
  if (argc < 2) {
    spdlog::error("usage: test_fixtures <fixture_dir>");
    return 1;
  }
  const std::filesystem::path dir = argv[1];

  const auto parsed = fixtures::parse_fixture(
      "[fixture]\n"
      "name = sample\n"
      "tolerance = 0.01\n"
      "[inputs]\n"
      "belt_width_in = 18\n"
      "[parameters]\n"
      "friction_coeff = 0.3\n"
      "[expected]\n"
      "pulley_face_length_in = 20\n"
      "[tolerance]\n"
      "pulley_face_length_in = 0\n");
  if (parsed.status != core::Status::Ok || parsed.fixture.name != "sample" ||
      parsed.fixture.tolerance.default_rel != 0.01 || parsed.fixture.tolerance.for_field("pulley_face_length_in") != 0.0 ||
      parsed.fixture.parameters.get_number("friction_coeff") != 0.3 || parsed.fixture.expected.size() != 1U) {
    spdlog::error("fixture parse mismatch");
    return 2;
  }

  const auto orphan = fixtures::parse_fixture("belt_width_in = 18\n[expected]\nx = 1\n");
  const auto unknown = fixtures::parse_fixture("[outputs]\nx = 1\n[expected]\nx = 1\n");
  const auto empty = fixtures::parse_fixture("[fixture]\nname = nothing\n");
  if (orphan.status != core::Status::ParseError || unknown.status != core::Status::ParseError ||
      empty.status != core::Status::ParseError) {
    spdlog::error("malformed fixtures accepted");
    return 3;
  }
  if (fixtures::load_fixture(dir / "does_not_exist.fixture").status != core::Status::DataUnavailable) {
    spdlog::error("missing fixture file should be data unavailable");
    return 4;
  }

  int code = 10;
  for (const char* name : {"horizontal_parts.fixture", "inclined_htob_cleated.fixture"}) {
    const auto loaded = fixtures::load_fixture(dir / name);
    if (loaded.status != core::Status::Ok) {
      for (const auto& e : loaded.errors) {
        spdlog::error("{}: {}", name, e);
      }
      return code;
    }
    const auto run = fixtures::run_fixture(loaded.fixture);
    if (!run.calculation_success || !run.comparison.passed) {
      for (const auto& f : run.comparison.failures) {
        spdlog::error("{}: {}", run.name, fixtures::describe(f));
      }
      return code + 1;
    }
    code += 2;
  }

  // The recorded cleat adder must be twice the recorded cleat height.
  const auto cleated = fixtures::load_fixture(dir / "inclined_htob_cleated.fixture").fixture;
  const auto adder = cleated.expected.find("frame_height_breakdown.cleat_adder_in");
  const auto cleat_height = cleated.inputs.get_number("cleat_height_in");
  if (adder == cleated.expected.end() || !cleat_height ||
      adder->second != core::FieldValue{2.0 * *cleat_height}) {
    spdlog::error("cleated fixture breakdown disagrees with its cleat height");
    return 21;
  }

  // A drifted expectation must be caught.
  auto drifted = fixtures::load_fixture(dir / "horizontal_parts.fixture").fixture;
  drifted.expected["total_belt_pull_lb"] = 110.0;
  const auto gate = fixtures::run_fixture(drifted);
  if (gate.comparison.passed || gate.comparison.failures.size() != 1U ||
      gate.comparison.failures[0].field != "total_belt_pull_lb") {
    spdlog::error("drifted fixture not caught");
    return 20;
  }
  return 0;
}
