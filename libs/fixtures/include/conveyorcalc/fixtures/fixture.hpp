/**
 * @file fixture.hpp
 * @brief Recorded input/expected-output pairs used to assert formula parity.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "conveyorcalc/core/raw_input.hpp"
#include "conveyorcalc/core/types.hpp"
#include "conveyorcalc/fixtures/comparator.hpp"

namespace conveyorcalc::fixtures {

struct Fixture {
  std::string name{};
  core::RawInput inputs{};
  core::RawInput parameters{};
  core::FieldMap expected{};
  Tolerance tolerance{};
};

struct FixtureLoadResult {
  Fixture fixture{};
  std::vector<std::string> errors{};
  core::Status status{core::Status::Ok};
};

/**
 * @brief Parse a sectioned fixture file.
 *
 * Sections are `[fixture]` (`name`, `tolerance`), `[inputs]`, `[parameters]`,
 * `[expected]` and `[tolerance]` (per-field relative tolerance). Each section
 * uses the `key = value` grammar of input files.
 */
FixtureLoadResult parse_fixture(std::string_view text);

FixtureLoadResult load_fixture(const std::filesystem::path& path);

struct FixtureRun {
  std::string name{};
  bool calculation_success{false};
  ComparisonResult comparison{};
};

/**
 * @brief Run the engine on the fixture inputs and compare against the expected outputs.
 */
FixtureRun run_fixture(const Fixture& fixture);

}  // namespace conveyorcalc::fixtures
