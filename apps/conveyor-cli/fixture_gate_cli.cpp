/**
 * @file fixture_gate_cli.cpp
 * @brief Runs recorded fixtures and fails when any output drifts beyond tolerance.
 * @author Watosn
 */

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "conveyorcalc/fixtures/fixture.hpp"

int main(int argc, char** argv) {
  if (argc < 2) {
    spdlog::error("usage: fixture_gate_cli <fixture_file>...");
    return 1;
  }

  int failed = 0;
  for (int i = 1; i < argc; ++i) {
    const auto loaded = conveyorcalc::fixtures::load_fixture(argv[i]);
    if (loaded.status != conveyorcalc::core::Status::Ok) {
      for (const auto& e : loaded.errors) {
        spdlog::error("{}: {}", argv[i], e);
      }
      ++failed;
      continue;
    }

    const auto run = conveyorcalc::fixtures::run_fixture(loaded.fixture);
    if (run.comparison.passed) {
      fmt::print("PASS {} ({} fields)\n", run.name, loaded.fixture.expected.size());
      continue;
    }
    ++failed;
    fmt::print("FAIL {} calculation_success={}\n", run.name, run.calculation_success ? 1 : 0);
    for (const auto& f : run.comparison.failures) {
      fmt::print("  {}\n", conveyorcalc::fixtures::describe(f));
    }
  }

  spdlog::info("{} of {} fixture(s) passed", argc - 1 - failed, argc - 1);
  return failed == 0 ? 0 : 2;
}
