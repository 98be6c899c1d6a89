/**
 * @file conveyor_calc_cli.cpp
 * @brief Sliderbed conveyor calculation command-line entrypoint.
 * @author Watosn
 */

#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "conveyorcalc/core/raw_input.hpp"
#include "conveyorcalc/engine/engine.hpp"
#include "conveyorcalc/schema/outputs.hpp"

namespace {

void print_findings(const std::vector<conveyorcalc::core::Finding>& findings) {
  for (const auto& f : findings) {
    fmt::print("finding severity={} field={} message=\"{}\"\n", conveyorcalc::core::to_string(f.severity), f.field,
               f.message);
  }
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2 || argc > 4) {
    spdlog::error("usage: conveyor_calc_cli <inputs_file> [parameters_file] [model_version_id]");
    spdlog::error("files: one 'key = value' per line, '#' comments");
    return 1;
  }

  auto inputs = conveyorcalc::core::load_key_value_file(argv[1]);
  if (inputs.status != conveyorcalc::core::Status::Ok) {
    for (const auto& e : inputs.errors) {
      spdlog::error("{}: {}", argv[1], e);
    }
    return 2;
  }

  conveyorcalc::engine::CalculationRequest request{.inputs = inputs.input, .parameters = {}, .model_version_id = {}};
  if (argc >= 3) {
    auto params = conveyorcalc::core::load_key_value_file(argv[2]);
    if (params.status != conveyorcalc::core::Status::Ok) {
      for (const auto& e : params.errors) {
        spdlog::error("{}: {}", argv[2], e);
      }
      return 2;
    }
    request.parameters = params.input;
  }
  if (argc >= 4) {
    request.model_version_id = std::string(argv[3]);
  }

  const auto result = conveyorcalc::engine::run_calculation(request);

  fmt::print("model_key={} model_version_id={} calculated_at={}\n", result.metadata.model_key,
             result.metadata.model_version_id, result.metadata.calculated_at);
  for (const auto& [name, value] : conveyorcalc::schema::to_fields(result.outputs)) {
    fmt::print("{}={}\n", name, conveyorcalc::core::format_value(value));
  }

  if (result.errors) {
    print_findings(*result.errors);
  }
  print_findings(result.warnings);
  if (!result.warnings.empty()) {
    spdlog::warn("{} warning/info finding(s)", result.warnings.size());
  }

  if (!result.success) {
    spdlog::error("calculation failed with {} error(s)", result.errors ? result.errors->size() : 0U);
    return 3;
  }
  return 0;
}
