/**
 * @file engine.cpp
 * @brief Calculation entry point.
 * @author Watosn
 */

#include "conveyorcalc/engine/engine.hpp"

#include <array>
#include <ctime>
#include <utility>

#include "conveyorcalc/formulas/calculate.hpp"
#include "conveyorcalc/migrate/migrate.hpp"
#include "conveyorcalc/schema/parameters.hpp"
#include "conveyorcalc/validation/rules.hpp"

namespace conveyorcalc::engine {

std::string format_utc_timestamp(std::chrono::system_clock::time_point t) {
  const std::time_t secs = std::chrono::system_clock::to_time_t(t);
  std::tm utc{};
  gmtime_r(&secs, &utc);
  std::array<char, 32> buf{};
  const auto n = std::strftime(buf.data(), buf.size(), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return std::string(buf.data(), n);
}

CalculationResult run_calculation(const CalculationRequest& request) {
  return run_calculation(request, std::chrono::system_clock::now());
}

CalculationResult run_calculation(const CalculationRequest& request, std::chrono::system_clock::time_point now) {
  const auto params = schema::merge_parameters(schema::Parameters{}, request.parameters);
  const auto in = migrate::normalize(request.inputs);

  CalculationResult result{};
  result.outputs = formulas::calculate(in, params);

  std::vector<core::Finding> errors;
  for (auto& f : validation::validate(in, params, result.outputs)) {
    if (f.severity == core::Severity::Error) {
      errors.push_back(std::move(f));
    } else {
      result.warnings.push_back(std::move(f));
    }
  }
  result.success = errors.empty();
  if (!errors.empty()) {
    result.errors = std::move(errors);
  }

  result.metadata.model_key = std::string(schema::kModelKey);
  result.metadata.calculated_at = format_utc_timestamp(now);
  result.metadata.model_version_id =
      request.model_version_id.value_or(result.metadata.model_key + "@" + result.metadata.calculated_at);
  return result;
}

}  // namespace conveyorcalc::engine
