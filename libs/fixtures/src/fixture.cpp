/**
 * @file fixture.cpp
 * @brief Fixture file loading and execution.
 * @author Watosn
 */

#include "conveyorcalc/fixtures/fixture.hpp"

#include <fstream>
#include <map>
#include <sstream>
#include <variant>

#include "conveyorcalc/engine/engine.hpp"

namespace conveyorcalc::fixtures {
namespace {

constexpr std::string_view kSections[] = {"fixture", "inputs", "parameters", "expected", "tolerance"};

bool known_section(std::string_view name) {
  for (const auto s : kSections) {
    if (s == name) {
      return true;
    }
  }
  return false;
}

}  // namespace

FixtureLoadResult parse_fixture(std::string_view text) {
  FixtureLoadResult out{};
  std::map<std::string, std::string> bodies;
  std::string current;

  std::istringstream in{std::string(text)};
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const auto t = core::trim(line);
    if (t.empty() || t.front() == '#') {
      continue;
    }
    if (t.front() == '[') {
      if (t.back() != ']') {
        out.errors.push_back("line " + std::to_string(line_no) + ": unterminated section header");
        continue;
      }
      current = std::string(core::trim(t.substr(1, t.size() - 2)));
      if (!known_section(current)) {
        out.errors.push_back("line " + std::to_string(line_no) + ": unknown section [" + current + "]");
        current.clear();
      }
      continue;
    }
    if (current.empty()) {
      out.errors.push_back("line " + std::to_string(line_no) + ": entry outside of a section");
      continue;
    }
    bodies[current] += line;
    bodies[current] += '\n';
  }

  std::map<std::string, core::RawInput> sections;
  for (const auto& [name, body] : bodies) {
    auto parsed = core::parse_key_values(body);
    for (const auto& e : parsed.errors) {
      out.errors.push_back("[" + name + "] " + e);
    }
    sections[name] = std::move(parsed.input);
  }

  auto& fx = out.fixture;
  const auto& header = sections["fixture"];
  fx.name = header.get_string("name").value_or("unnamed");
  if (header.contains("tolerance")) {
    if (const auto tol = header.get_number("tolerance"); tol && *tol >= 0.0) {
      fx.tolerance.default_rel = *tol;
    } else {
      out.errors.push_back("[fixture] tolerance must be a non-negative number");
    }
  }
  fx.inputs = sections["inputs"];
  fx.parameters = sections["parameters"];
  fx.expected = sections["expected"].fields();
  for (const auto& [field, value] : sections["tolerance"].fields()) {
    if (const auto* rel = std::get_if<double>(&value); rel != nullptr && *rel >= 0.0) {
      fx.tolerance.per_field[field] = *rel;
    } else {
      out.errors.push_back("[tolerance] " + field + " must be a non-negative number");
    }
  }

  if (fx.expected.empty()) {
    out.errors.push_back("fixture has no [expected] values");
  }
  if (!out.errors.empty()) {
    out.status = core::Status::ParseError;
  }
  return out;
}

FixtureLoadResult load_fixture(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    FixtureLoadResult out{};
    out.errors.push_back("cannot open " + path.string());
    out.status = core::Status::DataUnavailable;
    return out;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return parse_fixture(ss.str());
}

FixtureRun run_fixture(const Fixture& fixture) {
  const auto result = engine::run_calculation(engine::CalculationRequest{.inputs = fixture.inputs,
                                                                         .parameters = fixture.parameters,
                                                                         .model_version_id = fixture.name});
  return FixtureRun{.name = fixture.name,
                    .calculation_success = result.success,
                    .comparison = compare(result.outputs, fixture.expected, fixture.tolerance)};
}

}  // namespace conveyorcalc::fixtures
