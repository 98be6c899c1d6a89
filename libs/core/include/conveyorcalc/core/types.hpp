/**
 * @file types.hpp
 * @brief Core domain types for conveyorcalc.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace conveyorcalc::core {

/**
 * @brief Standard status code used by loaders and sub-model results.
 */
enum class Status : std::uint8_t { Ok, InvalidInput, DataUnavailable, ParseError, NumericalError };

/**
 * @brief Finding severity. Only `Error` blocks a successful calculation.
 */
enum class Severity : std::uint8_t { Error, Warning, Info };

/**
 * @brief Single validation finding attached to an input or output field.
 */
struct Finding {
  std::string field{};
  std::string message{};
  Severity severity{Severity::Error};

  bool operator==(const Finding&) const = default;
};

/**
 * @brief Scalar value of an open input/output field.
 */
using FieldValue = std::variant<double, bool, std::string>;

/**
 * @brief Ordered name -> value map used for flattened records.
 */
using FieldMap = std::map<std::string, FieldValue>;

inline const char* to_string(Severity s) {
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
  }
  return "unknown";
}

/**
 * @brief Render a field value the way text input files spell it.
 */
std::string format_value(const FieldValue& value);

/**
 * @brief Count findings with a given severity.
 */
inline std::size_t count_severity(const std::vector<Finding>& findings, Severity s) {
  std::size_t n = 0;
  for (const auto& f : findings) {
    if (f.severity == s) {
      ++n;
    }
  }
  return n;
}

}  // namespace conveyorcalc::core
