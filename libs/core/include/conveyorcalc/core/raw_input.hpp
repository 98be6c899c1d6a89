/**
 * @file raw_input.hpp
 * @brief Open, partially populated field map used for inputs and overrides.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "conveyorcalc/core/types.hpp"

namespace conveyorcalc::core {

/**
 * @brief Name -> scalar map that may contain legacy names or omit newer fields.
 *
 * Values are immutable from the outside; the `with`/`without` helpers return
 * modified copies so migration steps stay pure.
 */
class RawInput {
 public:
  RawInput() = default;
  explicit RawInput(FieldMap fields) : fields_(std::move(fields)) {}

  [[nodiscard]] bool contains(std::string_view key) const;
  [[nodiscard]] const FieldValue* find(std::string_view key) const;

  /**
   * @brief Numeric value of a field. Booleans read as 0/1; numeric strings are parsed.
   */
  [[nodiscard]] std::optional<double> get_number(std::string_view key) const;
  /**
   * @brief Boolean value of a field. Accepts `true`/`false` strings and non-zero numbers.
   */
  [[nodiscard]] std::optional<bool> get_bool(std::string_view key) const;
  /**
   * @brief String value of a field. Numbers are rendered with `format_value`.
   */
  [[nodiscard]] std::optional<std::string> get_string(std::string_view key) const;

  void set(std::string key, FieldValue value) { fields_.insert_or_assign(std::move(key), std::move(value)); }
  void erase(std::string_view key);

  [[nodiscard]] RawInput with(std::string key, FieldValue value) const;
  [[nodiscard]] RawInput without(std::string_view key) const;

  [[nodiscard]] const FieldMap& fields() const { return fields_; }
  [[nodiscard]] std::size_t size() const { return fields_.size(); }
  [[nodiscard]] bool empty() const { return fields_.empty(); }

  bool operator==(const RawInput&) const = default;

 private:
  FieldMap fields_{};
};

/**
 * @brief Parse a scalar the way text input files spell it.
 *
 * `true`/`false` become booleans, a complete numeric parse becomes a number,
 * a double-quoted token loses its quotes, and anything else stays a string.
 */
FieldValue parse_scalar(std::string_view text);

/**
 * @brief Outcome of parsing `key = value` text.
 */
struct TextParseResult {
  RawInput input{};
  std::vector<std::string> errors{};
  Status status{Status::Ok};
};

/**
 * @brief Parse `key = value` lines. `#` starts a comment; blank lines are ignored.
 */
TextParseResult parse_key_values(std::string_view text);

/**
 * @brief Load and parse a `key = value` file.
 */
TextParseResult load_key_value_file(const std::filesystem::path& path);

/**
 * @brief Trim ASCII whitespace from both ends.
 */
std::string_view trim(std::string_view text);

}  // namespace conveyorcalc::core
