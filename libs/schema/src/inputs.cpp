/**
 * @file inputs.cpp
 * @brief Canonical input conversion to and from raw field maps.
 * @author Watosn
 */

#include "conveyorcalc/schema/inputs.hpp"

#include <type_traits>

namespace conveyorcalc::schema {
namespace {

template <typename T>
void read_field(const core::RawInput& raw, std::string_view name, std::optional<T>& field,
                std::map<std::string, std::string>& unrecognized) {
  if (!raw.contains(name)) {
    return;
  }
  if constexpr (std::is_same_v<T, double>) {
    field = raw.get_number(name);
  } else if constexpr (std::is_same_v<T, bool>) {
    field = raw.get_bool(name);
  } else if constexpr (std::is_same_v<T, std::string>) {
    field = raw.get_string(name);
  } else {
    static_assert(std::is_enum_v<T>, "unsupported canonical field type");
    const auto text = raw.get_string(name);
    field = parse_enum<T>(*text);
    if (!field) {
      unrecognized.emplace(std::string(name), *text);
    }
  }
}

template <typename T>
void write_field(core::RawInput& raw, std::string_view name, const std::optional<T>& field) {
  if (!field) {
    return;
  }
  if constexpr (std::is_same_v<T, double> || std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
    raw.set(std::string(name), core::FieldValue{*field});
  } else {
    raw.set(std::string(name), core::FieldValue{std::string(to_string(*field))});
  }
}

}  // namespace

CanonicalInput from_raw(const core::RawInput& raw) {
  CanonicalInput out{};
  visit_fields(out, [&](std::string_view name, auto& field) { read_field(raw, name, field, out.unrecognized); });
  return out;
}

core::RawInput to_raw(const CanonicalInput& in) {
  core::RawInput out;
  visit_fields(in, [&](std::string_view name, const auto& field) { write_field(out, name, field); });
  for (const auto& [name, text] : in.unrecognized) {
    out.set(name, core::FieldValue{text});
  }
  return out;
}

}  // namespace conveyorcalc::schema
