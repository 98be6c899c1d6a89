/**
 * @file parameters.cpp
 * @brief Parameter override merge.
 * @author Watosn
 */

#include "conveyorcalc/schema/parameters.hpp"

#include <type_traits>

namespace conveyorcalc::schema {

Parameters merge_parameters(const Parameters& base, const core::RawInput& overrides) {
  Parameters out = base;
  visit_parameters(out, [&](std::string_view name, auto& field) {
    using T = std::remove_reference_t<decltype(field)>;
    if constexpr (std::is_same_v<T, bool>) {
      if (const auto v = overrides.get_bool(name)) {
        field = *v;
      }
    } else {
      if (const auto v = overrides.get_number(name)) {
        field = *v;
      }
    }
  });
  return out;
}

core::FieldMap to_fields(const Parameters& p) {
  core::FieldMap out;
  visit_parameters(p, [&](std::string_view name, const auto& field) { out.emplace(std::string(name), field); });
  return out;
}

}  // namespace conveyorcalc::schema
