/**
 * @file parameters.hpp
 * @brief Engineering constants with documented defaults and call-scoped overrides.
 * @author Watosn
 */
#pragma once

#include <string_view>

#include "conveyorcalc/core/raw_input.hpp"

namespace conveyorcalc::schema {

/**
 * @brief Model identity reported with every calculation.
 */
inline constexpr std::string_view kModelKey = "sliderbed_conveyor_v1";

/**
 * @brief Constants used by the formula pipeline and parameter checks.
 *
 * A default-constructed value holds the process-wide defaults. Callers pass a
 * merged copy explicitly; nothing here is global mutable state.
 */
struct Parameters {
  double friction_coeff{0.25};
  double safety_factor{2.0};
  double starting_belt_pull_lb{75.0};
  double motor_rpm{1750.0};
  double gravity_in_per_s2{386.1};

  // belt weight coefficients keyed on 2.5" drive pulley vs anything else
  double piw_2p5{0.138};
  double piw_other{0.109};
  double pil_2p5{0.138};
  double pil_other{0.109};

  double pulley_face_extra_v_guided_in{0.5};
  double pulley_face_extra_crowned_in{2.0};
  double return_roller_diameter_in{2.0};
  double frame_clearance_in{0.5};
  double gravity_roller_spacing_in{60.0};

  // Euler-Eytelwein drive tension model
  double pulley_wrap_angle_deg{180.0};
  double pulley_lagging_friction{0.3};
  double tension_service_factor{1.2};

  bool enforce_pci_checks{false};

  bool operator==(const Parameters&) const = default;
};

/**
 * @brief Visit every parameter as (name, member reference).
 */
template <typename Self, typename Visitor>
void visit_parameters(Self& p, Visitor&& v) {
  v("friction_coeff", p.friction_coeff);
  v("safety_factor", p.safety_factor);
  v("starting_belt_pull_lb", p.starting_belt_pull_lb);
  v("motor_rpm", p.motor_rpm);
  v("gravity_in_per_s2", p.gravity_in_per_s2);
  v("piw_2p5", p.piw_2p5);
  v("piw_other", p.piw_other);
  v("pil_2p5", p.pil_2p5);
  v("pil_other", p.pil_other);
  v("pulley_face_extra_v_guided_in", p.pulley_face_extra_v_guided_in);
  v("pulley_face_extra_crowned_in", p.pulley_face_extra_crowned_in);
  v("return_roller_diameter_in", p.return_roller_diameter_in);
  v("frame_clearance_in", p.frame_clearance_in);
  v("gravity_roller_spacing_in", p.gravity_roller_spacing_in);
  v("pulley_wrap_angle_deg", p.pulley_wrap_angle_deg);
  v("pulley_lagging_friction", p.pulley_lagging_friction);
  v("tension_service_factor", p.tension_service_factor);
  v("enforce_pci_checks", p.enforce_pci_checks);
}

/**
 * @brief Copy every recognized override onto `base`. Unknown names are ignored.
 */
Parameters merge_parameters(const Parameters& base, const core::RawInput& overrides);

/**
 * @brief Flatten parameters into a field map.
 */
core::FieldMap to_fields(const Parameters& p);

}  // namespace conveyorcalc::schema
