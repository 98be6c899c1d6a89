/**
 * @file geometry.cpp
 * @brief Conveyor incline geometry resolver implementation.
 * @author Watosn
 */

#include "conveyorcalc/geometry/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "conveyorcalc/core/math_utils.hpp"

namespace conveyorcalc::geometry {
namespace {

using conveyorcalc::core::deg_to_rad;
using conveyorcalc::core::rad_to_deg;

void invalidate(DerivedGeometry& g, const char* message) {
  g.is_valid = false;
  g.error = message;
}

}  // namespace

bool is_effectively_horizontal(double angle_deg) { return std::abs(angle_deg) < kHorizontalThresholdDeg; }

double axis_from_horizontal(double horizontal_in, double angle_deg) {
  if (horizontal_in <= 0.0) {
    return 0.0;
  }
  if (is_effectively_horizontal(angle_deg)) {
    return horizontal_in;
  }
  const double c = std::cos(deg_to_rad(angle_deg));
  if (std::abs(c) < kMinCosine) {
    return horizontal_in / kMinCosine;
  }
  return horizontal_in / c;
}

double horizontal_from_axis(double axis_in, double angle_deg) {
  if (axis_in <= 0.0) {
    return 0.0;
  }
  if (is_effectively_horizontal(angle_deg)) {
    return axis_in;
  }
  return axis_in * std::cos(deg_to_rad(angle_deg));
}

double rise_from_axis_and_angle(double axis_in, double angle_deg) {
  if (axis_in <= 0.0 || is_effectively_horizontal(angle_deg)) {
    return 0.0;
  }
  return axis_in * std::sin(deg_to_rad(angle_deg));
}

double rise_from_horizontal_and_angle(double horizontal_in, double angle_deg) {
  if (horizontal_in <= 0.0 || is_effectively_horizontal(angle_deg)) {
    return 0.0;
  }
  return horizontal_in * std::tan(deg_to_rad(angle_deg));
}

double angle_from_centerlines(double tail_cl_in, double drive_cl_in, double horizontal_in) {
  if (horizontal_in <= 0.0) {
    return 0.0;
  }
  const double rise = drive_cl_in - tail_cl_in;
  if (std::abs(rise) < kMinRiseIn) {
    return 0.0;
  }
  const double deg = rad_to_deg(std::atan(rise / horizontal_in));
  return std::clamp(deg, -kMaxInclineDeg, kMaxInclineDeg);
}

double implied_angle_from_tobs(double tail_tob_in,
                               double drive_tob_in,
                               double horizontal_in,
                               double tail_pulley_dia_in,
                               double drive_pulley_dia_in) {
  return angle_from_centerlines(tob_to_centerline(tail_tob_in, tail_pulley_dia_in),
                                tob_to_centerline(drive_tob_in, drive_pulley_dia_in),
                                horizontal_in);
}

double opposite_tob_from_angle(double reference_tob_in,
                               double angle_deg,
                               double horizontal_in,
                               double reference_pulley_dia_in,
                               double opposite_pulley_dia_in,
                               schema::EndSide reference_end) {
  const double ref_cl = tob_to_centerline(reference_tob_in, reference_pulley_dia_in);
  const double rise = rise_from_horizontal_and_angle(horizontal_in, angle_deg);
  double opposite_cl = ref_cl;
  switch (reference_end) {
    case schema::EndSide::Tail:
      opposite_cl = ref_cl + rise;
      break;
    case schema::EndSide::Drive:
      opposite_cl = ref_cl - rise;
      break;
  }
  return centerline_to_tob(opposite_cl, opposite_pulley_dia_in);
}

GeometryResolution resolve_geometry(const schema::CanonicalInput& in) {
  GeometryResolution out{.normalized = in, .derived = {}};
  auto& n = out.normalized;
  auto& g = out.derived;

  g.mode = in.geometry_mode.value_or(schema::GeometryMode::LengthAngle);
  g.drive_pulley_dia_in = in.drive_pulley_diameter_in.value_or(in.pulley_diameter_in.value_or(kDefaultPulleyDiameterIn));
  g.tail_pulley_dia_in = in.tail_pulley_diameter_in.value_or(in.pulley_diameter_in.value_or(g.drive_pulley_dia_in));

  switch (g.mode) {
    case schema::GeometryMode::LengthAngle: {
      const double L = in.conveyor_length_cc_in.value_or(0.0);
      const double theta = in.conveyor_incline_deg.value_or(0.0);
      if (L <= 0.0) {
        invalidate(g, "Conveyor length must be greater than 0");
        return out;
      }
      g.L_cc_in = L;
      g.theta_deg = theta;
      g.H_cc_in = horizontal_from_axis(L, theta);
      g.rise_in = rise_from_axis_and_angle(L, theta);
      n.horizontal_run_in = g.H_cc_in;
      break;
    }
    case schema::GeometryMode::HorizontalAngle: {
      const double H = in.horizontal_run_in.value_or(in.conveyor_length_cc_in.value_or(0.0));
      const double theta = in.conveyor_incline_deg.value_or(0.0);
      if (H <= 0.0) {
        invalidate(g, "Horizontal run must be greater than 0");
        return out;
      }
      g.H_cc_in = H;
      g.theta_deg = theta;
      g.L_cc_in = axis_from_horizontal(H, theta);
      g.rise_in = rise_from_horizontal_and_angle(H, theta);
      n.conveyor_length_cc_in = g.L_cc_in;
      n.horizontal_run_in = H;
      break;
    }
    case schema::GeometryMode::HorizontalTob: {
      const double H = in.horizontal_run_in.value_or(in.conveyor_length_cc_in.value_or(0.0));
      if (H <= 0.0) {
        invalidate(g, "Horizontal run must be greater than 0");
        return out;
      }
      if (!in.tail_tob_in || !in.drive_tob_in) {
        invalidate(g, "H_TOB mode requires both tail and drive TOB values");
        return out;
      }
      const double tail_cl = tob_to_centerline(*in.tail_tob_in, g.tail_pulley_dia_in);
      const double drive_cl = tob_to_centerline(*in.drive_tob_in, g.drive_pulley_dia_in);
      g.H_cc_in = H;
      g.tail_cl_in = tail_cl;
      g.drive_cl_in = drive_cl;
      g.theta_deg = angle_from_centerlines(tail_cl, drive_cl, H);
      g.rise_in = drive_cl - tail_cl;
      if (is_effectively_horizontal(g.theta_deg)) {
        g.theta_deg = 0.0;
        g.rise_in = 0.0;
      }
      g.L_cc_in = axis_from_horizontal(H, g.theta_deg);
      n.conveyor_length_cc_in = g.L_cc_in;
      n.horizontal_run_in = H;
      n.conveyor_incline_deg = g.theta_deg;
      break;
    }
  }
  if (g.mode != schema::GeometryMode::LengthAngle && g.mode != schema::GeometryMode::HorizontalAngle &&
      g.mode != schema::GeometryMode::HorizontalTob) {
    throw std::invalid_argument("resolve_geometry: geometry_mode out of range");
  }

  if (in.tail_tob_in && !g.tail_cl_in) {
    g.tail_cl_in = tob_to_centerline(*in.tail_tob_in, g.tail_pulley_dia_in);
  }
  if (in.drive_tob_in && !g.drive_cl_in) {
    g.drive_cl_in = tob_to_centerline(*in.drive_tob_in, g.drive_pulley_dia_in);
  }
  return out;
}

PulleyCenters pulley_centers(const DerivedGeometry& g) {
  PulleyCenters c{};
  c.tail = Eigen::Vector2d(0.0, g.tail_cl_in.value_or(0.0));
  c.drive = c.tail + Eigen::Vector2d(g.H_cc_in, g.rise_in);
  return c;
}

bool agree(const DerivedGeometry& a, const DerivedGeometry& b, double rel_tol) {
  const Eigen::Vector3d va(a.L_cc_in, a.H_cc_in, a.rise_in);
  const Eigen::Vector3d vb(b.L_cc_in, b.H_cc_in, b.rise_in);
  const double scale = std::max(va.norm(), vb.norm());
  return (va - vb).norm() <= std::max(rel_tol * scale, 1e-12);
}

}  // namespace conveyorcalc::geometry
