/**
 * @file geometry_cli.cpp
 * @brief Resolve conveyor incline geometry from command-line values.
 * @author Watosn
 */

#include <cstdlib>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "conveyorcalc/geometry/geometry.hpp"

namespace {

void usage() {
  spdlog::error("usage: geometry_cli L_ANGLE <length_cc_in> <incline_deg> [drive_dia_in] [tail_dia_in]");
  spdlog::error("       geometry_cli H_ANGLE <horizontal_run_in> <incline_deg> [drive_dia_in] [tail_dia_in]");
  spdlog::error("       geometry_cli H_TOB <horizontal_run_in> <tail_tob_in> <drive_tob_in> [drive_dia_in] [tail_dia_in]");
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 4) {
    usage();
    return 1;
  }
  const auto mode = conveyorcalc::schema::parse_enum<conveyorcalc::schema::GeometryMode>(argv[1]);
  if (!mode) {
    spdlog::error("unknown geometry mode '{}'", argv[1]);
    usage();
    return 1;
  }

  conveyorcalc::schema::CanonicalInput in{};
  in.geometry_mode = *mode;
  int next = 4;
  switch (*mode) {
    case conveyorcalc::schema::GeometryMode::LengthAngle:
      in.conveyor_length_cc_in = std::atof(argv[2]);
      in.conveyor_incline_deg = std::atof(argv[3]);
      break;
    case conveyorcalc::schema::GeometryMode::HorizontalAngle:
      in.horizontal_run_in = std::atof(argv[2]);
      in.conveyor_incline_deg = std::atof(argv[3]);
      break;
    case conveyorcalc::schema::GeometryMode::HorizontalTob:
      if (argc < 5) {
        usage();
        return 1;
      }
      in.horizontal_run_in = std::atof(argv[2]);
      in.tail_tob_in = std::atof(argv[3]);
      in.drive_tob_in = std::atof(argv[4]);
      next = 5;
      break;
  }
  if (argc > next) {
    in.drive_pulley_diameter_in = std::atof(argv[next]);
  }
  if (argc > next + 1) {
    in.tail_pulley_diameter_in = std::atof(argv[next + 1]);
  }

  const auto g = conveyorcalc::geometry::resolve_geometry(in).derived;
  if (!g.is_valid) {
    spdlog::error("invalid geometry: {}", g.error.value_or("unknown"));
    return 2;
  }

  fmt::print("mode={} L_cc_in={} H_cc_in={} theta_deg={} rise_in={}\n", conveyorcalc::schema::to_string(g.mode),
             g.L_cc_in, g.H_cc_in, g.theta_deg, g.rise_in);
  fmt::print("drive_pulley_dia_in={} tail_pulley_dia_in={}\n", g.drive_pulley_dia_in, g.tail_pulley_dia_in);
  if (g.tail_cl_in && g.drive_cl_in) {
    fmt::print("tail_cl_in={} drive_cl_in={}\n", *g.tail_cl_in, *g.drive_cl_in);
  }
  const auto c = conveyorcalc::geometry::pulley_centers(g);
  fmt::print("tail_center=({}, {}) drive_center=({}, {})\n", c.tail.x(), c.tail.y(), c.drive.x(), c.drive.y());
  return 0;
}
