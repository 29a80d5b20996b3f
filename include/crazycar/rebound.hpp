#pragma once
#include <crazycar/color.hpp>
#include <crazycar/geom.hpp>
#include <crazycar/geometry.hpp>

namespace crazycar {

struct ReboundParams {
  double probe_radius   = 15.0;  // px around the collision point
  int    probe_step_deg = 10;
  double probe_pair_deg = 15.0;  // angular gap between the two probes of a pair

  // Incidence damping bands
  double small_damp  = 0.8;   // (0, small_angle)
  double medium_damp = 0.5;   // [small_angle, large_angle)
  double large_damp  = 0.2;   // [large_angle, 90]
  double small_angle = 30.0;
  double large_angle = 60.0;

  // Push-back and torque
  double k0          = -1.7;
  double s_factor    = 8.0;
  double turn_factor = 7.0;
  double turn_offset = 1.0;
};

struct ReboundResult {
  double speed = 0.0;
  double heading = 0.0;
  Vec2 displacement{};
  bool damped = false;
};

// Angle between two vectors in degrees, [0, 180]. Zero-length -> 0.
double angle_between(Vec2 a, Vec2 b);

// Wall response for one colliding corner: estimates the wall normal by
// probing a circle around point, damps speed by incidence, pushes back
// against travel and rotates away from the wall.
ReboundResult rebound_action(Vec2 point,
                             Corner corner,
                             double heading_deg,
                             double speed,
                             const ColorMap& map,
                             Rgba border = kBorderColor,
                             const ReboundParams& params = {});

} // namespace crazycar
