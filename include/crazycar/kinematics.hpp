#pragma once

namespace crazycar {

inline constexpr double kKinematicsEps = 1e-6;
inline constexpr double kMaxSteerDeg   = 89.0; // tan() guard near 90 deg

// One tick of steering-induced heading change (bicycle model).
// Turn radius R = wheelbase / tan|steer| + track_width / 2, dtheta = speed / R.
// Reverse travel rotates opposite to forward travel. Degenerate geometry
// (no speed, no steer, zero/NaN/Inf radius) leaves the heading unchanged.
// Result is normalized to [0, 360).
double steer_step(double heading_deg,
                  double steer_deg,
                  double speed_px,
                  double wheelbase_px,
                  double track_width_px);

} // namespace crazycar
