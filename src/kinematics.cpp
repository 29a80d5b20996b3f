#include <crazycar/kinematics.hpp>
#include <crazycar/geom.hpp>
#include <algorithm>
#include <cmath>

namespace crazycar {

double steer_step(double heading_deg,
                  double steer_deg,
                  double speed_px,
                  double wheelbase_px,
                  double track_width_px) {
  const double unchanged = normalize_angle(heading_deg);
  if (!std::isfinite(steer_deg) || !std::isfinite(speed_px)) return unchanged;
  if (std::abs(steer_deg) < kKinematicsEps || std::abs(speed_px) < kKinematicsEps) return unchanged;

  const double k0 = steer_deg < 0.0 ? -1.0 : 1.0;
  const double steer_rad = deg_to_rad(std::min(std::abs(steer_deg), kMaxSteerDeg));

  const double tanv = std::tan(steer_rad);
  if (!std::isfinite(tanv) || std::abs(tanv) < kKinematicsEps) return unchanged;

  const double radius = (wheelbase_px / tanv) + (track_width_px / 2.0);
  if (!std::isfinite(radius) || std::abs(radius) < kKinematicsEps) return unchanged;

  const double dtheta_deg = rad_to_deg(speed_px / radius);
  if (!std::isfinite(dtheta_deg)) return unchanged;

  // Signed speed and flipped sign cancel: reverse turns with the steer.
  const double direction = speed_px > 0.0 ? k0 : -k0;
  return normalize_angle(heading_deg + direction * dtheta_deg);
}

} // namespace crazycar
