#include <crazycar/rebound.hpp>
#include <crazycar/log.hpp>
#include <algorithm>
#include <cmath>

namespace crazycar {

double angle_between(Vec2 a, Vec2 b) {
  const double den = length(a) * length(b);
  if (den == 0.0 || !std::isfinite(den)) return 0.0;
  const double c = std::clamp(dot(a, b) / den, -1.0, 1.0);
  return rad_to_deg(std::acos(c));
}

// First probe angle whose point is border and whose partner is free.
// Falls back to (radius, 0) when no transition is found.
static Vec2 estimate_wall_normal_(Vec2 p0, const ColorMap& map, Rgba border, const ReboundParams& p) {
  const double r = p.probe_radius;
  const int step = p.probe_step_deg > 0 ? p.probe_step_deg : 10;
  for (int vi = 0; vi <= 360; vi += step) {
    const double a  = deg_to_rad(static_cast<double>(vi));
    const double a2 = a + deg_to_rad(p.probe_pair_deg);
    const Vec2 q1{p0.x + r * std::cos(a),  p0.y + r * std::sin(a)};
    const Vec2 q2{p0.x + r * std::cos(a2), p0.y + r * std::sin(a2)};
    const bool hit  = sample_color(map, trunc_px(q1.x), trunc_px(q1.y), border) == border;
    const bool free = !(sample_color(map, trunc_px(q2.x), trunc_px(q2.y), border) == border);
    if (hit && free) return q1 - p0;
  }
  return Vec2{r, 0.0};
}

ReboundResult rebound_action(Vec2 point,
                             Corner corner,
                             double heading_deg,
                             double speed,
                             const ColorMap& map,
                             Rgba border,
                             const ReboundParams& p) {
  // Rear corners do not collide while reversing.
  if (is_rear(corner) && speed < 0.0) {
    return ReboundResult{0.0, heading_deg, Vec2{}, false};
  }
  if (!finite(point) || !std::isfinite(heading_deg) || !std::isfinite(speed)) {
    return ReboundResult{0.0, normalize_angle(heading_deg), Vec2{}, false};
  }

  const Vec2 normal = estimate_wall_normal_(point, map, border, p);
  const double h = deg_to_rad(heading_deg);
  const Vec2 travel{std::cos(h), std::sin(h)};

  double ang = angle_between(normal, travel);
  if (ang > 90.0) ang = 180.0 - ang;

  double factor = 1.0;
  if (ang == 0.0) factor = 1.0;
  else if (ang < p.small_angle) factor = p.small_damp;
  else if (ang < p.large_angle) factor = p.medium_damp;
  else factor = p.large_damp;
  factor = std::clamp(factor, 0.0, 1.0);

  const double s = p.s_factor * std::max(speed, 0.0) * std::sin(deg_to_rad(ang));
  const Vec2 disp = screen_direction(heading_deg) * (p.k0 * s);

  const double kt = corner == Corner::FrontRight ? -1.0 : 1.0;
  const double turn = p.turn_factor * std::sin(deg_to_rad(2.0 * ang)) + p.turn_offset;

  ReboundResult out{
      .speed = speed * factor,
      .heading = normalize_angle(heading_deg + kt * turn),
      .displacement = finite(disp) ? disp : Vec2{},
      .damped = true,
  };
  log()->debug("rebound: corner={} incidence={:.1f} speed {:.3f}->{:.3f} heading {:.1f}->{:.1f}",
               static_cast<int>(corner), ang, speed, out.speed, heading_deg, out.heading);
  return out;
}

} // namespace crazycar
