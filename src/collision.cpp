#include <crazycar/collision.hpp>
#include <crazycar/log.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace crazycar {

static std::string lower(std::string s) {
  for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return s;
}

std::optional<CollisionPolicy> policy_from_string(const std::string& s) {
  const std::string k = lower(s);
  if (k == "rebound") return CollisionPolicy::Rebound;
  if (k == "stop")    return CollisionPolicy::Stop;
  if (k == "remove")  return CollisionPolicy::Remove;
  return std::nullopt;
}

const char* to_string(CollisionPolicy p) {
  switch (p) {
    case CollisionPolicy::Rebound: return "rebound";
    case CollisionPolicy::Stop:    return "stop";
    case CollisionPolicy::Remove:  return "remove";
  }
  return "rebound";
}

static bool on_border(const ColorMap& map, Vec2 p, Rgba border) {
  return sample_color(map, trunc_px(p.x), trunc_px(p.y), border) == border;
}

// Grows the rebound displacement toward the corner centroid until no corner
// sits on the border, at most cfg.correction_attempts times.
static Vec2 push_out_(const CornerSet& corners, Vec2 hit, Vec2 delta,
                      const ColorMap& map, Rgba border, const CollisionConfig& cfg) {
  const Vec2 c = centroid(corners);
  Vec2 dir = c - hit;
  const double n = length(dir);
  dir = (n > 0.0 && std::isfinite(n)) ? dir * (1.0 / n) : Vec2{1.0, 0.0};

  for (int attempt = 0; attempt < cfg.correction_attempts; ++attempt) {
    const bool stuck = std::any_of(corners.begin(), corners.end(),
                                   [&](Vec2 cp) { return on_border(map, cp + delta, border); });
    if (!stuck) {
      log()->debug("collision: push-out clear after {} attempt(s)", attempt);
      return delta;
    }
    delta = delta + dir * cfg.correction_step;
  }
  return delta;
}

CollisionResult collision_step(const CornerSet& corners,
                               const ColorMap& map,
                               double speed,
                               double heading_deg,
                               double time_s,
                               const CollisionConfig& cfg,
                               LapListener* listener,
                               Rgba border,
                               Rgba finish) {
  CollisionResult r{};
  r.speed = speed;
  r.heading = heading_deg;

  for (std::size_t i = 0; i < kCornerCount; ++i) {
    const Corner corner = corner_at(i);
    const Vec2 pt = corners[i];
    const int x = trunc_px(pt.x);
    const int y = trunc_px(pt.y);
    const Rgba c = sample_color(map, x, y, border);

    if (corner == Corner::FrontRight && c == finish && !r.finished) {
      r.finished = true;
      r.lap_time = time_s;
      if (listener) listener->on_lap_time(time_s);
      log()->debug("collision: finish line at t={:.2f}s", time_s);
    }

    if (c == border) {
      log()->debug("collision: border at corner {} ({},{}) policy={}",
                   static_cast<int>(corner), x, y, to_string(cfg.policy));
      switch (cfg.policy) {
        case CollisionPolicy::Rebound: {
          const ReboundResult rb = rebound_action(pt, corner, r.heading, r.speed, map, border, cfg.rebound);
          r.speed = rb.speed;
          r.heading = rb.heading;
          r.position_delta = push_out_(corners, pt, rb.displacement, map, border, cfg);
          break;
        }
        case CollisionPolicy::Stop:
          r.speed = 0.0;
          r.control_disabled = true;
          log()->warn("collision: stop policy, control disabled at t={:.2f}s", time_s);
          break;
        case CollisionPolicy::Remove:
          r.alive = false;
          break;
      }
      break;
    }
  }
  return r;
}

} // namespace crazycar
