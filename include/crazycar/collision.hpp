#pragma once
#include <string>
#include <optional>
#include <crazycar/color.hpp>
#include <crazycar/geometry.hpp>
#include <crazycar/rebound.hpp>

namespace crazycar {

enum class CollisionPolicy {
  Rebound,  // damp, push back and rotate
  Stop,     // speed 0, control disabled
  Remove,   // alive = false
};

std::optional<CollisionPolicy> policy_from_string(const std::string& s);
const char* to_string(CollisionPolicy p);

struct CollisionConfig {
  CollisionPolicy policy = CollisionPolicy::Rebound;
  int correction_attempts = 6;
  double correction_step = 4.0;   // px per attempt
  ReboundParams rebound{};
};

// Receives the lap time when the front corner touches the finish line.
class LapListener {
public:
  virtual ~LapListener() = default;
  virtual void on_lap_time(double seconds) = 0;
};

struct CollisionResult {
  double speed = 0.0;
  double heading = 0.0;
  bool alive = true;
  bool finished = false;
  double lap_time = 0.0;
  bool control_disabled = false;
  Vec2 position_delta{};
};

// Probes the corners in Corner order. Finish is only checked at FrontRight;
// the first border-colored corner dispatches the policy and ends the scan.
CollisionResult collision_step(const CornerSet& corners,
                               const ColorMap& map,
                               double speed,
                               double heading_deg,
                               double time_s,
                               const CollisionConfig& cfg = {},
                               LapListener* listener = nullptr,
                               Rgba border = kBorderColor,
                               Rgba finish = kFinishLineColor);

} // namespace crazycar
