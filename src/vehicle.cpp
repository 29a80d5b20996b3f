#include <crazycar/vehicle.hpp>
#include <crazycar/kinematics.hpp>
#include <crazycar/log.hpp>
#include <algorithm>
#include <cmath>
#include <utility>

namespace crazycar {

VehicleParams make_vehicle_params(const SimConfig& cfg) {
  VehicleParams p{};
  p.units = cfg.units();

  const double len = p.units.to_px(cfg.car.length_cm);
  const double wid = p.units.to_px(cfg.car.width_cm);
  if (len > 0.0 && wid > 0.0 && std::isfinite(len) && std::isfinite(wid)) {
    p.length_px = len;
    p.width_px = wid;
  } else {
    log()->error("vehicle: body size {:.2f}x{:.2f} px not positive, using 32x16", len, wid);
    p.length_px = 32.0;
    p.width_px = 16.0;
  }
  p.cover_px = std::max(static_cast<int>(std::max(p.length_px, p.width_px)), cfg.car.min_cover_px);

  const double wb = p.units.to_px(cfg.car.wheelbase_cm);
  const double tw = p.units.to_px(cfg.car.track_width_cm);
  if (wb > 0.0 && tw > 0.0 && std::isfinite(wb) && std::isfinite(tw)) {
    p.wheelbase_px = wb;
    p.track_width_px = tw;
  } else {
    log()->error("vehicle: wheelbase/track width not positive, using 25/10 px");
    p.wheelbase_px = 25.0;
    p.track_width_px = 10.0;
  }
  p.wheel_inset_px = cfg.car.wheel_inset_px;

  p.world_width = cfg.track.width_px;
  p.world_height = cfg.track.height_px;
  p.margin_px = cfg.track.margin_px;
  p.dt = cfg.track.dt;

  p.radar = cfg.radar;
  p.max_radar_len = cfg.track.width_px * cfg.radar.max_len_ratio;
  p.actuation = cfg.actuation;
  p.actuation.max_power = cfg.car.max_power;

  log()->debug("vehicle: size {:.2f}x{:.2f} px cover={} wheelbase={:.2f} track={:.2f}",
               p.length_px, p.width_px, p.cover_px, p.wheelbase_px, p.track_width_px);
  return p;
}

static double clamp_axis(double v, double margin, double extent) {
  if (!std::isfinite(v)) return margin;
  const double hi = std::max(margin, extent - margin);
  return std::clamp(v, margin, hi);
}

void step_motion(VehicleState& s, const VehicleParams& p) {
  if (!std::isfinite(s.speed)) s.speed = 0.0;
  const double v = s.speed;
  s.distance += v;
  s.time += p.dt;

  if (s.steer != 0.0) {
    s.heading = steer_step(s.heading, s.steer, v, p.wheelbase_px, p.track_width_px);
  } else {
    s.heading = normalize_angle(s.heading);
  }

  s.position = s.position + screen_direction(s.heading) * v;
  s.position.x = clamp_axis(s.position.x, p.margin_px, p.world_width);
  s.position.y = clamp_axis(s.position.y, p.margin_px, p.world_height);

  const double half = p.cover_px / 2.0;
  s.center = Vec2{std::trunc(s.position.x) + half, std::trunc(s.position.y) + half};
}

Vehicle::Vehicle(VehicleParams params, Vec2 position, double heading, double power)
  : p_(std::move(params)), seq_(p_.actuation) {
  s_.position = finite(position) ? position : Vec2{p_.margin_px, p_.margin_px};
  s_.heading = normalize_angle(heading);
  s_.power = std::isfinite(power) ? std::clamp(power, -p_.actuation.max_power, p_.actuation.max_power) : 0.0;
  s_.raw_throttle = s_.power;
  s_.speed_set = target_speed();
  refresh_geometry();
  log()->info("vehicle: spawn pos=({:.1f},{:.1f}) heading={:.1f} power={:.1f} cover={}px",
              s_.position.x, s_.position.y, s_.heading, s_.power, p_.cover_px);
}

void Vehicle::refresh_geometry() {
  const double half = p_.cover_px / 2.0;
  s_.center = Vec2{s_.position.x + half, s_.position.y + half};
  update_geometry_();
}

void Vehicle::update_geometry_() {
  const double hl = 0.5 * p_.length_px;
  const double hw = 0.5 * p_.width_px;
  s_.corners = compute_corners(s_.center, s_.heading, hl, hw);
  s_.wheels = compute_wheels(s_.center, s_.heading, std::hypot(hl, hw) - p_.wheel_inset_px);
}

double Vehicle::speed_for_power(double power) {
  s_.speed = step_speed(s_.speed, power, s_.steer, p_.units, p_.dt);
  return s_.speed;
}

double Vehicle::target_speed() const {
  return crazycar::target_speed(s_.power, p_.units);
}

void Vehicle::actuate(const ControlCommand& cmd) {
  if (!s_.alive || !s_.control_enabled) return;
  s_.raw_throttle = cmd.throttle;
  s_.raw_servo = cmd.servo;
  s_.steer = -servo_to_angle(clip_steer(cmd.servo));

  const PowerUpdate up = seq_.command(cmd.throttle, s_.power, s_.speed, *this);
  s_.power = up.power;
  s_.speed = up.speed;
  log()->trace("actuate: throttle={:.1f} servo={:.1f} -> power={:.1f} steer={:.2f} speed={:.3f}",
               cmd.throttle, cmd.servo, s_.power, s_.steer, s_.speed);
}

void Vehicle::tick(const ColorMap& map,
                   const CollisionConfig& collision,
                   bool sensors_enabled,
                   LapListener* listener) {
  if (!s_.alive) return;

  if (seq_.in_sequence()) {
    const PowerUpdate up = seq_.advance(p_.dt * 1000.0, s_.power, s_.speed, *this);
    s_.power = up.power;
    s_.speed = up.speed;
  }

  step_motion(s_, p_);
  update_geometry_();

  const CollisionResult r = collision_step(s_.corners, map, s_.speed, s_.heading, s_.time, collision);
  s_.speed = r.speed;
  s_.heading = r.heading;
  if (!r.alive) {
    s_.alive = false;
    log()->debug("vehicle: removed at t={:.2f}s", s_.time);
  }
  if (r.control_disabled) s_.control_enabled = false;
  if (r.finished && !s_.finished) {
    s_.finished = true;
    s_.lap_time = r.lap_time;
    log()->info("vehicle: lap finished in {:.2f}s", s_.lap_time);
    if (listener) listener->on_lap_time(s_.lap_time);
  }
  if (r.position_delta.x != 0.0 || r.position_delta.y != 0.0) {
    s_.position = s_.position + r.position_delta;
  }

  if (sensors_enabled && p_.radar.enabled) {
    update_sensors_(map);
  } else {
    s_.radars.clear();
    s_.radar_distances.clear();
    s_.samples.clear();
  }
}

void Vehicle::update_sensors_(const ColorMap& map) {
  s_.radars = collect_radars(s_.center, s_.heading, p_.radar.sweep_deg, p_.radar.step_deg,
                             map, p_.max_radar_len);
  s_.radar_distances = radar_distances(s_.radars);
  std::vector<double> cm;
  cm.reserve(s_.radar_distances.size());
  for (int d : s_.radar_distances) cm.push_back(p_.units.to_cm(d));
  s_.samples = linearize_da(cm);
}

ControlInputs Vehicle::control_inputs() const {
  ControlInputs in{};
  in.distances_px = s_.radar_distances;
  in.distances_cm.reserve(s_.radar_distances.size());
  for (int d : s_.radar_distances) in.distances_cm.push_back(p_.units.to_cm(d));
  in.samples = s_.samples;
  in.position = s_.position;
  in.heading = s_.heading;
  in.speed = s_.speed;
  in.power = s_.power;
  in.steer = s_.steer;
  in.raw_throttle = s_.raw_throttle;
  in.raw_servo = s_.raw_servo;
  return in;
}

double Vehicle::reward() const {
  const double half = p_.length_px / 2.0;
  return half > 0.0 ? s_.distance / half : 0.0;
}

} // namespace crazycar
