#include <crazycar/config.hpp>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace crazycar {

static inline double clamp01(double x) {
  return x < 0.0 ? 0.0 : (x > 1.0 ? 1.0 : x);
}

static inline double clamp_finite(double x, double lo, double hi, double fallback) {
  if (!std::isfinite(x)) return fallback;
  return std::clamp(x, lo, hi);
}

template <class T>
static void read(const YAML::Node& node, const char* key, T& field) {
  if (auto v = node[key]) field = v.as<T>(field);
}

static std::vector<double> read_vector(const YAML::Node& node) {
  std::vector<double> out;
  if (!node || !node.IsSequence()) return out;
  out.reserve(node.size());
  for (const auto& v : node) out.push_back(v.as<double>());
  return out;
}

static std::optional<SpawnPoint> read_spawn_point(const YAML::Node& node) {
  if (!node || !node.IsMap()) return std::nullopt;
  SpawnPoint sp{};
  read(node, "x", sp.center.x);
  read(node, "y", sp.center.y);
  read(node, "heading", sp.heading);
  return sp;
}

void sanitize(SimConfig& c) {
  auto& t = c.track;
  t.scale_factor = clamp_finite(t.scale_factor, 0.05, 10.0, 0.8);
  t.width_px = std::clamp(t.width_px, 16, 16384);
  t.height_px = std::clamp(t.height_px, 16, 16384);
  t.track_width_cm = clamp_finite(t.track_width_cm, 1.0, 1.0e6, kTrackWidthCm);
  t.margin_px = clamp_finite(t.margin_px, 0.0, 0.25 * std::min(t.width_px, t.height_px), 8.0);
  t.dt = clamp_finite(t.dt, 1.0e-4, 1.0, 0.01);

  auto& car = c.car;
  car.length_cm = clamp_finite(car.length_cm, 0.0, 1.0e4, 40.0);
  car.width_cm = clamp_finite(car.width_cm, 0.0, 1.0e4, 20.0);
  car.wheelbase_cm = clamp_finite(car.wheelbase_cm, 0.0, 1.0e4, 25.0);
  car.track_width_cm = clamp_finite(car.track_width_cm, 0.0, 1.0e4, 10.0);
  car.wheel_inset_px = clamp_finite(car.wheel_inset_px, 0.0, 1.0e3, 6.0);
  car.max_power = clamp_finite(car.max_power, 1.0, 100.0, 100.0);
  car.initial_power = clamp_finite(car.initial_power, -car.max_power, car.max_power, 20.0);
  car.min_cover_px = std::clamp(car.min_cover_px, 1, 1024);

  auto& r = c.radar;
  r.sweep_deg = std::clamp(std::abs(r.sweep_deg), 0, 180);
  r.step_deg = std::clamp(r.step_deg, 1, 360);
  r.max_len_ratio = clamp_finite(r.max_len_ratio, 0.0, 1.0, kMaxRadarLenRatio);

  auto& a = c.actuation;
  a.max_power = car.max_power;
  a.deadzone = clamp_finite(a.deadzone, 0.0, a.max_power, 18.0);
  a.min_start_percent = clamp01(std::isfinite(a.min_start_percent) ? a.min_start_percent : 0.08);
  a.counter_thrust_power = clamp_finite(a.counter_thrust_power, -a.max_power, 0.0, -30.0);
  a.pause_ms = std::clamp(a.pause_ms, 0, 10000);

  auto& col = c.collision;
  col.correction_attempts = std::clamp(col.correction_attempts, 0, 64);
  col.correction_step = clamp_finite(col.correction_step, 0.0, 100.0, 4.0);
  auto& rb = col.rebound;
  rb.probe_radius = clamp_finite(rb.probe_radius, 1.0, 1000.0, 15.0);
  rb.probe_step_deg = std::clamp(rb.probe_step_deg, 1, 360);
  rb.probe_pair_deg = clamp_finite(rb.probe_pair_deg, 0.0, 360.0, 15.0);
  // Damping never amplifies.
  rb.small_damp = clamp01(std::isfinite(rb.small_damp) ? rb.small_damp : 0.8);
  rb.medium_damp = clamp01(std::isfinite(rb.medium_damp) ? rb.medium_damp : 0.5);
  rb.large_damp = clamp01(std::isfinite(rb.large_damp) ? rb.large_damp : 0.2);
  rb.small_angle = clamp_finite(rb.small_angle, 0.0, 90.0, 30.0);
  rb.large_angle = clamp_finite(rb.large_angle, rb.small_angle, 90.0, 60.0);
  rb.k0 = clamp_finite(rb.k0, -100.0, 100.0, -1.7);
  rb.s_factor = clamp_finite(rb.s_factor, 0.0, 100.0, 8.0);
  rb.turn_factor = clamp_finite(rb.turn_factor, -90.0, 90.0, 7.0);
  rb.turn_offset = clamp_finite(rb.turn_offset, -90.0, 90.0, 1.0);

  auto& d = c.spawn.detect;
  d.tolerance = std::clamp(d.tolerance, 0, 442);
  d.scan_step = std::clamp(d.scan_step, 1, 64);
  d.side_sample_step = std::clamp(d.side_sample_step, 1, 64);

  c.run.cars = std::clamp(c.run.cars, 1, 256);
  c.run.duration_s = clamp_finite(c.run.duration_s, 0.0, 1.0e6, 60.0);
  c.run.time_scale = clamp_finite(c.run.time_scale, 0.0, 1000.0, 1.0);
}

std::optional<SimConfig> config_from_yaml(const std::string& text) {
  SimConfig c{};
  try {
    const YAML::Node root = YAML::Load(text);
    if (root.IsNull()) {
      sanitize(c);
      return c;
    }
    if (!root.IsMap()) {
      log()->error("config: top level must be a mapping");
      return std::nullopt;
    }

    if (auto n = root["track"]) {
      read(n, "map", c.track.map_path);
      read(n, "scale_factor", c.track.scale_factor);
      c.track.scale_factor = clamp_finite(c.track.scale_factor, 0.05, 10.0, 0.8);
      // Window follows the scale factor unless given explicitly.
      c.track.width_px = static_cast<int>(1920 * c.track.scale_factor);
      c.track.height_px = static_cast<int>(1080 * c.track.scale_factor);
      c.track.margin_px = 10.0 * c.track.scale_factor;
      read(n, "width_px", c.track.width_px);
      read(n, "height_px", c.track.height_px);
      read(n, "track_width_cm", c.track.track_width_cm);
      read(n, "margin_px", c.track.margin_px);
      read(n, "dt", c.track.dt);
    }
    if (auto n = root["car"]) {
      read(n, "length_cm", c.car.length_cm);
      read(n, "width_cm", c.car.width_cm);
      read(n, "wheelbase_cm", c.car.wheelbase_cm);
      read(n, "track_width_cm", c.car.track_width_cm);
      read(n, "wheel_inset_px", c.car.wheel_inset_px);
      read(n, "max_power", c.car.max_power);
      read(n, "initial_power", c.car.initial_power);
      read(n, "min_cover_px", c.car.min_cover_px);
    }
    if (auto n = root["radar"]) {
      read(n, "enabled", c.radar.enabled);
      read(n, "sweep_deg", c.radar.sweep_deg);
      read(n, "step_deg", c.radar.step_deg);
      read(n, "max_len_ratio", c.radar.max_len_ratio);
    }
    if (auto n = root["actuation"]) {
      read(n, "deadzone", c.actuation.deadzone);
      read(n, "min_start_percent", c.actuation.min_start_percent);
      read(n, "counter_thrust_power", c.actuation.counter_thrust_power);
      read(n, "pause_ms", c.actuation.pause_ms);
    }
    if (auto n = root["collision"]) {
      if (auto p = n["policy"]) {
        const auto policy = policy_from_string(p.as<std::string>());
        if (!policy) {
          log()->error("config: unknown collision policy '{}'", p.as<std::string>());
          return std::nullopt;
        }
        c.collision.policy = *policy;
      }
      read(n, "correction_attempts", c.collision.correction_attempts);
      read(n, "correction_step", c.collision.correction_step);
      if (auto rn = n["rebound"]) {
        auto& rb = c.collision.rebound;
        read(rn, "probe_radius", rb.probe_radius);
        read(rn, "probe_step_deg", rb.probe_step_deg);
        read(rn, "probe_pair_deg", rb.probe_pair_deg);
        read(rn, "small_damp", rb.small_damp);
        read(rn, "medium_damp", rb.medium_damp);
        read(rn, "large_damp", rb.large_damp);
        read(rn, "small_angle", rb.small_angle);
        read(rn, "large_angle", rb.large_angle);
        read(rn, "k0", rb.k0);
        read(rn, "s_factor", rb.s_factor);
        read(rn, "turn_factor", rb.turn_factor);
        read(rn, "turn_offset", rb.turn_offset);
      }
    }
    if (auto n = root["controller"]) {
      if (auto k = n["kind"]) {
        const auto kind = controller_kind_from_string(k.as<std::string>());
        if (!kind) {
          log()->error("config: unknown controller kind '{}'", k.as<std::string>());
          return std::nullopt;
        }
        c.controller.kind = *kind;
      }
      if (auto g = n["gains"]) {
        auto& gains = c.controller.gains;
        read(g, "k1", gains.k1);
        read(g, "k2", gains.k2);
        read(g, "k3", gains.k3);
        read(g, "kp1", gains.kp1);
        read(g, "kp2", gains.kp2);
        read(g, "side_threshold_cm", gains.side_threshold_cm);
        read(g, "far_cm", gains.far_cm);
        read(g, "near_cm", gains.near_cm);
        read(g, "max_forward", gains.max_forward);
        read(g, "min_forward", gains.min_forward);
        read(g, "escape_servo", gains.escape_servo);
      }
      if (auto w = n["network"]) {
        auto& net = c.controller.network;
        read(w, "hidden", net.hidden);
        if (w["w_hidden"]) net.w_hidden = read_vector(w["w_hidden"]);
        if (w["b_hidden"]) net.b_hidden = read_vector(w["b_hidden"]);
        if (w["w_out"]) net.w_out = read_vector(w["w_out"]);
        if (w["b_out"]) net.b_out = read_vector(w["b_out"]);
        read(w, "distance_scale_cm", net.distance_scale_cm);
        read(w, "speed_scale", net.speed_scale);
        read(w, "throttle_scale", net.throttle_scale);
        read(w, "servo_scale", net.servo_scale);
        if (!weights_consistent(net)) {
          log()->error("config: network weights do not match hidden={}", net.hidden);
          return std::nullopt;
        }
      }
    }
    if (auto n = root["spawn"]) {
      c.spawn.manual = read_spawn_point(n["manual"]);
      if (auto fb = read_spawn_point(n["fallback"])) c.spawn.fallback = *fb;
      if (auto d = n["detect"]) {
        read(d, "tolerance", c.spawn.detect.tolerance);
        read(d, "scan_step", c.spawn.detect.scan_step);
        read(d, "min_pixels", c.spawn.detect.min_pixels);
        read(d, "border_tolerance", c.spawn.detect.border_tolerance);
      }
    }
    if (auto n = root["run"]) {
      read(n, "cars", c.run.cars);
      read(n, "duration_s", c.run.duration_s);
      read(n, "time_scale", c.run.time_scale);
      read(n, "snapshot_out", c.run.snapshot_out);
    }
    if (auto n = root["log"]) {
      read(n, "level", c.log.level);
      read(n, "pattern", c.log.pattern);
    }
  } catch (const YAML::Exception& e) {
    log()->error("config: {}", e.what());
    return std::nullopt;
  }

  sanitize(c);
  return c;
}

std::optional<SimConfig> load_config(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    log()->error("config: cannot open '{}'", path);
    return std::nullopt;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  auto cfg = config_from_yaml(ss.str());
  if (cfg) log()->info("config: loaded '{}'", path);
  return cfg;
}

} // namespace crazycar
