#include <crazycar/snapshot.hpp>
#include <crazycar/log.hpp>
#include <cmath>
#include <fstream>
#include <sstream>
#include <utility>
#include <yaml-cpp/yaml.h>

namespace crazycar {

static double safe_scale(double f) {
  return (std::isfinite(f) && f != 0.0) ? f : 1.0;
}

SnapshotRecord snapshot_of(const Vehicle& v, double f_scale) {
  const auto& s = v.state();
  const double f = safe_scale(f_scale);
  SnapshotRecord r{};
  r.position = Vec2{s.position.x / f, s.position.y / f};
  r.heading = s.heading;
  r.speed = s.speed;
  r.speed_set = s.speed_set;
  r.radars = s.radars;
  r.analog_digital = s.samples;
  r.distance = s.distance;
  r.time = s.time;
  r.power = s.power;
  r.steer_angle = s.steer;
  r.raw_throttle = s.raw_throttle;
  r.raw_servo = s.raw_servo;
  return r;
}

Vehicle restore_vehicle(const SnapshotRecord& r, const VehicleParams& params, double f_scale) {
  const double f = safe_scale(f_scale);
  Vehicle v(params, Vec2{r.position.x * f, r.position.y * f}, r.heading, r.power.value_or(0.0));
  auto& s = v.state();
  s.speed = std::isfinite(r.speed) ? r.speed : 0.0;
  s.speed_set = r.speed_set;
  s.radars = r.radars;
  s.radar_distances = radar_distances(r.radars);
  s.samples = r.analog_digital;
  s.distance = r.distance;
  s.time = r.time;
  s.steer = r.steer_angle.value_or(0.0);
  s.raw_throttle = r.raw_throttle.value_or(s.power);
  s.raw_servo = r.raw_servo.value_or(0.0);
  return v;
}

static YAML::Node point_node(Vec2 p) {
  YAML::Node n(YAML::NodeType::Sequence);
  n.SetStyle(YAML::EmitterStyle::Flow);
  n.push_back(p.x);
  n.push_back(p.y);
  return n;
}

std::string snapshots_to_yaml(const std::vector<SnapshotRecord>& records) {
  YAML::Node root(YAML::NodeType::Sequence);
  for (const auto& r : records) {
    YAML::Node n;
    n["position"] = point_node(r.position);
    n["heading"] = r.heading;
    n["speed"] = r.speed;
    n["speed_set"] = r.speed_set;

    YAML::Node radars(YAML::NodeType::Sequence);
    for (const auto& rd : r.radars) {
      YAML::Node item(YAML::NodeType::Sequence);
      item.SetStyle(YAML::EmitterStyle::Flow);
      item.push_back(point_node(rd.endpoint));
      item.push_back(rd.distance);
      radars.push_back(item);
    }
    n["radars"] = radars;

    YAML::Node ad(YAML::NodeType::Sequence);
    for (const auto& smp : r.analog_digital) {
      YAML::Node item(YAML::NodeType::Sequence);
      item.SetStyle(YAML::EmitterStyle::Flow);
      item.push_back(smp.digital_bit);
      item.push_back(smp.analog_volt);
      ad.push_back(item);
    }
    n["analog_digital"] = ad;
    n["distance"] = r.distance;
    n["time"] = r.time;

    if (r.power) n["power"] = *r.power;
    if (r.steer_angle) n["steer_angle"] = *r.steer_angle;
    if (r.raw_throttle) n["raw_throttle"] = *r.raw_throttle;
    if (r.raw_servo) n["raw_servo"] = *r.raw_servo;
    root.push_back(n);
  }
  YAML::Emitter out;
  out << root;
  return std::string(out.c_str());
}

static Vec2 read_point(const YAML::Node& n) {
  if (!n || !n.IsSequence() || n.size() != 2) throw YAML::Exception(YAML::Mark::null_mark(), "expected [x, y]");
  return Vec2{n[0].as<double>(), n[1].as<double>()};
}

static std::optional<double> read_optional(const YAML::Node& n, const char* key) {
  if (auto v = n[key]) return v.as<double>();
  return std::nullopt;
}

std::optional<std::vector<SnapshotRecord>> snapshots_from_yaml(const std::string& text) {
  std::vector<SnapshotRecord> out;
  try {
    const YAML::Node root = YAML::Load(text);
    if (root.IsNull()) return out;
    if (!root.IsSequence()) {
      log()->error("snapshot: document must be a list of records");
      return std::nullopt;
    }
    for (const auto& n : root) {
      SnapshotRecord r{};
      r.position = read_point(n["position"]);
      r.heading = n["heading"].as<double>();
      r.speed = n["speed"].as<double>();
      r.speed_set = n["speed_set"].as<double>(0.0);
      if (auto radars = n["radars"]) {
        for (const auto& item : radars) {
          if (!item.IsSequence() || item.size() != 2) throw YAML::Exception(YAML::Mark::null_mark(), "expected [[x, y], d]");
          r.radars.push_back(RadarReading{read_point(item[0]), item[1].as<int>()});
        }
      }
      if (auto ad = n["analog_digital"]) {
        for (const auto& item : ad) {
          if (!item.IsSequence() || item.size() != 2) throw YAML::Exception(YAML::Mark::null_mark(), "expected [bit, volt]");
          r.analog_digital.push_back(SensorSample{item[0].as<int>(), item[1].as<double>()});
        }
      }
      r.distance = n["distance"].as<double>(0.0);
      r.time = n["time"].as<double>(0.0);
      r.power = read_optional(n, "power");
      r.steer_angle = read_optional(n, "steer_angle");
      r.raw_throttle = read_optional(n, "raw_throttle");
      r.raw_servo = read_optional(n, "raw_servo");
      out.push_back(std::move(r));
    }
  } catch (const YAML::Exception& e) {
    log()->error("snapshot: {}", e.what());
    return std::nullopt;
  }
  return out;
}

bool save_snapshots(const std::string& path, const std::vector<SnapshotRecord>& records) {
  std::ofstream f(path, std::ios::out | std::ios::trunc);
  if (!f) {
    log()->error("snapshot: cannot write '{}'", path);
    return false;
  }
  f << snapshots_to_yaml(records) << '\n';
  if (!f) {
    log()->error("snapshot: write failed for '{}'", path);
    return false;
  }
  log()->info("snapshot: saved {} record(s) to '{}'", records.size(), path);
  return true;
}

std::optional<std::vector<SnapshotRecord>> load_snapshots(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    log()->error("snapshot: cannot open '{}'", path);
    return std::nullopt;
  }
  std::stringstream ss;
  ss << f.rdbuf();
  auto records = snapshots_from_yaml(ss.str());
  if (records) log()->info("snapshot: loaded {} record(s) from '{}'", records->size(), path);
  return records;
}

} // namespace crazycar
