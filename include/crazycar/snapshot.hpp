#pragma once
#include <optional>
#include <string>
#include <vector>
#include <crazycar/vehicle.hpp>

namespace crazycar {

// Persisted vehicle state. Position is stored divided by the window scale
// factor so records survive a window resize.
struct SnapshotRecord {
  Vec2 position{};
  double heading = 0.0;
  double speed = 0.0;
  double speed_set = 0.0;
  std::vector<RadarReading> radars;
  std::vector<SensorSample> analog_digital;
  double distance = 0.0;
  double time = 0.0;

  std::optional<double> power;
  std::optional<double> steer_angle;
  std::optional<double> raw_throttle;
  std::optional<double> raw_servo;
};

SnapshotRecord snapshot_of(const Vehicle& v, double f_scale = 1.0);

// Rebuilds a vehicle from a record; optional fields default to zero.
Vehicle restore_vehicle(const SnapshotRecord& r, const VehicleParams& params, double f_scale = 1.0);

std::string snapshots_to_yaml(const std::vector<SnapshotRecord>& records);
std::optional<std::vector<SnapshotRecord>> snapshots_from_yaml(const std::string& text);

bool save_snapshots(const std::string& path, const std::vector<SnapshotRecord>& records);
std::optional<std::vector<SnapshotRecord>> load_snapshots(const std::string& path);

} // namespace crazycar
