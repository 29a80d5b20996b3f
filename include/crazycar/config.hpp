#pragma once
#include <optional>
#include <string>
#include <crazycar/actuation.hpp>
#include <crazycar/collision.hpp>
#include <crazycar/controller.hpp>
#include <crazycar/log.hpp>
#include <crazycar/spawn.hpp>
#include <crazycar/units.hpp>

namespace crazycar {

struct TrackConfig {
  std::string map_path;           // track image; empty for synthetic maps
  double scale_factor = 0.8;      // window = 1920x1080 * f
  int width_px = 1536;
  int height_px = 864;
  double track_width_cm = kTrackWidthCm;
  double margin_px = 8.0;         // position clamp (10 * f)
  double dt = 0.01;               // seconds per tick
};

// Real-world car dimensions; converted to px per track scale.
struct CarConfig {
  double length_cm = 40.0;
  double width_cm = 20.0;
  double wheelbase_cm = 25.0;
  double track_width_cm = 10.0;
  double wheel_inset_px = 6.0;    // front wheel radius = diagonal - inset
  double max_power = 100.0;
  double initial_power = 20.0;
  int min_cover_px = 16;
};

struct RadarConfig {
  bool enabled = true;
  int sweep_deg = kRadarSweepDeg;
  int step_deg = kRadarSweepDeg;
  double max_len_ratio = kMaxRadarLenRatio;   // of the track width in px
};

struct SpawnConfig {
  std::optional<SpawnPoint> manual;           // overrides finish line detection
  FinishDetectParams detect{};
  SpawnPoint fallback{Vec2{160.0, 160.0}, 0.0};
};

struct RunConfig {
  int cars = 1;
  double duration_s = 60.0;       // simulated seconds
  double time_scale = 1.0;        // runner pacing, 0 = as fast as possible
  std::string snapshot_out;       // written at the end when set
};

struct SimConfig {
  TrackConfig track{};
  CarConfig car{};
  RadarConfig radar{};
  ActuationParams actuation{};
  CollisionConfig collision{};
  ControllerConfig controller{};
  SpawnConfig spawn{};
  RunConfig run{};
  LogConfig log{};

  UnitConverter units() const { return UnitConverter(track.width_px, track.track_width_cm); }
};

// Parses a YAML document. Missing keys keep their defaults, numeric values are
// clamped into range, unknown enum names or malformed YAML yield nullopt.
std::optional<SimConfig> config_from_yaml(const std::string& text);

std::optional<SimConfig> load_config(const std::string& path);

// Re-applies the range clamps (also used after programmatic edits).
void sanitize(SimConfig& cfg);

} // namespace crazycar
