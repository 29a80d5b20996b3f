#pragma once
#include <vector>
#include <crazycar/actuation.hpp>
#include <crazycar/collision.hpp>
#include <crazycar/config.hpp>
#include <crazycar/controller.hpp>
#include <crazycar/dynamics.hpp>
#include <crazycar/geometry.hpp>
#include <crazycar/sensors.hpp>
#include <crazycar/units.hpp>

namespace crazycar {

// Pixel-space vehicle geometry and world bounds derived from SimConfig.
struct VehicleParams {
  UnitConverter units{};
  double length_px = 32.0;
  double width_px = 16.0;
  int cover_px = 32;               // square sprite box; position is its top-left
  double wheelbase_px = 25.0;
  double track_width_px = 10.0;
  double wheel_inset_px = 6.0;

  double world_width = 1536.0;
  double world_height = 864.0;
  double margin_px = 8.0;
  double dt = kDefaultDt;

  RadarConfig radar{};
  double max_radar_len = 0.0;      // px
  ActuationParams actuation{};
};

// Converts the car's cm dimensions to px. Non-positive results fall back to
// a 32x16 px body and a 25/10 px wheelbase/track width.
VehicleParams make_vehicle_params(const SimConfig& cfg);

struct VehicleState {
  Vec2 position{};        // top-left of the cover box
  Vec2 center{};
  double heading = 0.0;   // deg, [0, 360)
  double speed = 0.0;     // px/tick, signed
  double speed_set = 0.0;
  double power = 0.0;
  double steer = 0.0;     // deg
  double distance = 0.0;  // px
  double time = 0.0;      // s

  bool alive = true;
  bool finished = false;
  double lap_time = 0.0;
  bool control_enabled = true;

  CornerSet corners{};
  WheelPair wheels{};
  std::vector<RadarReading> radars;
  std::vector<int> radar_distances;
  std::vector<SensorSample> samples;

  double raw_throttle = 0.0;
  double raw_servo = 0.0;
};

// Distance and time bookkeeping, steering, translation, clamping to the
// world margin and the center update. One tick.
void step_motion(VehicleState& s, const VehicleParams& p);

class Vehicle : public SpeedModel {
public:
  Vehicle(VehicleParams params, Vec2 position, double heading, double power = 0.0);

  const VehicleState& state() const { return s_; }
  VehicleState& state() { return s_; }
  const VehicleParams& params() const { return p_; }
  const PowerSequencer& sequencer() const { return seq_; }

  // Integrates speed for the given power against the current steer angle.
  double speed_for_power(double power) override;

  // Applies a controller command: steer from the servo value, power through
  // the sequencer (a reverse request may start a multi-tick sequence).
  void actuate(const ControlCommand& cmd);

  // One simulation tick. Dead vehicles are left untouched.
  void tick(const ColorMap& map,
            const CollisionConfig& collision,
            bool sensors_enabled = true,
            LapListener* listener = nullptr);

  ControlInputs control_inputs() const;

  bool alive() const { return s_.alive; }
  bool finished() const { return s_.finished; }
  double lap_time() const { return s_.lap_time; }
  double reward() const;
  double target_speed() const;

  // Recomputes center, corners and wheels from position and heading.
  void refresh_geometry();

private:
  void update_geometry_();
  void update_sensors_(const ColorMap& map);

  VehicleParams p_;
  VehicleState s_;
  PowerSequencer seq_;
};

} // namespace crazycar
