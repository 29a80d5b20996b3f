#pragma once

namespace crazycar {

// Servo set point -> physical steering angle (deg), from servo calibration:
// 0.03*s^2 + 0.97*s + 2.23 on |s|, sign restored. Zero stays zero.
double servo_to_angle(double servo);

// Clamp a steering request to the mechanical range. Zero stays zero.
double clip_steer(double value, double min_deg = -10.0, double max_deg = 10.0);

struct ActuationParams {
  double max_power = 100.0;
  double deadzone = 18.0;            // |request| below this -> power 0
  double min_start_percent = 0.08;   // forward floor as a fraction of max_power
  double counter_thrust_power = -30.0;
  int    pause_ms = 10;              // hold time of counter-thrust and freewheel
};

// Recomputes speed for a power value (couples actuation to the dynamics).
class SpeedModel {
public:
  virtual ~SpeedModel() = default;
  virtual double speed_for_power(double power) = 0;
};

// A scheduled wait of N milliseconds.
class Delay {
public:
  virtual ~Delay() = default;
  virtual void wait_ms(int ms) = 0;
};

// Never sleeps; only accumulates the requested virtual time.
class VirtualDelay : public Delay {
public:
  void wait_ms(int ms) override { if (ms > 0) elapsed_ms_ += ms; }
  long long elapsed_ms() const { return elapsed_ms_; }
private:
  long long elapsed_ms_{0};
};

struct PowerUpdate {
  double power = 0.0;
  double speed = 0.0;
};

enum class ReversePhase {
  Idle,           // no sequence in flight
  CounterThrust,  // braking forward momentum
  Freewheel,      // coasting before reverse engages
};

// Motor power bands plus the reverse engagement sequence
//   CounterThrust -> Freewheel -> requested reverse power
// driven by virtual time. command() starts or applies a request,
// advance() moves an in-flight sequence forward.
class PowerSequencer {
public:
  explicit PowerSequencer(ActuationParams params = {}) : p_(params) {}

  PowerUpdate command(double requested, double current_power, double current_speed, SpeedModel& speed);
  PowerUpdate advance(double elapsed_ms, double current_power, double current_speed, SpeedModel& speed);

  ReversePhase phase() const { return phase_; }
  bool in_sequence() const { return phase_ != ReversePhase::Idle; }
  double remaining_ms() const { return remaining_ms_; }
  double pending_power() const { return pending_power_; }
  const ActuationParams& params() const { return p_; }

  void reset();

private:
  PowerUpdate enter_(ReversePhase phase, double power, SpeedModel& speed);

  ActuationParams p_;
  ReversePhase phase_{ReversePhase::Idle};
  double remaining_ms_{0.0};
  double pending_power_{0.0};
};

// Synchronous form: runs the whole sequence, calling delay.wait_ms() for each
// pause. Returns the final power and speed.
PowerUpdate apply_power(double requested,
                        double current_power,
                        double current_speed,
                        const ActuationParams& params,
                        SpeedModel& speed,
                        Delay& delay);

} // namespace crazycar
