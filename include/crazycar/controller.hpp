#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <crazycar/geom.hpp>
#include <crazycar/sensors.hpp>

namespace crazycar {

enum class ControllerKind {
  RuleBased,
  Network,
};

std::optional<ControllerKind> controller_kind_from_string(const std::string& s);
const char* to_string(ControllerKind k);

// Gains and thresholds of the rule-based P controller (distances in cm).
struct RuleGains {
  double k1 = 1.1;
  double k2 = 1.1;
  double k3 = 1.1;
  double kp1 = 1.1;
  double kp2 = 1.1;

  double side_threshold_cm = 130.0;
  double far_cm  = 100.0;
  double near_cm = 50.0;
  double max_forward = 60.0;
  double min_forward = 18.0;   // also the reverse offset
  double escape_servo = 10.0;
};

// Feed-forward net: inputs (right, front, left, speed) -> tanh hidden -> (throttle, servo).
// Row-major weights; hidden == 0 makes the output depend on the biases only.
struct NetworkWeights {
  int hidden = 0;
  std::vector<double> w_hidden;   // hidden x kNetworkInputs
  std::vector<double> b_hidden;   // hidden
  std::vector<double> w_out;      // 2 x hidden
  std::vector<double> b_out{0.0, 0.0};
  double distance_scale_cm = 130.0;
  double speed_scale = 10.0;
  double throttle_scale = 100.0;
  double servo_scale = 10.0;
};

inline constexpr std::size_t kNetworkInputs = 4;

// True when every weight vector matches the declared layer sizes.
bool weights_consistent(const NetworkWeights& w);

struct ControllerConfig {
  ControllerKind kind = ControllerKind::RuleBased;
  RuleGains gains{};
  NetworkWeights network{};
};

// Read-only view of one vehicle for a control decision. Radar order is
// right, front, left (sweep from -offset to +offset).
struct ControlInputs {
  std::vector<int> distances_px;
  std::vector<double> distances_cm;
  std::vector<SensorSample> samples;
  Vec2 position{};
  double heading = 0.0;
  double speed = 0.0;
  double power = 0.0;
  double steer = 0.0;
  double raw_throttle = 0.0;   // previous command
  double raw_servo = 0.0;
};

struct ControlCommand {
  double throttle = 0.0;   // requested power
  double servo = 0.0;      // servo set point before clipping
};

class Controller {
public:
  virtual ~Controller() = default;
  // nullopt when the inputs are insufficient (fewer than three radars).
  virtual std::optional<ControlCommand> compute(const ControlInputs& in) const = 0;
  virtual ControllerKind kind() const = 0;
};

class RuleBasedController : public Controller {
public:
  explicit RuleBasedController(RuleGains g = {}) : g_(g) {}
  std::optional<ControlCommand> compute(const ControlInputs& in) const override;
  ControllerKind kind() const override { return ControllerKind::RuleBased; }
  const RuleGains& gains() const { return g_; }
private:
  RuleGains g_;
};

class NetworkController : public Controller {
public:
  explicit NetworkController(NetworkWeights w);
  std::optional<ControlCommand> compute(const ControlInputs& in) const override;
  ControllerKind kind() const override { return ControllerKind::Network; }
private:
  NetworkWeights w_;
};

std::unique_ptr<Controller> make_controller(const ControllerConfig& cfg);

} // namespace crazycar
