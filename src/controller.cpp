#include <crazycar/controller.hpp>
#include <crazycar/log.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

namespace crazycar {

static std::string lower(std::string s) {
  for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return s;
}

std::optional<ControllerKind> controller_kind_from_string(const std::string& s) {
  const std::string k = lower(s);
  if (k == "rule" || k == "rule_based" || k == "rulebased") return ControllerKind::RuleBased;
  if (k == "network" || k == "nn") return ControllerKind::Network;
  return std::nullopt;
}

const char* to_string(ControllerKind k) {
  switch (k) {
    case ControllerKind::RuleBased: return "rule_based";
    case ControllerKind::Network:   return "network";
  }
  return "rule_based";
}

static inline double finite_or(double v, double fallback) {
  return std::isfinite(v) ? v : fallback;
}

std::optional<ControlCommand> RuleBasedController::compute(const ControlInputs& in) const {
  if (in.distances_cm.size() < 3) {
    log()->trace("controller: skip, {} radar distance(s)", in.distances_cm.size());
    return std::nullopt;
  }
  const double right = in.distances_cm[0];
  const double front = in.distances_cm[1];
  const double left  = in.distances_cm[2];

  double throttle = finite_or(in.raw_throttle, 0.0);
  double servo = finite_or(in.raw_servo, 0.0);

  // Lateral
  if (right < g_.side_threshold_cm || left < g_.side_threshold_cm) {
    servo = -(left - right) * g_.kp2;
  }

  // Longitudinal, three ranges on the front distance
  const double s1 = front * g_.k1;
  const double s2 = front * g_.k2;
  const double s3 = front * g_.k3;
  if (front > g_.far_cm) {
    if (in.power < g_.max_forward) {
      throttle += (s1 - front) * g_.kp1 + g_.min_forward;
      throttle = std::min(throttle, g_.max_forward);
    }
  } else if (front > g_.near_cm) {
    if (in.power > g_.min_forward) {
      throttle -= (s2 - front) * g_.kp1;
      throttle = std::max(throttle, g_.min_forward);
    }
  } else {
    // Too close: back off and steer out.
    throttle = -(s3 - front) * g_.kp1 - g_.min_forward;
    servo = -(right - left) * g_.kp2 - g_.escape_servo;
  }

  return ControlCommand{finite_or(throttle, 0.0), finite_or(servo, 0.0)};
}

bool weights_consistent(const NetworkWeights& w) {
  if (w.hidden < 0) return false;
  const auto h = static_cast<std::size_t>(w.hidden);
  return w.w_hidden.size() == h * kNetworkInputs &&
         w.b_hidden.size() == h &&
         w.w_out.size() == 2 * h &&
         w.b_out.size() == 2;
}

NetworkController::NetworkController(NetworkWeights w) : w_(std::move(w)) {
  if (!weights_consistent(w_)) {
    log()->warn("controller: inconsistent network weights, using an empty network");
    w_ = NetworkWeights{};
  }
}

std::optional<ControlCommand> NetworkController::compute(const ControlInputs& in) const {
  if (in.distances_cm.size() < 3) return std::nullopt;

  const double ds = w_.distance_scale_cm > 0.0 ? w_.distance_scale_cm : 1.0;
  const double vs = w_.speed_scale > 0.0 ? w_.speed_scale : 1.0;
  const double x[kNetworkInputs] = {
      std::clamp(finite_or(in.distances_cm[0] / ds, 0.0), 0.0, 1.0),
      std::clamp(finite_or(in.distances_cm[1] / ds, 0.0), 0.0, 1.0),
      std::clamp(finite_or(in.distances_cm[2] / ds, 0.0), 0.0, 1.0),
      std::clamp(finite_or(in.speed / vs, 0.0), -1.0, 1.0),
  };

  const auto h = static_cast<std::size_t>(w_.hidden);
  std::vector<double> act(h, 0.0);
  for (std::size_t j = 0; j < h; ++j) {
    double z = w_.b_hidden[j];
    for (std::size_t i = 0; i < kNetworkInputs; ++i) z += w_.w_hidden[j * kNetworkInputs + i] * x[i];
    act[j] = std::tanh(z);
  }

  double out[2] = {w_.b_out[0], w_.b_out[1]};
  for (std::size_t k = 0; k < 2; ++k) {
    for (std::size_t j = 0; j < h; ++j) out[k] += w_.w_out[k * h + j] * act[j];
  }

  return ControlCommand{
      finite_or(std::tanh(out[0]) * w_.throttle_scale, 0.0),
      finite_or(std::tanh(out[1]) * w_.servo_scale, 0.0),
  };
}

std::unique_ptr<Controller> make_controller(const ControllerConfig& cfg) {
  switch (cfg.kind) {
    case ControllerKind::Network:
      return std::make_unique<NetworkController>(cfg.network);
    case ControllerKind::RuleBased:
      break;
  }
  return std::make_unique<RuleBasedController>(cfg.gains);
}

} // namespace crazycar
