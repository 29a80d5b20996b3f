#include <crazycar/dynamics.hpp>
#include <cmath>

namespace crazycar {

double max_speed_cm(double power, double steer_deg) {
  const double p = std::abs(power);
  if (steer_deg < fit::kCurveSteerThresholdDeg) {
    return (fit::kVmaxStraightQuad * p * p + fit::kVmaxStraightLin * p + fit::kVmaxStraightConst)
           / fit::kVmaxStraightScale;
  }
  return (fit::kVmaxCurveCoeff * std::pow(p, fit::kVmaxCurveExp) + fit::kVmaxCurveConst)
         / fit::kVmaxCurveScale;
}

double acceleration_cm(double speed_cm, double power) {
  const double p = std::abs(power);
  return (fit::kAccelSpeed * speed_cm + fit::kAccelPowerQuad * p * p + fit::kAccelPowerLin * p)
         / fit::kAccelScale;
}

double target_speed(double power, const UnitConverter& units) {
  if (!std::isfinite(power)) return 0.0;
  const double v_cm = (fit::kVmaxStraightQuad * power * power + fit::kVmaxStraightLin * power
                       + fit::kVmaxStraightConst) / fit::kVmaxStraightScale;
  return units.to_px(v_cm);
}

double step_speed(double speed_px,
                  double power,
                  double steer_deg,
                  const UnitConverter& units,
                  double dt) {
  if (!std::isfinite(speed_px) || !std::isfinite(power) ||
      !std::isfinite(steer_deg) || !std::isfinite(dt)) {
    return 0.0;
  }

  double v = units.to_cm(speed_px);
  double p = power;
  bool turnback = false;
  if (p < 0.0) {
    p = -p;
    v = -v;
    turnback = true;
  }

  double v_new = 0.0;
  if (p != 0.0) {
    const double vmax = max_speed_cm(p, steer_deg);
    const double a = acceleration_cm(v, p);
    const double candidate = v + a * dt;
    if (std::isfinite(candidate) && std::abs(candidate) <= std::abs(vmax)) {
      v_new = candidate;
    } else {
      // Snap to the boundary, no bounce.
      v_new = v >= 0.0 ? vmax : -vmax;
    }
  }

  const double out = units.to_px(turnback ? -v_new : v_new);
  return std::isfinite(out) ? out : 0.0;
}

} // namespace crazycar
