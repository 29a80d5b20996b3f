#include <crazycar/actuation.hpp>
#include <crazycar/log.hpp>
#include <cmath>

namespace crazycar {

double servo_to_angle(double servo) {
  if (!std::isfinite(servo) || servo == 0.0) return 0.0;
  const bool negative = servo < 0.0;
  const double s = std::abs(servo);
  const double angle = 0.03 * s * s + 0.97 * s + 2.23;
  return negative ? -angle : angle;
}

double clip_steer(double value, double min_deg, double max_deg) {
  if (value == 0.0 || std::isnan(value)) return 0.0;
  if (value >= max_deg) return max_deg;
  if (value <= min_deg) return min_deg;
  return value;
}

void PowerSequencer::reset() {
  phase_ = ReversePhase::Idle;
  remaining_ms_ = 0.0;
  pending_power_ = 0.0;
}

PowerUpdate PowerSequencer::enter_(ReversePhase phase, double power, SpeedModel& speed) {
  phase_ = phase;
  remaining_ms_ = static_cast<double>(p_.pause_ms > 0 ? p_.pause_ms : 0);
  return PowerUpdate{power, speed.speed_for_power(power)};
}

PowerUpdate PowerSequencer::command(double requested, double current_power, double current_speed,
                                    SpeedModel& speed) {
  const PowerUpdate unchanged{current_power, current_speed};
  if (!std::isfinite(requested)) return unchanged;

  const double dz = p_.deadzone;
  const double maxp = p_.max_power;

  // Dead zone
  if (-dz < requested && requested < dz) {
    reset();
    log()->trace("actuation: request={:.1f} in deadzone={:.1f} -> power=0", requested, dz);
    return PowerUpdate{0.0, speed.speed_for_power(0.0)};
  }

  // Forward band
  if (dz <= requested && requested <= maxp) {
    reset();
    double power = requested;
    const double min_start = maxp * p_.min_start_percent;
    if (0.0 < requested && requested < min_start) power = min_start;
    return PowerUpdate{power, speed.speed_for_power(power)};
  }

  // Reverse band
  if (-maxp <= requested && requested <= -dz) {
    if (in_sequence()) {
      // Already braking: retarget the final reverse value only.
      pending_power_ = requested;
      return unchanged;
    }
    if (current_power > 0.0) {
      pending_power_ = requested;
      log()->debug("actuation: reverse request={:.1f} from power={:.1f}, counter-thrust", requested, current_power);
      return enter_(ReversePhase::CounterThrust, p_.counter_thrust_power, speed);
    }
    return PowerUpdate{requested, speed.speed_for_power(requested)};
  }

  // Outside all bands: fail-safe, keep state.
  return unchanged;
}

PowerUpdate PowerSequencer::advance(double elapsed_ms, double current_power, double current_speed,
                                    SpeedModel& speed) {
  PowerUpdate out{current_power, current_speed};
  if (phase_ == ReversePhase::Idle) return out;
  if (std::isfinite(elapsed_ms) && elapsed_ms > 0.0) remaining_ms_ -= elapsed_ms;

  while (phase_ != ReversePhase::Idle && remaining_ms_ <= 0.0) {
    const double overshoot = remaining_ms_;
    if (phase_ == ReversePhase::CounterThrust) {
      out = enter_(ReversePhase::Freewheel, 0.0, speed);
      remaining_ms_ += overshoot;
    } else {
      const double target = pending_power_;
      reset();
      out = PowerUpdate{target, speed.speed_for_power(target)};
      log()->debug("actuation: reverse engaged power={:.1f}", target);
    }
  }
  return out;
}

PowerUpdate apply_power(double requested,
                        double current_power,
                        double current_speed,
                        const ActuationParams& params,
                        SpeedModel& speed,
                        Delay& delay) {
  PowerSequencer seq(params);
  PowerUpdate up = seq.command(requested, current_power, current_speed, speed);
  while (seq.in_sequence()) {
    const int ms = static_cast<int>(std::ceil(seq.remaining_ms()));
    delay.wait_ms(ms);
    up = seq.advance(static_cast<double>(ms), up.power, up.speed, speed);
  }
  return up;
}

} // namespace crazycar
