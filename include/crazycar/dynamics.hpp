#pragma once
#include <crazycar/units.hpp>

namespace crazycar {

// Empirical fits measured on the physical car (cm/s, divided by 100).
namespace fit {
// a = c0*v + c1*p^2 + c2*p
inline constexpr double kAccelSpeed     = -2.179;
inline constexpr double kAccelPowerQuad = 0.155;
inline constexpr double kAccelPowerLin  = 7.015;
inline constexpr double kAccelScale     = 100.0;

// Straight: vmax = c0*p^2 + c1*p + c2
inline constexpr double kVmaxStraightQuad  = -0.0496;
inline constexpr double kVmaxStraightLin   = 9.008;
inline constexpr double kVmaxStraightConst = 31.8089;
inline constexpr double kVmaxStraightScale = 100.0;

// Curve: vmax = c0*p^c1 + c2
inline constexpr double kVmaxCurveCoeff = -81562.0;
inline constexpr double kVmaxCurveExp   = -2.47;
inline constexpr double kVmaxCurveConst = 215.5123;
inline constexpr double kVmaxCurveScale = 100.0;

inline constexpr double kCurveSteerThresholdDeg = 5.0;
} // namespace fit

inline constexpr double kDefaultDt = 0.01; // seconds per tick

// Top speed (real units) for |power|; straight regime below the steer threshold.
double max_speed_cm(double power, double steer_deg);

// Acceleration (real units) from current real speed and |power|.
double acceleration_cm(double speed_cm, double power);

// Straight-line reference speed in px for signed power. Not integrated.
double target_speed(double power, const UnitConverter& units);

// One Euler step of speed (px/tick). Negative power integrates the mirrored
// problem and flips the result back. Exceeding vmax snaps to vmax with the
// sign of the incoming speed. Zero power yields zero speed.
double step_speed(double speed_px,
                  double power,
                  double steer_deg,
                  const UnitConverter& units,
                  double dt = kDefaultDt);

} // namespace crazycar
