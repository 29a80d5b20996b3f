#pragma once
#include <vector>
#include <crazycar/color.hpp>
#include <crazycar/geom.hpp>

namespace crazycar {

inline constexpr int    kRadarSweepDeg       = 60;
inline constexpr double kMaxRadarLenRatio    = 130.0 / 1900.0;

// Inverse-distance sensor response (distance in cm).
namespace da {
inline constexpr double kBitA  = 23962.0;
inline constexpr double kBitB  = -20.0;
inline constexpr double kVoltA = 58.5;
inline constexpr double kVoltB = -0.05;
} // namespace da

struct RadarReading {
  Vec2 endpoint{};
  int distance = 0;   // px, truncated
};

struct SensorSample {
  int digital_bit = 0;
  double analog_volt = 0.0;

  friend bool operator==(const SensorSample&, const SensorSample&) = default;
};

// Marches 1 px at a time along heading+offset from center until the border
// color is sampled or max_len is reached. Off-map reads count as border.
RadarReading cast_radar(Vec2 center,
                        double heading_deg,
                        double offset_deg,
                        const ColorMap& map,
                        double max_len,
                        Rgba border = kBorderColor);

// Rays from -sweep to +sweep inclusive in step increments.
std::vector<RadarReading> collect_radars(Vec2 center,
                                         double heading_deg,
                                         int sweep_deg,
                                         int step_deg,
                                         const ColorMap& map,
                                         double max_len,
                                         Rgba border = kBorderColor);

std::vector<int> radar_distances(const std::vector<RadarReading>& readings);

SensorSample linearize_da(double distance_cm);
std::vector<SensorSample> linearize_da(const std::vector<double>& distances_cm);

inline double default_max_radar_len(double width_px) { return width_px * kMaxRadarLenRatio; }

} // namespace crazycar
