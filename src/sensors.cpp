#include <crazycar/sensors.hpp>
#include <cmath>

namespace crazycar {

RadarReading cast_radar(Vec2 center,
                        double heading_deg,
                        double offset_deg,
                        const ColorMap& map,
                        double max_len,
                        Rgba border) {
  if (!finite(center) || !std::isfinite(heading_deg) || !std::isfinite(offset_deg)) {
    return RadarReading{center, 0};
  }
  const int limit = std::isfinite(max_len) && max_len > 0.0 ? trunc_px(max_len) : 0;
  const Vec2 dir = screen_direction(heading_deg + offset_deg);

  int len = 0;
  int x = trunc_px(center.x);
  int y = trunc_px(center.y);
  while (!(sample_color(map, x, y, border) == border) && len < limit) {
    ++len;
    x = trunc_px(center.x + dir.x * len);
    y = trunc_px(center.y + dir.y * len);
  }

  const double d = std::hypot(x - center.x, y - center.y);
  // Truncation to pixel cells can land a hair past the cap; keep the invariant.
  int dist = trunc_px(d);
  if (dist > limit) dist = limit;
  if (dist < 0) dist = 0;
  return RadarReading{Vec2{static_cast<double>(x), static_cast<double>(y)}, dist};
}

std::vector<RadarReading> collect_radars(Vec2 center,
                                         double heading_deg,
                                         int sweep_deg,
                                         int step_deg,
                                         const ColorMap& map,
                                         double max_len,
                                         Rgba border) {
  std::vector<RadarReading> out;
  if (sweep_deg < 0) sweep_deg = -sweep_deg;
  if (step_deg <= 0) {
    out.push_back(cast_radar(center, heading_deg, 0.0, map, max_len, border));
    return out;
  }
  for (int deg = -sweep_deg; deg <= sweep_deg; deg += step_deg) {
    out.push_back(cast_radar(center, heading_deg, static_cast<double>(deg), map, max_len, border));
  }
  return out;
}

std::vector<int> radar_distances(const std::vector<RadarReading>& readings) {
  std::vector<int> out;
  out.reserve(readings.size());
  for (const auto& r : readings) out.push_back(r.distance);
  return out;
}

SensorSample linearize_da(double d) {
  if (!std::isfinite(d) || d <= 0.0) return SensorSample{};
  const double bit = std::floor(da::kBitA / d + da::kBitB);
  return SensorSample{trunc_px(bit), da::kVoltA / d + da::kVoltB};
}

std::vector<SensorSample> linearize_da(const std::vector<double>& distances_cm) {
  std::vector<SensorSample> out;
  out.reserve(distances_cm.size());
  for (double d : distances_cm) out.push_back(linearize_da(d));
  return out;
}

} // namespace crazycar
