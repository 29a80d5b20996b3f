#include <crazycar/geometry.hpp>
#include <cmath>

namespace crazycar {

static Vec2 polar_offset(Vec2 center, double heading_deg, double offset_deg, double radius) {
  const Vec2 dir = screen_direction(heading_deg + offset_deg);
  return {center.x + dir.x * radius, center.y + dir.y * radius};
}

CornerSet compute_corners(Vec2 center, double heading_deg, double half_length, double half_width) {
  const double diag = std::hypot(half_length, half_width);
  CornerSet out{};
  for (std::size_t i = 0; i < kCornerCount; ++i) {
    out[i] = polar_offset(center, heading_deg, kCornerOffsetsDeg[i], diag);
  }
  return out;
}

WheelPair compute_wheels(Vec2 center, double heading_deg, double reduced_radius) {
  // Same front diagonals as FrontLeft/FrontRight.
  return WheelPair{
    .left  = polar_offset(center, heading_deg, kCornerOffsetsDeg[static_cast<int>(Corner::FrontLeft)], reduced_radius),
    .right = polar_offset(center, heading_deg, kCornerOffsetsDeg[static_cast<int>(Corner::FrontRight)], reduced_radius),
  };
}

Vec2 centroid(const CornerSet& corners) {
  Vec2 sum{};
  for (const auto& p : corners) sum = sum + p;
  return sum * (1.0 / static_cast<double>(kCornerCount));
}

} // namespace crazycar
