#pragma once
#include <array>
#include <cstddef>
#include <crazycar/geom.hpp>

namespace crazycar {

// Corner enumeration order is the collision tie-break: the first corner in
// this order that touches the border wins. FrontRight is also the only
// corner that can trigger the finish line.
enum class Corner : int {
  FrontRight = 0,
  FrontLeft  = 1,
  RearLeft   = 2,
  RearRight  = 3,
};

inline constexpr std::size_t kCornerCount = 4;

// Angular offsets (deg) from heading, in Corner order.
inline constexpr std::array<double, kCornerCount> kCornerOffsetsDeg{23.0, -23.0, 157.0, 203.0};

using CornerSet = std::array<Vec2, kCornerCount>;

inline Corner corner_at(std::size_t idx) { return static_cast<Corner>(idx); }
inline bool is_rear(Corner c) { return c == Corner::RearLeft || c == Corner::RearRight; }

struct WheelPair {
  Vec2 left{};
  Vec2 right{};
};

// Corners at radius hypot(half_length, half_width) around center.
CornerSet compute_corners(Vec2 center, double heading_deg, double half_length, double half_width);

// Front wheel reference points on the two front diagonals at reduced_radius.
WheelPair compute_wheels(Vec2 center, double heading_deg, double reduced_radius);

Vec2 centroid(const CornerSet& corners);

} // namespace crazycar
