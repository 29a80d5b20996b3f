#pragma once
#include <cmath>
#include <limits>
#include <numbers>

namespace crazycar {

// Constant naming convention (kCamelCase)
inline constexpr double kPI  = std::numbers::pi_v<double>;
inline constexpr double kTAU = 2.0 * kPI;

// Screen raster convention: x right, y down, headings in degrees.
struct Vec2 {
  double x{};
  double y{};
};

inline Vec2 operator+(Vec2 a, Vec2 b) { return {a.x + b.x, a.y + b.y}; }
inline Vec2 operator-(Vec2 a, Vec2 b) { return {a.x - b.x, a.y - b.y}; }
inline Vec2 operator*(Vec2 a, double k) { return {a.x * k, a.y * k}; }

inline double length(Vec2 v) { return std::hypot(v.x, v.y); }
inline double dot(Vec2 a, Vec2 b) { return a.x * b.x + a.y * b.y; }

inline constexpr double deg_to_rad(double deg) { return deg * kPI / 180.0; }
inline constexpr double rad_to_deg(double rad) { return rad * 180.0 / kPI; }

inline bool finite(Vec2 v) { return std::isfinite(v.x) && std::isfinite(v.y); }

// Wrap into [0, 360). Non-finite input maps to 0.
inline double normalize_angle(double deg) {
  if (!std::isfinite(deg)) return 0.0;
  double a = std::fmod(deg, 360.0);
  if (a < 0.0) a += 360.0;
  if (a >= 360.0) a = 0.0; // fmod(-tiny) + 360 rounds up to 360
  return a;
}

// Unit vector for a heading measured clockwise on screen (360 - heading).
inline Vec2 screen_direction(double heading_deg) {
  const double r = deg_to_rad(360.0 - heading_deg);
  return {std::cos(r), std::sin(r)};
}

// Truncates toward zero like a pixel cast; NaN -> 0, huge values saturate.
inline int trunc_px(double v) {
  if (std::isnan(v)) return 0;
  constexpr double kLimit = 1.0e9;
  if (v > kLimit) return static_cast<int>(kLimit);
  if (v < -kLimit) return -static_cast<int>(kLimit);
  return static_cast<int>(v);
}

} // namespace crazycar
