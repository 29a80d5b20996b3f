#pragma once
#include <cstddef>
#include <optional>
#include <vector>
#include <crazycar/color.hpp>
#include <crazycar/geom.hpp>

namespace crazycar {

struct Pixel {
  int x = 0;
  int y = 0;
  friend bool operator==(const Pixel&, const Pixel&) = default;
};

struct FinishDetectParams {
  int tolerance = 40;        // RGB distance to the finish color
  int scan_step = 2;         // px between scanned samples (also the connectivity step)
  std::size_t min_pixels = 6;
  int side_sample_start = 8; // px along the normal when scoring a side
  int side_sample_end = 80;
  int side_sample_step = 4;
  int border_tolerance = 60;
};

struct SpawnPoint {
  Vec2 center{};
  double heading = 0.0;   // deg, screen convention
};

struct FinishLineInfo {
  std::size_t pixels = 0;
  Vec2 center{};     // midpoint of the line along its tangent
  Vec2 tangent{};
  Vec2 normal{};
  int sign = 1;      // side of the normal the car starts on
  SpawnPoint spawn{};
};

// Samples every scan_step px; keeps pixels within tolerance of `target` (RGB only).
std::vector<Pixel> collect_color_pixels(const ColorMap& map, Rgba target, int tolerance, int step);

// Largest 4-connected component where neighbours are `step` px apart.
std::vector<Pixel> largest_component(const std::vector<Pixel>& pixels, int step = 1);

// Unit eigenvector of the major axis of the covariance. (1,0) for degenerate input.
Vec2 principal_direction(const std::vector<Pixel>& pixels, Vec2 mean);

// +1 or -1: the side of `dir` from `origin` that sees fewer border pixels.
int choose_side(const ColorMap& map, Vec2 origin, Vec2 dir, Rgba border, const FinishDetectParams& p);

// Finds the finish line and proposes a spawn on its free side, heading away
// from the line. nullopt when fewer than min_pixels finish pixels exist.
std::optional<FinishLineInfo> detect_finish_line(const ColorMap& map,
                                                 int cover_px,
                                                 const FinishDetectParams& p = {},
                                                 Rgba finish = kFinishLineColor,
                                                 Rgba border = kBorderColor);

} // namespace crazycar
