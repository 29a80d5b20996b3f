#include <crazycar/color.hpp>
#include <algorithm>

namespace crazycar {

RasterMap::RasterMap(int width, int height, Rgba fill)
  : width_(std::max(0, width)),
    height_(std::max(0, height)),
    pixels_(static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_), fill) {}

void RasterMap::set(int x, int y, Rgba c) {
  if (!contains(x, y)) return;
  pixels_[static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) + static_cast<std::size_t>(x)] = c;
}

void RasterMap::fill_rect(int x0, int y0, int x1, int y1, Rgba c) {
  x0 = std::clamp(x0, 0, width_);
  x1 = std::clamp(x1, 0, width_);
  y0 = std::clamp(y0, 0, height_);
  y1 = std::clamp(y1, 0, height_);
  for (int y = y0; y < y1; ++y)
    for (int x = x0; x < x1; ++x)
      pixels_[static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) + static_cast<std::size_t>(x)] = c;
}

} // namespace crazycar
