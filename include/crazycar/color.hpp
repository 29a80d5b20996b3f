#pragma once
#include <cstdint>
#include <vector>

namespace crazycar {

struct Rgba {
  std::uint8_t r{};
  std::uint8_t g{};
  std::uint8_t b{};
  std::uint8_t a{255};

  friend bool operator==(const Rgba&, const Rgba&) = default;
};

inline constexpr Rgba kBorderColor{255, 255, 255, 255};     // track border (crash)
inline constexpr Rgba kFinishLineColor{237, 28, 36, 255};   // finish line (red)

// Read-only raster lookup. color_at() is only called with in-bounds
// coordinates; implementations must be safe for concurrent reads.
class ColorMap {
public:
  virtual ~ColorMap() = default;
  virtual int width() const = 0;
  virtual int height() const = 0;
  virtual Rgba color_at(int x, int y) const = 0;

  bool contains(int x, int y) const {
    return x >= 0 && y >= 0 && x < width() && y < height();
  }
};

// Bounds-guarded read: anything off the raster reads as `outside`.
inline Rgba sample_color(const ColorMap& map, int x, int y, Rgba outside) {
  if (!map.contains(x, y)) return outside;
  return map.color_at(x, y);
}

// Plain row-major in-memory raster.
class RasterMap : public ColorMap {
public:
  RasterMap() = default;
  RasterMap(int width, int height, Rgba fill = Rgba{0, 0, 0, 255});

  int width() const override { return width_; }
  int height() const override { return height_; }
  Rgba color_at(int x, int y) const override {
    return pixels_[static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) + static_cast<std::size_t>(x)];
  }

  void set(int x, int y, Rgba c);
  // Fills the half-open rectangle [x0,x1) x [y0,y1), clipped to the raster.
  void fill_rect(int x0, int y0, int x1, int y1, Rgba c);

private:
  int width_{0};
  int height_{0};
  std::vector<Rgba> pixels_;
};

} // namespace crazycar
