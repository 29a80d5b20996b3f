#pragma once
#include <optional>
#include <string>
#include <raylib.h>
#include <crazycar/color.hpp>

namespace crazycar {

// ColorMap over a CPU-side raylib Image. Move-only; unloads on destruction.
class TrackImage : public ColorMap {
public:
  // Loads an image file and resizes it to width x height when both are > 0.
  static std::optional<TrackImage> load(const std::string& path, int width = 0, int height = 0);

  // Takes ownership of an already loaded image.
  explicit TrackImage(Image img) : img_(img) {}
  ~TrackImage() override;

  TrackImage(TrackImage&& o) noexcept : img_(o.img_) { o.img_ = Image{}; }
  TrackImage& operator=(TrackImage&& o) noexcept;
  TrackImage(const TrackImage&) = delete;
  TrackImage& operator=(const TrackImage&) = delete;

  int width() const override { return img_.width; }
  int height() const override { return img_.height; }
  Rgba color_at(int x, int y) const override;

  const Image& image() const { return img_; }

private:
  Image img_{};
};

} // namespace crazycar
