#include <crazycar/track_image.hpp>
#include <crazycar/log.hpp>

namespace crazycar {

std::optional<TrackImage> TrackImage::load(const std::string& path, int width, int height) {
  if (!FileExists(path.c_str())) {
    log()->error("track: file not found '{}'", path);
    return std::nullopt;
  }
  Image img = LoadImage(path.c_str());
  if (img.data == nullptr || img.width <= 0 || img.height <= 0) {
    log()->error("track: cannot decode '{}'", path);
    if (img.data != nullptr) UnloadImage(img);
    return std::nullopt;
  }
  if (width > 0 && height > 0 && (img.width != width || img.height != height)) {
    // Nearest neighbour keeps the border and finish colors exact.
    ImageResizeNN(&img, width, height);
  }
  log()->info("track: loaded '{}' ({}x{})", path, img.width, img.height);
  return TrackImage(img);
}

TrackImage::~TrackImage() {
  if (img_.data != nullptr) UnloadImage(img_);
}

TrackImage& TrackImage::operator=(TrackImage&& o) noexcept {
  if (this != &o) {
    if (img_.data != nullptr) UnloadImage(img_);
    img_ = o.img_;
    o.img_ = Image{};
  }
  return *this;
}

Rgba TrackImage::color_at(int x, int y) const {
  const Color c = GetImageColor(img_, x, y);
  return Rgba{c.r, c.g, c.b, c.a};
}

} // namespace crazycar
