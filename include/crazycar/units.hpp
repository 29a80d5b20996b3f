#pragma once

namespace crazycar {

inline constexpr double kTrackWidthCm = 1900.0;

// Linear px <-> cm scale: track_width_cm real centimeters span width_px pixels.
class UnitConverter {
public:
  UnitConverter() = default;
  UnitConverter(double width_px, double track_width_cm = kTrackWidthCm);

  double to_cm(double px) const { return (px * track_width_cm_) / width_px_; }
  double to_px(double cm) const { return (cm * width_px_) / track_width_cm_; }

  double width_px() const { return width_px_; }
  double track_width_cm() const { return track_width_cm_; }

private:
  double width_px_{kTrackWidthCm};
  double track_width_cm_{kTrackWidthCm};
};

} // namespace crazycar
