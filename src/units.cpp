#include <crazycar/units.hpp>
#include <cmath>

namespace crazycar {

UnitConverter::UnitConverter(double width_px, double track_width_cm) {
  // Degenerate references fall back to 1 cm per px.
  if (!(std::isfinite(width_px) && width_px > 0.0) ||
      !(std::isfinite(track_width_cm) && track_width_cm > 0.0)) {
    return;
  }
  width_px_ = width_px;
  track_width_cm_ = track_width_cm;
}

} // namespace crazycar
