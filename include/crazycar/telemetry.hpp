#pragma once
#include <cstdint>
#include <unordered_map>

namespace crazycar {

using CarId = std::uint32_t;

struct LapTimes {
  double last_lap{-1.0};   // -1 means no lap yet
  double best_lap{-1.0};
  std::uint64_t laps{0};
};

// Per-car lap bookkeeping fed by finish line contacts.
class LapTelemetry {
public:
  void record(CarId id, double lap_time) {
    auto& st = cars_[id];
    st.last_lap = lap_time;
    if (st.best_lap < 0.0 || lap_time < st.best_lap) st.best_lap = lap_time;
    ++st.laps;
  }

  bool get(CarId id, LapTimes& out) const {
    auto it = cars_.find(id);
    if (it == cars_.end()) return false;
    out = it->second;
    return true;
  }

  // Fastest lap over all cars, -1 when nobody finished.
  double best_overall() const {
    double best = -1.0;
    for (const auto& [id, st] : cars_) {
      if (st.best_lap >= 0.0 && (best < 0.0 || st.best_lap < best)) best = st.best_lap;
    }
    return best;
  }

  void clear() { cars_.clear(); }

private:
  std::unordered_map<CarId, LapTimes> cars_;
};

} // namespace crazycar
