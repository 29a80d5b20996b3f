#include <crazycar/snap.hpp>

namespace crazycar {

SimSnapshot snapshot_world(const Simulation& sim) {
  SimSnapshot s{};
  s.sim_time = sim.sim_time();
  s.tick = sim.tick();
  const std::size_t n = sim.car_count();
  s.cars.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    const auto* car = sim.car_by_index(i);
    const auto id = sim.id_at(i);
    if (!car || !id) continue;
    const auto& st = car->state();
    CarPose cp{};
    cp.id = *id;
    cp.x = st.center.x;
    cp.y = st.center.y;
    cp.heading_deg = st.heading;
    cp.speed = st.speed;
    cp.power = st.power;
    cp.steer = st.steer;
    cp.distance = st.distance;
    cp.alive = st.alive;
    cp.finished = st.finished;
    LapTimes lt{};
    if (sim.telemetry().get(cp.id, lt)) {
      cp.last_lap_time = lt.last_lap;
      cp.best_lap_time = lt.best_lap;
    }
    s.cars.push_back(cp);
  }
  return s;
}

} // namespace crazycar
