#include <crazycar/sim.hpp>
#include <crazycar/log.hpp>
#include <utility>

namespace crazycar {

SpawnPoint resolve_spawn(const ColorMap& map, const SpawnConfig& cfg, int cover_px) {
  if (cfg.manual) {
    log()->info("spawn: manual ({:.0f},{:.0f}) heading={:.1f}",
                cfg.manual->center.x, cfg.manual->center.y, cfg.manual->heading);
    return *cfg.manual;
  }
  if (auto info = detect_finish_line(map, cover_px, cfg.detect)) return info->spawn;
  log()->warn("spawn: no finish line found, fallback ({:.0f},{:.0f})",
              cfg.fallback.center.x, cfg.fallback.center.y);
  return cfg.fallback;
}

namespace {

// Forwards a vehicle's lap to the shared telemetry under its id.
class LapRecorder : public LapListener {
public:
  LapRecorder(LapTelemetry& t, CarId id) : t_(t), id_(id) {}
  void on_lap_time(double seconds) override { t_.record(id_, seconds); }
private:
  LapTelemetry& t_;
  CarId id_;
};

} // namespace

Simulation::Simulation(const ColorMap& map, SimConfig cfg)
  : map_(&map), cfg_(std::move(cfg)), params_(make_vehicle_params(cfg_)) {}

CarId Simulation::add_car(const SpawnPoint& spawn) {
  const double half = params_.cover_px / 2.0;
  Vehicle v(params_, Vec2{spawn.center.x - half, spawn.center.y - half}, spawn.heading,
            cfg_.car.initial_power);
  return add_car(std::move(v), make_controller(cfg_.controller));
}

CarId Simulation::add_car(Vehicle v, std::unique_ptr<Controller> controller) {
  const CarId id = next_id_++;
  cars_.push_back(Car{id, std::move(v), std::move(controller)});
  return id;
}

const Vehicle* Simulation::car_by_index(std::size_t idx) const {
  if (idx >= cars_.size()) return nullptr;
  return &cars_[idx].vehicle;
}
Vehicle* Simulation::car_by_index(std::size_t idx) {
  if (idx >= cars_.size()) return nullptr;
  return &cars_[idx].vehicle;
}

std::optional<CarId> Simulation::id_at(std::size_t idx) const {
  if (idx >= cars_.size()) return std::nullopt;
  return cars_[idx].id;
}

const Vehicle* Simulation::car_by_id(CarId id) const {
  for (const auto& c : cars_) if (c.id == id) return &c.vehicle;
  return nullptr;
}
Vehicle* Simulation::car_by_id(CarId id) {
  for (auto& c : cars_) if (c.id == id) return &c.vehicle;
  return nullptr;
}

void Simulation::step() {
  for (auto& c : cars_) {
    auto& v = c.vehicle;
    if (!v.alive()) continue;
    if (c.controller && v.state().control_enabled) {
      if (auto cmd = c.controller->compute(v.control_inputs())) v.actuate(*cmd);
    }
    LapRecorder recorder(telem_, c.id);
    v.tick(*map_, cfg_.collision, sensors_enabled_, &recorder);
  }
  sim_time_ += params_.dt;
  ++tick_;
}

bool Simulation::all_done() const {
  for (const auto& c : cars_) {
    if (c.vehicle.alive() && !c.vehicle.finished()) return false;
  }
  return true;
}

} // namespace crazycar
