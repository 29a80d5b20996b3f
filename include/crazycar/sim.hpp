#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>
#include <crazycar/color.hpp>
#include <crazycar/config.hpp>
#include <crazycar/controller.hpp>
#include <crazycar/telemetry.hpp>
#include <crazycar/vehicle.hpp>

namespace crazycar {

// Manual spawn if configured, else the finish line proposal, else the fallback.
SpawnPoint resolve_spawn(const ColorMap& map, const SpawnConfig& cfg, int cover_px);

// Owns the vehicles on one track. The map must outlive the simulation.
class Simulation {
public:
  Simulation(const ColorMap& map, SimConfig cfg);

  // --- Car management
  void clear_cars() { cars_.clear(); next_id_ = 0; }
  // Spawns at `spawn` (center) with the configured controller and initial power.
  CarId add_car(const SpawnPoint& spawn);
  CarId add_car(Vehicle v, std::unique_ptr<Controller> controller);
  std::size_t car_count() const { return cars_.size(); }

  // Access by index (0..N-1). Returns nullptr if out of range.
  const Vehicle* car_by_index(std::size_t idx) const;
  Vehicle*       car_by_index(std::size_t idx);
  std::optional<CarId> id_at(std::size_t idx) const;

  const Vehicle* car_by_id(CarId id) const;
  Vehicle*       car_by_id(CarId id);

  // --- Simulation
  // Control decision then tick, for every car.
  void step();
  // No car is both alive and unfinished.
  bool all_done() const;

  double sim_time() const { return sim_time_; }
  std::uint64_t tick() const { return tick_; }
  const SimConfig& config() const { return cfg_; }
  const VehicleParams& vehicle_params() const { return params_; }
  const LapTelemetry& telemetry() const { return telem_; }

  void set_sensors_enabled(bool on) { sensors_enabled_ = on; }

private:
  struct Car {
    CarId id;
    Vehicle vehicle;
    std::unique_ptr<Controller> controller;
  };

  const ColorMap* map_;
  SimConfig cfg_;
  VehicleParams params_;
  std::vector<Car> cars_;
  LapTelemetry telem_;
  CarId next_id_{0};
  double sim_time_{0.0};
  std::uint64_t tick_{0};
  bool sensors_enabled_{true};
};

} // namespace crazycar
