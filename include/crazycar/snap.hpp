#pragma once
#include <cstdint>
#include <optional>
#include <vector>
#include <crazycar/sim.hpp>

namespace crazycar {

struct CarPose {
  CarId id{};
  double x{};            // center, px
  double y{};
  double heading_deg{};
  double speed{};
  double power{};
  double steer{};
  double distance{};
  bool alive{true};
  bool finished{false};

  // Telemetry (-1.0 means "not set yet")
  double last_lap_time{-1.0};
  double best_lap_time{-1.0};
};

// Immutable sample of the world for readers on other threads.
struct SimSnapshot {
  double sim_time{};
  std::uint64_t tick{};
  std::vector<CarPose> cars{};
};

SimSnapshot snapshot_world(const Simulation& sim);

// Helper: find pose by id in a snapshot
inline std::optional<CarPose> find_car(const SimSnapshot& ss, CarId id) {
  for (const auto& c : ss.cars) if (c.id == id) return c;
  return std::nullopt;
}

} // namespace crazycar
