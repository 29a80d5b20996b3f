#include <crazycar/sim_runner.hpp>
#include <crazycar/log.hpp>
#include <chrono>

namespace crazycar {

void SimRunner::populate_(Simulation& sim, std::size_t n) const {
  if (n == 0) n = 1;
  sim.clear_cars();
  const SpawnPoint sp = resolve_spawn(map_, cfg_.spawn, sim.vehicle_params().cover_px);
  for (std::size_t i = 0; i < n; ++i) sim.add_car(sp);
}

void SimRunner::request_reseed(std::size_t n) {
  pending_reset_n_.store(n, std::memory_order_relaxed);
  pending_reset_.store(true, std::memory_order_release);
}

void SimRunner::start() {
  if (running_.load()) return;
  if (th_.joinable()) th_.join();   // a thread that ended on its own
  done_.store(false);
  running_.store(true);
  th_ = std::thread(&SimRunner::thread_main_, this);
}

void SimRunner::stop() {
  running_.store(false);
  if (th_.joinable()) th_.join();
}

std::vector<SnapshotRecord> SimRunner::final_records() const {
  std::lock_guard<std::mutex> lk(final_m_);
  return final_records_;
}

void SimRunner::thread_main_() {
  Simulation sim(map_, cfg_);
  populate_(sim, static_cast<std::size_t>(cfg_.run.cars));

  using clock = std::chrono::steady_clock;
  const double base_dt = sim.vehicle_params().dt;
  const auto tick_ns = std::chrono::nanoseconds((long long)(base_dt * 1e9));
  auto next = clock::now();
  double owed = 0.0;   // fractional ticks at the current time scale

  log()->info("runner: started with {} car(s), dt={:.3f}s", sim.car_count(), base_dt);

  while (running_.load(std::memory_order_relaxed)) {
    if (pending_reset_.load(std::memory_order_acquire)) {
      pending_reset_.store(false, std::memory_order_relaxed);
      Simulation fresh(map_, cfg_);
      populate_(fresh, pending_reset_n_.load(std::memory_order_relaxed));
      sim = std::move(fresh);
      owed = 0.0;
      log()->info("runner: reseeded with {} car(s)", sim.car_count());
    }

    const double warp = time_scale.load(std::memory_order_relaxed);
    owed += (warp < 0.0 ? 0.0 : warp);
    while (owed >= 1.0) {
      sim.step();
      owed -= 1.0;
    }

    // Heartbeats are published even when paused.
    buffer_.publish(snapshot_world(sim));

    if (sim.all_done() || sim.sim_time() >= cfg_.run.duration_s) break;

    next += tick_ns;
    std::this_thread::sleep_until(next);
  }

  {
    std::lock_guard<std::mutex> lk(final_m_);
    final_records_.clear();
    for (std::size_t i = 0; i < sim.car_count(); ++i) {
      if (const auto* v = sim.car_by_index(i)) final_records_.push_back(snapshot_of(*v, cfg_.track.scale_factor));
    }
  }
  log()->info("runner: stopped at t={:.2f}s after {} tick(s)", sim.sim_time(), sim.tick());
  running_.store(false, std::memory_order_release);
  done_.store(true, std::memory_order_release);
}

} // namespace crazycar
