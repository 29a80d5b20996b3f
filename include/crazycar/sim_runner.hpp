#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>
#include <crazycar/config.hpp>
#include <crazycar/sim.hpp>
#include <crazycar/snap.hpp>
#include <crazycar/snap_buffer.hpp>
#include <crazycar/snapshot.hpp>

namespace crazycar {

// Owns the simulation thread and publishes snapshots at a fixed wall cadence
// of one tick per dt, scaled by time_scale. The map must outlive the runner.
class SimRunner {
public:
  SimRunner(const ColorMap& map, SimConfig cfg) : map_(map), cfg_(std::move(cfg)) {}
  ~SimRunner() { stop(); }
  SimRunner(const SimRunner&) = delete;
  SimRunner& operator=(const SimRunner&) = delete;

  void start();
  void stop();

  void request_reseed(std::size_t n);   // hot reset with n cars (resets sim time)

  SnapshotBuffer& buffer() { return buffer_; }
  const SnapshotBuffer& buffer() const { return buffer_; }

  // True once the thread has finished: every car done, duration elapsed or stop().
  bool done() const { return done_.load(std::memory_order_acquire); }
  bool running() const { return running_.load(std::memory_order_acquire); }

  // Vehicle records taken when the thread finished; empty before.
  std::vector<SnapshotRecord> final_records() const;

  // Control surface
  std::atomic<double> time_scale{1.0}; // 0.0 = paused

private:
  void thread_main_();
  void populate_(Simulation& sim, std::size_t n) const;

  const ColorMap& map_;
  SimConfig cfg_;

  std::thread th_;
  std::atomic<bool> running_{false};
  std::atomic<bool> done_{false};

  SnapshotBuffer buffer_;

  mutable std::mutex final_m_;
  std::vector<SnapshotRecord> final_records_;

  std::atomic<bool> pending_reset_{false};
  std::atomic<std::size_t> pending_reset_n_{0};
};

} // namespace crazycar
