#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>
#include <crazycar/config.hpp>
#include <crazycar/log.hpp>
#include <crazycar/sim.hpp>
#include <crazycar/sim_runner.hpp>
#include <crazycar/snap.hpp>
#include <crazycar/snapshot.hpp>
#include <crazycar/track_image.hpp>

using namespace crazycar;

static std::vector<SnapshotRecord> run_unpaced_(const ColorMap& map, const SimConfig& cfg) {
  Simulation sim(map, cfg);
  const SpawnPoint sp = resolve_spawn(map, cfg.spawn, sim.vehicle_params().cover_px);
  for (int i = 0; i < cfg.run.cars; ++i) sim.add_car(sp);

  while (!sim.all_done() && sim.sim_time() < cfg.run.duration_s) sim.step();
  log()->info("run: stopped at t={:.2f}s after {} tick(s)", sim.sim_time(), sim.tick());

  std::vector<SnapshotRecord> out;
  for (std::size_t i = 0; i < sim.car_count(); ++i) {
    const auto* v = sim.car_by_index(i);
    if (!v) continue;
    if (v->finished()) log()->info("car {}: lap in {:.2f}s", i, v->lap_time());
    else if (!v->alive()) log()->info("car {}: removed after {:.1f}px", i, v->state().distance);
    else log()->info("car {}: still running, {:.1f}px", i, v->state().distance);
    out.push_back(snapshot_of(*v, cfg.track.scale_factor));
  }
  return out;
}

static std::vector<SnapshotRecord> run_paced_(const ColorMap& map, const SimConfig& cfg) {
  SimRunner runner(map, cfg);
  runner.time_scale.store(cfg.run.time_scale);
  runner.start();

  std::uint64_t cursor = 0;
  SimSnapshot snap{};
  double last_report = 0.0;
  while (!runner.done()) {
    if (runner.buffer().try_consume_latest(cursor, snap) && snap.sim_time - last_report >= 1.0) {
      last_report = snap.sim_time;
      for (const auto& c : snap.cars) {
        log()->debug("t={:.2f} car {} at ({:.1f},{:.1f}) h={:.1f} v={:.2f}",
                     snap.sim_time, c.id, c.x, c.y, c.heading_deg, c.speed);
      }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  runner.stop();

  // The loop may already hold the final snapshot; keep it if nothing newer.
  runner.buffer().try_consume_latest(cursor, snap);
  for (const auto& c : snap.cars) {
    if (c.best_lap_time >= 0.0) log()->info("car {}: best lap {:.2f}s", c.id, c.best_lap_time);
    else log()->info("car {}: {} after {:.1f}px", c.id, c.alive ? "no lap" : "removed", c.distance);
  }
  return runner.final_records();
}

int main(int argc, char** argv) {
  if (argc < 2) {
    log()->error("usage: {} <config.yaml> [track.png]", argc > 0 ? argv[0] : "crazycar_run");
    return 2;
  }

  auto cfg = load_config(argv[1]);
  if (!cfg) return 1;
  init_logging(cfg->log);
  if (argc > 2) cfg->track.map_path = argv[2];
  if (cfg->track.map_path.empty()) {
    log()->error("no track image configured");
    return 1;
  }

  auto track = TrackImage::load(cfg->track.map_path, cfg->track.width_px, cfg->track.height_px);
  if (!track) return 1;

  const auto records = cfg->run.time_scale > 0.0 ? run_paced_(*track, *cfg)
                                                 : run_unpaced_(*track, *cfg);

  if (!cfg->run.snapshot_out.empty() && !save_snapshots(cfg->run.snapshot_out, records)) return 1;
  return 0;
}
