#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <crazycar/snap.hpp>
#include <crazycar/snap_buffer.hpp>

using Catch::Approx;
using namespace crazycar;

TEST_CASE("snapshot_world samples every car with lap times") {
  const RasterMap map(1900, 1000, kFinishLineColor);
  SimConfig cfg{};
  cfg.track.width_px = 1900;
  cfg.track.height_px = 1000;
  Simulation sim(map, cfg);
  sim.add_car(SpawnPoint{Vec2{300.0, 500.0}, 0.0});
  sim.add_car(SpawnPoint{Vec2{600.0, 400.0}, 90.0});

  const auto before = snapshot_world(sim);
  REQUIRE(before.cars.size() == 2);
  REQUIRE(before.tick == 0u);
  REQUIRE(before.cars[0].last_lap_time == Approx(-1.0));

  sim.step();
  const auto ss = snapshot_world(sim);
  REQUIRE(ss.sim_time == Approx(0.01));
  REQUIRE(ss.tick == 1u);
  const auto c1 = find_car(ss, 1);
  REQUIRE(c1);
  REQUIRE(c1->x == Approx(600.0));
  REQUIRE(c1->heading_deg == Approx(90.0));
  REQUIRE(c1->finished);
  REQUIRE(c1->best_lap_time == Approx(0.01));
  REQUIRE_FALSE(find_car(ss, 7).has_value());
}

TEST_CASE("LatestBuffer hands out only new values") {
  LatestBuffer<int> buf;
  std::uint64_t cursor = 0;
  int out = 0;
  REQUIRE_FALSE(buf.try_consume_latest(cursor, out));

  buf.publish(1);
  buf.publish(2);
  REQUIRE(buf.try_consume_latest(cursor, out));
  REQUIRE(out == 2);
  REQUIRE(cursor == 2u);
  REQUIRE_FALSE(buf.try_consume_latest(cursor, out));

  buf.publish(3);
  REQUIRE(buf.try_consume_latest(cursor, out));
  REQUIRE(out == 3);
  REQUIRE(buf.sequence() == 3u);
}
