#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cstdio>
#include <string>
#include <crazycar/snapshot.hpp>

using Catch::Approx;
using namespace crazycar;

static SimConfig unit_config() {
  SimConfig cfg{};
  cfg.track.width_px = 1900;
  cfg.track.height_px = 1000;
  return cfg;
}

TEST_CASE("snapshot_of stores the position divided by the scale factor") {
  const auto params = make_vehicle_params(unit_config());
  Vehicle v(params, Vec2{160.0, 80.0}, 45.0, 30.0);
  const auto r = snapshot_of(v, 0.8);
  REQUIRE(r.position.x == Approx(200.0));
  REQUIRE(r.position.y == Approx(100.0));
  REQUIRE(r.heading == Approx(45.0));
  REQUIRE(r.power);
  REQUIRE(*r.power == Approx(30.0));

  const Vehicle back = restore_vehicle(r, params, 0.8);
  REQUIRE(back.state().position.x == Approx(160.0));
  REQUIRE(back.state().power == Approx(30.0));
}

TEST_CASE("Records survive YAML serialization") {
  SnapshotRecord r{};
  r.position = {12.5, 7.0};
  r.heading = 270.0;
  r.speed = -1.25;
  r.speed_set = 2.0;
  r.radars = {RadarReading{Vec2{20.0, 7.0}, 8}, RadarReading{Vec2{12.0, 0.0}, 7}};
  r.analog_digital = {SensorSample{219, 0.535}};
  r.distance = 42.0;
  r.time = 1.5;
  r.raw_servo = 3.0;

  const auto back = snapshots_from_yaml(snapshots_to_yaml({r}));
  REQUIRE(back);
  REQUIRE(back->size() == 1);
  const auto& b = back->front();
  REQUIRE(b.position.x == Approx(12.5));
  REQUIRE(b.speed == Approx(-1.25));
  REQUIRE(b.radars.size() == 2);
  REQUIRE(b.radars[0].distance == 8);
  REQUIRE(b.radars[1].endpoint.y == Approx(0.0));
  REQUIRE(b.analog_digital.size() == 1);
  REQUIRE(b.analog_digital[0].digital_bit == 219);
  REQUIRE(b.analog_digital[0].analog_volt == Approx(0.535));
  REQUIRE(b.time == Approx(1.5));
  REQUIRE_FALSE(b.power.has_value());
  REQUIRE(b.raw_servo);
  REQUIRE(*b.raw_servo == Approx(3.0));
}

TEST_CASE("Optional fields default when restoring") {
  const auto recs = snapshots_from_yaml(
      "- {position: [10, 20], heading: 90, speed: 0.5, radars: [], analog_digital: []}\n");
  REQUIRE(recs);
  REQUIRE(recs->size() == 1);
  const Vehicle v = restore_vehicle(recs->front(), make_vehicle_params(unit_config()));
  REQUIRE(v.state().power == 0.0);
  REQUIRE(v.state().steer == 0.0);
  REQUIRE(v.state().speed == Approx(0.5));
}

TEST_CASE("Malformed snapshot documents are rejected") {
  REQUIRE(snapshots_from_yaml("")->empty());
  REQUIRE_FALSE(snapshots_from_yaml("position: [1, 2]\n").has_value());
  REQUIRE_FALSE(snapshots_from_yaml("- {position: [1], heading: 0, speed: 0}\n").has_value());
  REQUIRE_FALSE(snapshots_from_yaml("- {position: [1, 2], speed: 0}\n").has_value());
  REQUIRE_FALSE(snapshots_from_yaml("- {position: [1, 2], heading: 0, speed: 0, radars: [[1, 2]]}\n").has_value());
}

TEST_CASE("save_snapshots and load_snapshots use a file") {
  const std::string path = "crazycar_test_snapshot.yaml";
  SnapshotRecord r{};
  r.position = {1.0, 2.0};
  r.power = 20.0;
  REQUIRE(save_snapshots(path, {r, r}));
  const auto back = load_snapshots(path);
  REQUIRE(back);
  REQUIRE(back->size() == 2);
  REQUIRE(*back->at(1).power == Approx(20.0));
  std::remove(path.c_str());

  REQUIRE_FALSE(load_snapshots("/nonexistent/dir/snap.yaml").has_value());
  REQUIRE_FALSE(save_snapshots("/nonexistent/dir/snap.yaml", {r}));
}
