#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>
#include <crazycar/collision.hpp>

using Catch::Approx;
using namespace crazycar;

namespace {
struct RecordingListener : LapListener {
  std::vector<double> laps;
  void on_lap_time(double seconds) override { laps.push_back(seconds); }
};

// Car centered at (100,100) heading east; FrontRight near (116,93),
// FrontLeft near (116,106).
CornerSet test_corners() { return compute_corners(Vec2{100.0, 100.0}, 0.0, 16.0, 8.0); }
} // namespace

TEST_CASE("Policy names") {
  REQUIRE(policy_from_string("Rebound") == CollisionPolicy::Rebound);
  REQUIRE(policy_from_string("STOP") == CollisionPolicy::Stop);
  REQUIRE(policy_from_string("remove") == CollisionPolicy::Remove);
  REQUIRE_FALSE(policy_from_string("bounce").has_value());
  REQUIRE(std::string(to_string(CollisionPolicy::Stop)) == "stop");
}

TEST_CASE("Free track leaves the state untouched") {
  const RasterMap map(300, 200);
  const auto r = collision_step(test_corners(), map, 2.5, 12.0, 1.0);
  REQUIRE(r.alive);
  REQUIRE_FALSE(r.finished);
  REQUIRE(r.speed == Approx(2.5));
  REQUIRE(r.heading == Approx(12.0));
  REQUIRE(r.position_delta.x == 0.0);
}

TEST_CASE("Finish line only counts at the front right corner") {
  RasterMap map(300, 200);
  RecordingListener listener;

  SECTION("front right on the line") {
    map.fill_rect(114, 91, 119, 96, kFinishLineColor);
    const auto r = collision_step(test_corners(), map, 1.0, 0.0, 12.5, {}, &listener);
    REQUIRE(r.finished);
    REQUIRE(r.lap_time == Approx(12.5));
    REQUIRE(listener.laps == std::vector<double>{12.5});
  }
  SECTION("front left on the line") {
    map.fill_rect(114, 104, 119, 109, kFinishLineColor);
    const auto r = collision_step(test_corners(), map, 1.0, 0.0, 12.5, {}, &listener);
    REQUIRE_FALSE(r.finished);
    REQUIRE(listener.laps.empty());
  }
}

TEST_CASE("Border contact dispatches the configured policy") {
  RasterMap map(300, 200);
  map.fill_rect(114, 104, 119, 109, kBorderColor);   // under FrontLeft only
  CollisionConfig cfg{};

  SECTION("stop") {
    cfg.policy = CollisionPolicy::Stop;
    const auto r = collision_step(test_corners(), map, 2.0, 0.0, 0.0, cfg);
    REQUIRE(r.speed == 0.0);
    REQUIRE(r.control_disabled);
    REQUIRE(r.alive);
  }
  SECTION("remove") {
    cfg.policy = CollisionPolicy::Remove;
    const auto r = collision_step(test_corners(), map, 2.0, 0.0, 0.0, cfg);
    REQUIRE_FALSE(r.alive);
  }
  SECTION("rebound pushes every corner off the border") {
    const auto corners = test_corners();
    const auto r = collision_step(corners, map, 2.0, 0.0, 0.0, cfg);
    REQUIRE(r.alive);
    REQUIRE(r.heading == Approx(1.0));    // FrontLeft turns positive
    REQUIRE(length(r.position_delta) > 0.0);
    for (const auto& c : corners) {
      const Vec2 moved = c + r.position_delta;
      REQUIRE_FALSE(map.color_at(trunc_px(moved.x), trunc_px(moved.y)) == kBorderColor);
    }
  }
}

TEST_CASE("First corner in enumeration order wins") {
  RasterMap map(300, 200);
  map.fill_rect(110, 85, 125, 115, kBorderColor);    // both front corners
  const auto r = collision_step(test_corners(), map, 1.0, 0.0, 0.0);
  // FrontRight rotates negative, so the heading wraps below 360.
  REQUIRE(r.heading > 270.0);
  REQUIRE(r.heading < 360.0);
}

TEST_CASE("Off-map corners count as border") {
  const RasterMap map(110, 200);   // front corners fall off the right edge
  CollisionConfig cfg{};
  cfg.policy = CollisionPolicy::Remove;
  REQUIRE_FALSE(collision_step(test_corners(), map, 1.0, 0.0, 0.0, cfg).alive);
}
