#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <crazycar/color.hpp>
#include <crazycar/rebound.hpp>

using Catch::Approx;
using namespace crazycar;

TEST_CASE("angle_between is unsigned and handles zero vectors") {
  REQUIRE(angle_between(Vec2{1, 0}, Vec2{0, 1}) == Approx(90.0));
  REQUIRE(angle_between(Vec2{1, 0}, Vec2{-1, 0}) == Approx(180.0));
  REQUIRE(angle_between(Vec2{2, 2}, Vec2{1, 1}) == Approx(0.0).margin(1e-6));
  REQUIRE(angle_between(Vec2{0, 0}, Vec2{1, 1}) == 0.0);
}

TEST_CASE("Rear corners are ignored while reversing") {
  const RasterMap map(100, 100, kBorderColor);
  const auto r = rebound_action(Vec2{50, 50}, Corner::RearLeft, 30.0, -2.0, map);
  REQUIRE(r.speed == 0.0);
  REQUIRE(r.heading == Approx(30.0));
  REQUIRE_FALSE(r.damped);
  REQUIRE(r.displacement.x == 0.0);
}

TEST_CASE("Head-on fallback normal keeps speed and only nudges the heading") {
  const RasterMap map(200, 200);   // no border anywhere: fallback normal (r, 0)
  SECTION("FrontLeft turns positive") {
    const auto r = rebound_action(Vec2{100, 100}, Corner::FrontLeft, 0.0, 2.0, map);
    REQUIRE(r.damped);
    REQUIRE(r.speed == Approx(2.0));
    REQUIRE(r.heading == Approx(1.0));
    REQUIRE(r.displacement.x == Approx(0.0).margin(1e-9));
  }
  SECTION("FrontRight turns negative") {
    const auto r = rebound_action(Vec2{100, 100}, Corner::FrontRight, 0.0, 2.0, map);
    REQUIRE(r.heading == Approx(359.0));
  }
}

TEST_CASE("Oblique wall hit damps speed and pushes back against travel") {
  RasterMap map(200, 100);
  map.fill_rect(110, 0, 200, 100, kBorderColor);

  // The probe pair at 40/55 deg is the first hit/free transition.
  const auto r = rebound_action(Vec2{100, 50}, Corner::FrontLeft, 0.0, 2.0, map);
  REQUIRE(r.damped);
  REQUIRE(r.speed == Approx(1.0));   // 40 deg incidence: medium band
  const double s = 8.0 * 2.0 * std::sin(deg_to_rad(40.0));
  REQUIRE(r.displacement.x == Approx(-1.7 * s));
  REQUIRE(r.displacement.y == Approx(0.0).margin(1e-9));
  REQUIRE(r.heading == Approx(7.0 * std::sin(deg_to_rad(80.0)) + 1.0));
}

TEST_CASE("Damping bands are configurable") {
  RasterMap map(200, 100);
  map.fill_rect(110, 0, 200, 100, kBorderColor);
  ReboundParams p{};
  p.medium_damp = 0.25;
  const auto r = rebound_action(Vec2{100, 50}, Corner::FrontLeft, 0.0, 4.0, map, kBorderColor, p);
  REQUIRE(r.speed == Approx(1.0));
}

TEST_CASE("Non-finite input stops the car without throwing") {
  const RasterMap map(50, 50);
  const auto r = rebound_action(Vec2{NAN, 1}, Corner::FrontRight, 370.0, 1.0, map);
  REQUIRE(r.speed == 0.0);
  REQUIRE(r.heading == Approx(10.0));
  REQUIRE_FALSE(r.damped);
}

TEST_CASE("Rebound never speeds the car up") {
  RasterMap map(200, 200);
  map.fill_rect(0, 0, 200, 60, kBorderColor);
  for (int heading = 0; heading < 360; heading += 7) {
    for (Corner c : {Corner::FrontRight, Corner::FrontLeft, Corner::RearLeft, Corner::RearRight}) {
      for (double speed : {-3.0, 0.5, 2.0, 9.0}) {
        const auto r = rebound_action(Vec2{100, 70}, c, heading, speed, map);
        REQUIRE(std::abs(r.speed) <= std::abs(speed));
      }
    }
  }
}
