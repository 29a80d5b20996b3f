#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <crazycar/color.hpp>
#include <crazycar/geometry.hpp>

using Catch::Approx;
using namespace crazycar;

TEST_CASE("normalize_angle wraps into [0, 360)") {
  REQUIRE(normalize_angle(0.0) == Approx(0.0));
  REQUIRE(normalize_angle(360.0) == Approx(0.0));
  REQUIRE(normalize_angle(-90.0) == Approx(270.0));
  REQUIRE(normalize_angle(725.0) == Approx(5.0));
  REQUIRE(normalize_angle(-1e-18) < 360.0);
  REQUIRE(normalize_angle(std::nan("")) == 0.0);
}

TEST_CASE("screen_direction measures headings clockwise on a y-down raster") {
  const Vec2 east = screen_direction(0.0);
  REQUIRE(east.x == Approx(1.0));
  REQUIRE(east.y == Approx(0.0).margin(1e-12));

  // 90 deg turns toward negative y (up on screen).
  const Vec2 up = screen_direction(90.0);
  REQUIRE(up.x == Approx(0.0).margin(1e-12));
  REQUIRE(up.y == Approx(-1.0));
}

TEST_CASE("trunc_px truncates toward zero and saturates") {
  REQUIRE(trunc_px(3.9) == 3);
  REQUIRE(trunc_px(-3.9) == -3);
  REQUIRE(trunc_px(std::nan("")) == 0);
  REQUIRE(trunc_px(1e300) == 1000000000);
  REQUIRE(trunc_px(-INFINITY) == -1000000000);
}

TEST_CASE("Corners sit on the body diagonal around the center") {
  const Vec2 c{100.0, 50.0};
  const double hl = 16.0, hw = 8.0;
  const double diag = std::hypot(hl, hw);

  for (double heading : {0.0, 37.0, 90.0, 181.0, 359.0}) {
    const auto corners = compute_corners(c, heading, hl, hw);
    for (const auto& p : corners) REQUIRE(length(p - c) == Approx(diag));
    const Vec2 m = centroid(corners);
    REQUIRE(m.x == Approx(c.x));
    REQUIRE(m.y == Approx(c.y));
  }
}

TEST_CASE("Front corners lead the rear corners along the heading") {
  const Vec2 c{0.0, 0.0};
  const auto corners = compute_corners(c, 0.0, 16.0, 8.0);
  REQUIRE(corners[static_cast<int>(Corner::FrontRight)].x > 0.0);
  REQUIRE(corners[static_cast<int>(Corner::FrontLeft)].x > 0.0);
  REQUIRE(corners[static_cast<int>(Corner::RearLeft)].x < 0.0);
  REQUIRE(corners[static_cast<int>(Corner::RearRight)].x < 0.0);

  // FrontRight is +23 deg, i.e. mirrored by FrontLeft across the heading axis.
  const Vec2 fr = corners[static_cast<int>(Corner::FrontRight)];
  const Vec2 fl = corners[static_cast<int>(Corner::FrontLeft)];
  REQUIRE(fr.x == Approx(fl.x));
  REQUIRE(fr.y == Approx(-fl.y));

  REQUIRE(is_rear(Corner::RearLeft));
  REQUIRE(is_rear(Corner::RearRight));
  REQUIRE_FALSE(is_rear(Corner::FrontRight));
}

TEST_CASE("Wheels follow the front diagonals at the reduced radius") {
  const Vec2 c{10.0, 10.0};
  const auto w = compute_wheels(c, 45.0, 5.0);
  REQUIRE(length(w.left - c) == Approx(5.0));
  REQUIRE(length(w.right - c) == Approx(5.0));

  const auto corners = compute_corners(c, 45.0, 16.0, 8.0);
  const Vec2 fr = corners[static_cast<int>(Corner::FrontRight)] - c;
  const Vec2 wr = w.right - c;
  REQUIRE(dot(fr, wr) == Approx(length(fr) * length(wr)));
}

TEST_CASE("RasterMap bounds and sample_color fallback") {
  RasterMap map(10, 5);
  map.fill_rect(2, 1, 4, 3, kBorderColor);

  REQUIRE(map.color_at(2, 1) == kBorderColor);
  REQUIRE(map.color_at(3, 2) == kBorderColor);
  REQUIRE_FALSE(map.color_at(4, 2) == kBorderColor);   // half-open
  REQUIRE_FALSE(map.contains(10, 0));
  REQUIRE_FALSE(map.contains(-1, 0));

  const Rgba outside{1, 2, 3, 255};
  REQUIRE(sample_color(map, -1, 0, outside) == outside);
  REQUIRE(sample_color(map, 0, 5, outside) == outside);

  map.set(50, 50, kFinishLineColor);   // ignored
  map.set(0, 0, kFinishLineColor);
  REQUIRE(map.color_at(0, 0) == kFinishLineColor);
}
