#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <random>
#include <crazycar/dynamics.hpp>

using Catch::Approx;
using namespace crazycar;

TEST_CASE("Fitted curves at half power") {
  REQUIRE(max_speed_cm(50.0, 0.0) == Approx((-0.0496 * 2500.0 + 9.008 * 50.0 + 31.8089) / 100.0));
  REQUIRE(max_speed_cm(-50.0, 0.0) == Approx(max_speed_cm(50.0, 0.0)));
  REQUIRE(max_speed_cm(50.0, 10.0) == Approx((-81562.0 * std::pow(50.0, -2.47) + 215.5123) / 100.0));
  REQUIRE(acceleration_cm(0.0, 50.0) == Approx((0.155 * 2500.0 + 7.015 * 50.0) / 100.0));
}

TEST_CASE("Negative steer uses the straight regime") {
  REQUIRE(max_speed_cm(40.0, -20.0) == Approx(max_speed_cm(40.0, 0.0)));
}

TEST_CASE("step_speed integrates one Euler step") {
  const UnitConverter u;   // 1 px == 1 cm
  const double a = acceleration_cm(0.0, 50.0);

  SECTION("forward from rest") {
    REQUIRE(step_speed(0.0, 50.0, 0.0, u) == Approx(a * kDefaultDt));
  }
  SECTION("negative power mirrors the result") {
    REQUIRE(step_speed(0.0, -50.0, 0.0, u) == Approx(-a * kDefaultDt));
  }
  SECTION("custom dt") {
    REQUIRE(step_speed(0.0, 50.0, 0.0, u, 0.1) == Approx(a * 0.1));
  }
  SECTION("zero power stops the car") {
    REQUIRE(step_speed(12.0, 0.0, 0.0, u) == 0.0);
  }
}

TEST_CASE("Overspeed snaps to vmax keeping the sign of the incoming speed") {
  const UnitConverter u;
  const double vmax = max_speed_cm(50.0, 0.0);
  REQUIRE(step_speed(10.0, 50.0, 0.0, u) == Approx(vmax));
  REQUIRE(step_speed(-10.0, 50.0, 0.0, u) == Approx(-vmax));
}

TEST_CASE("Speeds scale with the px per cm ratio") {
  const UnitConverter u(950.0);    // 2 cm per px
  REQUIRE(step_speed(0.0, 50.0, 0.0, u) == Approx(acceleration_cm(0.0, 50.0) * kDefaultDt / 2.0));
  REQUIRE(target_speed(50.0, u) == Approx(max_speed_cm(50.0, 0.0) / 2.0));
}

TEST_CASE("Non-finite input yields zero speed") {
  const UnitConverter u;
  REQUIRE(step_speed(std::nan(""), 50.0, 0.0, u) == 0.0);
  REQUIRE(step_speed(1.0, INFINITY, 0.0, u) == 0.0);
  REQUIRE(step_speed(1.0, 50.0, std::nan(""), u) == 0.0);
  REQUIRE(target_speed(std::nan(""), u) == 0.0);
}

TEST_CASE("step_speed never exceeds vmax in magnitude") {
  std::mt19937 rng(7);
  std::uniform_real_distribution<double> speed(-60.0, 60.0);
  std::uniform_real_distribution<double> power(-100.0, 100.0);
  std::uniform_real_distribution<double> steer(-45.0, 45.0);
  std::uniform_real_distribution<double> dt(0.0, 5.0);
  const UnitConverter u;
  for (int i = 0; i < 20000; ++i) {
    const double p = power(rng);
    const double st = steer(rng);
    const double v = step_speed(speed(rng), p, st, u, dt(rng));
    REQUIRE(std::abs(v) <= std::abs(max_speed_cm(p, st)) + 1e-9);
  }
}
