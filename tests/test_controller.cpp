#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <crazycar/controller.hpp>

using Catch::Approx;
using namespace crazycar;

static ControlInputs inputs(double right, double front, double left, double power = 0.0) {
  ControlInputs in{};
  in.distances_cm = {right, front, left};
  in.power = power;
  in.raw_throttle = power;
  return in;
}

TEST_CASE("Controller kind names") {
  REQUIRE(controller_kind_from_string("rule") == ControllerKind::RuleBased);
  REQUIRE(controller_kind_from_string("Rule_Based") == ControllerKind::RuleBased);
  REQUIRE(controller_kind_from_string("NN") == ControllerKind::Network);
  REQUIRE_FALSE(controller_kind_from_string("pid").has_value());
  REQUIRE(std::string(to_string(ControllerKind::Network)) == "network");
}

TEST_CASE("Rule based controller needs three radar distances") {
  const RuleBasedController c;
  ControlInputs in{};
  in.distances_cm = {100.0, 100.0};
  REQUIRE_FALSE(c.compute(in).has_value());
}

TEST_CASE("Rule based longitudinal ranges") {
  const RuleBasedController c;

  SECTION("far: accelerate toward the forward cap") {
    const auto cmd = c.compute(inputs(200.0, 200.0, 200.0));
    REQUIRE(cmd);
    REQUIRE(cmd->throttle == Approx((220.0 - 200.0) * 1.1 + 18.0));
    REQUIRE(cmd->servo == Approx(0.0));
  }
  SECTION("far at the cap keeps the previous throttle") {
    const auto cmd = c.compute(inputs(200.0, 200.0, 200.0, 60.0));
    REQUIRE(cmd->throttle == Approx(60.0));
  }
  SECTION("mid: ease off, never below the minimum") {
    const auto cmd = c.compute(inputs(200.0, 80.0, 200.0, 40.0));
    REQUIRE(cmd->throttle == Approx(40.0 - 8.0 * 1.1));
    const auto low = c.compute(inputs(200.0, 80.0, 200.0, 20.0));
    REQUIRE(low->throttle == Approx(18.0));
  }
  SECTION("near: reverse and steer out") {
    const auto cmd = c.compute(inputs(20.0, 30.0, 100.0, 40.0));
    REQUIRE(cmd->throttle == Approx(-(33.0 - 30.0) * 1.1 - 18.0));
    REQUIRE(cmd->servo == Approx(-(20.0 - 100.0) * 1.1 - 10.0));
  }
}

TEST_CASE("Rule based lateral correction steers away from the near side") {
  const RuleBasedController c;
  const auto cmd = c.compute(inputs(100.0, 200.0, 200.0));
  REQUIRE(cmd->servo == Approx(-(200.0 - 100.0) * 1.1));
  REQUIRE(cmd->servo < 0.0);
}

TEST_CASE("Network controller with biases only") {
  NetworkWeights w{};
  w.b_out = {0.5, -0.5};
  const NetworkController c(w);
  const auto cmd = c.compute(inputs(10.0, 10.0, 10.0));
  REQUIRE(cmd);
  REQUIRE(cmd->throttle == Approx(std::tanh(0.5) * 100.0));
  REQUIRE(cmd->servo == Approx(std::tanh(-0.5) * 10.0));
}

TEST_CASE("Network controller forward pass") {
  NetworkWeights w{};
  w.hidden = 1;
  w.w_hidden = {1.0, 0.0, 0.0, 0.0};
  w.b_hidden = {0.0};
  w.w_out = {1.0, 0.0};
  REQUIRE(weights_consistent(w));

  const NetworkController c(w);
  const auto cmd = c.compute(inputs(65.0, 500.0, 500.0));   // right = 0.5 after scaling
  REQUIRE(cmd->throttle == Approx(std::tanh(std::tanh(0.5)) * 100.0));
  REQUIRE(cmd->servo == Approx(0.0));
}

TEST_CASE("Inconsistent network weights fall back to an empty network") {
  NetworkWeights w{};
  w.hidden = 2;
  w.b_out = {1.0, 1.0};
  REQUIRE_FALSE(weights_consistent(w));
  const NetworkController c(w);
  const auto cmd = c.compute(inputs(10.0, 10.0, 10.0));
  REQUIRE(cmd->throttle == Approx(0.0));
  REQUIRE(cmd->servo == Approx(0.0));
}

TEST_CASE("make_controller follows the configured kind") {
  ControllerConfig cfg{};
  REQUIRE(make_controller(cfg)->kind() == ControllerKind::RuleBased);
  cfg.kind = ControllerKind::Network;
  REQUIRE(make_controller(cfg)->kind() == ControllerKind::Network);
}
