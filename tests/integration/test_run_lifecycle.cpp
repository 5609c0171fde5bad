#include <doctest/doctest.h>

#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>
#include <vector>

#include "../test_common.hpp"
#include "seiswave/api/errors.hpp"
#include "seiswave/physics/stability.hpp"

namespace {

std::unique_ptr<seiswave::ISimulation> small_simulation(seiswave::SimulationConfig config = test_common::default_config()) {
  auto simulation = seiswave::make_simulation(test_common::uniform_medium(31, 31, 10.0, 2000.0), config);
  simulation->add_source(15, 15, test_common::ricker(15.0));
  return simulation;
}

}  // namespace

TEST_CASE("runs move the session from Ready to Completed") {
  auto simulation = small_simulation();
  CHECK(simulation->state() == seiswave::SimulationState::Ready);

  std::vector<std::size_t> observed;
  auto request = test_common::run_request(25, 5);
  request.on_step = [&observed](std::size_t step) { observed.push_back(step); };

  const auto result = simulation->run(request);
  CHECK(simulation->state() == seiswave::SimulationState::Completed);
  CHECK(result.steps_completed == 25);
  CHECK(result.snapshots_recorded == 5);
  CHECK_FALSE(result.cancelled);
  CHECK(simulation->steps_completed() == 25);
  CHECK(simulation->current_time() == doctest::Approx(25.0 * simulation->time_step()));
  REQUIRE(observed.size() == 25);
  CHECK(observed.front() == 0);
  CHECK(observed.back() == 24);

  const auto diagnostics = simulation->diagnostics_json();
  CHECK(diagnostics.find("\"state\":\"Completed\"") != std::string::npos);
  CHECK(test_common::json_value(diagnostics, "snapshots") == doctest::Approx(5.0));
  CHECK(test_common::json_value(diagnostics, "max_amplitude") > 0.0);
}

TEST_CASE("the CFL gate rejects a run exactly when dt exceeds the limit") {
  const double limit = seiswave::cfl_limit(2000.0, 10.0, 2);

  auto config = test_common::default_config();
  config.time_step = limit * (1.0 + 1.0e-9);
  auto unstable = small_simulation(config);
  CHECK_THROWS_AS(unstable->run(test_common::run_request(10)), seiswave::UnstableConfigurationError);
  CHECK(unstable->state() == seiswave::SimulationState::Ready);
  CHECK(unstable->steps_completed() == 0);
  CHECK(unstable->snapshots().empty());

  config.time_step = limit;
  auto marginal = small_simulation(config);
  CHECK_NOTHROW(marginal->run(test_common::run_request(10)));
  CHECK(marginal->state() == seiswave::SimulationState::Completed);
}

TEST_CASE("the CFL gate depends on the stencil order") {
  const double dt = 0.5 * (seiswave::cfl_limit(2000.0, 10.0, 2) + seiswave::cfl_limit(2000.0, 10.0, 4));

  auto config = test_common::default_config();
  config.time_step = dt;
  config.spatial_order = 2;
  CHECK_NOTHROW(small_simulation(config)->run(test_common::run_request(5)));

  config.spatial_order = 4;
  CHECK_THROWS_AS(small_simulation(config)->run(test_common::run_request(5)), seiswave::UnstableConfigurationError);
}

TEST_CASE("the CFL gate is set by the fastest layer") {
  const auto medium = seiswave::Medium::layered(seiswave::Grid2D(30, 30, 10.0),
                                                {{0, 1500.0, 1000.0}, {15, 4500.0, 2600.0}});
  const double fast_limit = seiswave::cfl_limit(4500.0, 10.0, 2);
  const double slow_limit = seiswave::cfl_limit(1500.0, 10.0, 2);

  auto config = test_common::default_config();
  config.time_step = 0.5 * (fast_limit + slow_limit);
  auto simulation = seiswave::make_simulation(medium, config);
  CHECK(simulation->stability_limit() == doctest::Approx(fast_limit));
  CHECK_THROWS_AS(simulation->run(test_common::run_request(5)), seiswave::UnstableConfigurationError);
  CHECK(simulation->state() == seiswave::SimulationState::Ready);

  config.time_step.reset();
  auto derived = seiswave::make_simulation(medium, config);
  CHECK(derived->time_step() == doctest::Approx(0.9 * fast_limit));
  CHECK_NOTHROW(derived->run(test_common::run_request(5)));
}

TEST_CASE("cancellation stops between steps and keeps the snapshots") {
  auto simulation = small_simulation();

  auto request = test_common::run_request(100, 10);
  request.on_step = [&simulation](std::size_t step) {
    if (step == 25) {
      simulation->request_cancel();
    }
  };

  const auto result = simulation->run(request);
  CHECK(result.cancelled);
  CHECK(result.steps_completed == 26);
  CHECK(simulation->state() == seiswave::SimulationState::Cancelled);
  CHECK(simulation->snapshots().steps() == std::vector<std::size_t>{0, 10, 20});

  auto resume = test_common::run_request(20, 10);
  resume.resume = true;
  const auto resumed = simulation->run(resume);
  CHECK_FALSE(resumed.cancelled);
  CHECK(simulation->state() == seiswave::SimulationState::Completed);
  CHECK(simulation->steps_completed() == 46);
  CHECK(simulation->snapshots().steps() == std::vector<std::size_t>{0, 10, 20, 30, 40});
}

TEST_CASE("a cancel requested before the run starts is honoured once") {
  auto simulation = small_simulation();
  simulation->request_cancel();

  const auto stopped = simulation->run(test_common::run_request(10));
  CHECK(stopped.cancelled);
  CHECK(stopped.steps_completed == 0);
  CHECK(simulation->state() == seiswave::SimulationState::Cancelled);
  CHECK(simulation->snapshots().empty());

  const auto resumed = simulation->run(test_common::run_request(10));
  CHECK_FALSE(resumed.cancelled);
  CHECK(resumed.steps_completed == 10);
  CHECK(simulation->state() == seiswave::SimulationState::Completed);
}

TEST_CASE("a cancel raised during the final step does not leak into the next run") {
  auto simulation = small_simulation();
  auto request = test_common::run_request(5);
  request.on_step = [&simulation](std::size_t step) {
    if (step == 4) {
      simulation->request_cancel();
    }
  };

  CHECK_FALSE(simulation->run(request).cancelled);
  CHECK(simulation->state() == seiswave::SimulationState::Completed);
  CHECK(simulation->run(test_common::run_request(5)).steps_completed == 5);
}

TEST_CASE("resuming continues exactly where an uninterrupted run would be") {
  auto straight = small_simulation();
  straight->run(test_common::run_request(60, 60));

  auto split = small_simulation();
  split->run(test_common::run_request(35, 60));
  auto rest = test_common::run_request(25, 60);
  rest.resume = true;
  split->run(rest);

  CHECK(split->steps_completed() == 60);
  CHECK(split->wavefield().data() == straight->wavefield().data());
}

TEST_CASE("a fresh run resets the wavefield and the snapshot sequence") {
  auto simulation = small_simulation();
  simulation->run(test_common::run_request(40, 10));
  const auto first = simulation->wavefield();

  simulation->run(test_common::run_request(40, 20));
  CHECK(simulation->steps_completed() == 40);
  CHECK(simulation->wavefield().data() == first.data());
  CHECK(simulation->snapshots().steps() == std::vector<std::size_t>{0, 20});

  simulation->clear_snapshots();
  CHECK(simulation->snapshots().empty());
}

TEST_CASE("a blown-up wavefield halts the run with the offending step") {
  auto config = test_common::default_config();
  config.overflow_sample_stride = 1;
  auto simulation = seiswave::make_simulation(test_common::uniform_medium(31, 31, 10.0, 2000.0), config);
  const double dt = simulation->time_step();
  const auto handle = simulation->add_source(
      15, 15, std::make_unique<seiswave::FunctionWavelet>([dt](double t) {
        return t >= 9.5 * dt ? std::numeric_limits<double>::quiet_NaN() : 1.0;
      }));

  try {
    simulation->run(test_common::run_request(50, 5));
    FAIL("expected StepOverflowError");
  } catch (const seiswave::StepOverflowError& error) {
    CHECK(error.step() == 10);
  }

  CHECK(simulation->state() == seiswave::SimulationState::Failed);
  CHECK(simulation->steps_completed() == 10);
  CHECK(simulation->snapshots().steps() == std::vector<std::size_t>{0, 5});
  for (const auto& snapshot : simulation->snapshots()) {
    CHECK(std::isfinite(test_common::max_abs(snapshot.pressure)));
  }

  auto resume = test_common::run_request(5);
  resume.resume = true;
  CHECK_THROWS_AS(simulation->run(resume), std::logic_error);

  CHECK(simulation->remove_source(handle));
  CHECK_NOTHROW(simulation->run(test_common::run_request(5)));
  CHECK(simulation->state() == seiswave::SimulationState::Completed);
}

TEST_CASE("sampled overflow checks still catch a diverging field") {
  auto simulation = small_simulation();
  const double dt = simulation->time_step();
  simulation->add_source(5, 25, std::make_unique<seiswave::FunctionWavelet>([dt](double t) {
    return t >= 9.5 * dt ? std::numeric_limits<double>::infinity() : 0.0;
  }));

  try {
    simulation->run(test_common::run_request(100, 1000));
    FAIL("expected StepOverflowError");
  } catch (const seiswave::StepOverflowError& error) {
    CHECK(error.step() >= 10);
    CHECK(error.step() <= 20);
  }
  CHECK(simulation->snapshots().steps() == std::vector<std::size_t>{0});
}

TEST_CASE("invalid run requests are rejected") {
  auto simulation = small_simulation();
  CHECK_THROWS_AS(simulation->run(test_common::run_request(10, 0)), std::invalid_argument);
  CHECK(simulation->state() == seiswave::SimulationState::Ready);

  auto request = test_common::run_request(10);
  request.on_step = [&simulation](std::size_t) { simulation->run(test_common::run_request(1)); };
  CHECK_THROWS_AS(simulation->run(request), std::logic_error);
  CHECK(simulation->state() == seiswave::SimulationState::Failed);
}
