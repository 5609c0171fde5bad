#include <doctest/doctest.h>

#include <cmath>
#include <stdexcept>

#include "../test_common.hpp"
#include "seiswave/api/config_validation.hpp"
#include "seiswave/physics/acoustics.hpp"

TEST_CASE("default configuration validates cleanly") {
  const seiswave::SimulationConfig config;
  for (const auto& issue : seiswave::validate_config(config)) {
    CHECK_FALSE(issue.fatal);
  }
  CHECK_NOTHROW(seiswave::throw_if_invalid(config));
}

TEST_CASE("fatal configuration issues are collected together") {
  seiswave::SimulationConfig config;
  config.time_step = -1.0;
  config.cfl_safety = 1.5;
  config.threads = 0;
  config.overflow_sample_stride = 0;
  config.boundary.width = 0;

  const auto issues = seiswave::validate_config(config);
  std::size_t fatal = 0;
  for (const auto& issue : issues) {
    fatal += issue.fatal ? 1 : 0;
  }
  CHECK(fatal == 5);

  try {
    seiswave::throw_if_invalid(config);
    FAIL("expected std::invalid_argument");
  } catch (const std::invalid_argument& error) {
    const std::string message = error.what();
    CHECK(message.find("config.threads") != std::string::npos);
    CHECK(message.find("boundary.width") != std::string::npos);
  }
}

TEST_CASE("damping parameters are ignored for other boundary kinds") {
  seiswave::SimulationConfig config;
  config.boundary.kind = seiswave::BoundaryKind::Periodic;
  config.boundary.width = 0;
  CHECK_NOTHROW(seiswave::throw_if_invalid(config));
}

TEST_CASE("coarse sampling of the source wavelength is reported as a warning") {
  const auto coarse = seiswave::check_dispersion(1500.0, 100.0, 5.0, 2);
  REQUIRE(coarse.size() == 1);
  CHECK_FALSE(coarse.front().fatal);

  CHECK(seiswave::check_dispersion(1500.0, 10.0, 5.0, 2).empty());
  CHECK(seiswave::check_dispersion(1500.0, 0.0, 5.0, 2).empty());
  CHECK(seiswave::points_per_wavelength(1500.0, 10.0, 5.0) == doctest::Approx(30.0));
  CHECK(seiswave::min_points_per_wavelength(4) < seiswave::min_points_per_wavelength(2));
  CHECK_THROWS_AS(seiswave::wavelength(1500.0, 0.0), std::invalid_argument);
}
