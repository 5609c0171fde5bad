#include <doctest/doctest.h>

#include <cmath>
#include <limits>
#include <vector>

#include "../test_common.hpp"
#include "seiswave/api/errors.hpp"
#include "seiswave/medium/medium.hpp"

TEST_CASE("medium exposes per-cell properties and velocity extremes") {
  const seiswave::Grid2D grid(6, 5, 2.0);
  std::vector<double> velocity(grid.total_points(), 1500.0);
  std::vector<double> density(grid.total_points(), 1000.0);
  velocity[grid.flatten(4, 3)] = 3200.0;
  velocity[grid.flatten(0, 1)] = 900.0;
  density[grid.flatten(2, 2)] = 2400.0;

  const seiswave::Medium medium(grid, velocity, density);

  CHECK(medium.grid().rows() == 6);
  CHECK(medium.grid().cols() == 5);
  CHECK(medium.velocity(4, 3) == doctest::Approx(3200.0));
  CHECK(medium.density(2, 2) == doctest::Approx(2400.0));
  CHECK(medium.max_velocity() == doctest::Approx(3200.0));
  CHECK(medium.min_velocity() == doctest::Approx(900.0));
  CHECK_THROWS_AS(medium.velocity(6, 0), std::out_of_range);
}

TEST_CASE("medium rejects mismatched shapes") {
  const seiswave::Grid2D grid(5, 5, 1.0);
  CHECK_THROWS_AS(seiswave::Medium(grid, std::vector<double>(24, 1.0), std::vector<double>(25, 1.0)),
                  seiswave::InvalidMediumError);
  CHECK_THROWS_AS(seiswave::Medium(grid, std::vector<double>(25, 1.0), std::vector<double>(30, 1.0)),
                  seiswave::InvalidMediumError);

  const seiswave::Field2D<double> velocity(seiswave::Grid2D(5, 6, 1.0), 1.0);
  const seiswave::Field2D<double> density(seiswave::Grid2D(6, 5, 1.0), 1.0);
  CHECK_THROWS_AS(seiswave::Medium(velocity, density), seiswave::InvalidMediumError);
}

TEST_CASE("medium rejects non-physical property values") {
  const seiswave::Grid2D grid(5, 5, 1.0);
  const std::vector<double> ones(25, 1.0);

  for (const double bad : {0.0, -1500.0, std::numeric_limits<double>::quiet_NaN(),
                           std::numeric_limits<double>::infinity()}) {
    std::vector<double> values = ones;
    values[12] = bad;
    CHECK_THROWS_AS(seiswave::Medium(grid, values, ones), seiswave::InvalidMediumError);
    CHECK_THROWS_AS(seiswave::Medium(grid, ones, values), seiswave::InvalidMediumError);
  }
}

TEST_CASE("grid rejects non-positive spacing and undersized shapes") {
  CHECK_THROWS_AS(seiswave::Grid2D(10, 10, 0.0), seiswave::InvalidMediumError);
  CHECK_THROWS_AS(seiswave::Grid2D(10, 10, -5.0), seiswave::InvalidMediumError);
  CHECK_THROWS_AS(seiswave::Grid2D(4, 10, 1.0), seiswave::InvalidMediumError);
  CHECK_THROWS_AS(seiswave::Grid2D(10, 3, 1.0), seiswave::InvalidMediumError);
  CHECK_NOTHROW(seiswave::Grid2D(5, 5, 1.0));

  const seiswave::Grid2D grid(300, 400, 5.0);
  CHECK(grid.height() == doctest::Approx(1500.0));
  CHECK(grid.width() == doctest::Approx(2000.0));
}

TEST_CASE("padded medium replicates edge properties outward") {
  const seiswave::Grid2D grid(5, 5, 1.0);
  std::vector<double> velocity(25, 0.0);
  for (std::size_t r = 0; r < 5; ++r) {
    for (std::size_t c = 0; c < 5; ++c) {
      velocity[grid.flatten(r, c)] = 1000.0 + 100.0 * static_cast<double>(r) + static_cast<double>(c);
    }
  }
  const seiswave::Medium medium(grid, velocity, std::vector<double>(25, 1000.0));
  const seiswave::Medium padded = medium.padded(2, 3, 1, 4);

  CHECK(padded.grid().rows() == 10);
  CHECK(padded.grid().cols() == 10);
  CHECK(padded.velocity(0, 0) == doctest::Approx(medium.velocity(0, 0)));
  CHECK(padded.velocity(2, 1) == doctest::Approx(medium.velocity(0, 0)));
  CHECK(padded.velocity(6, 5) == doctest::Approx(medium.velocity(4, 4)));
  CHECK(padded.velocity(9, 9) == doctest::Approx(medium.velocity(4, 4)));
  CHECK(padded.velocity(4, 3) == doctest::Approx(medium.velocity(2, 2)));
  CHECK(padded.max_velocity() == doctest::Approx(medium.max_velocity()));
}

TEST_CASE("layered medium assigns properties by depth") {
  const seiswave::Grid2D grid(10, 6, 5.0);
  const auto medium = seiswave::Medium::layered(grid, {{0, 1500.0, 1000.0}, {4, 2500.0, 2200.0}, {7, 3500.0, 2600.0}});

  CHECK(medium.velocity(0, 0) == doctest::Approx(1500.0));
  CHECK(medium.velocity(3, 5) == doctest::Approx(1500.0));
  CHECK(medium.velocity(4, 2) == doctest::Approx(2500.0));
  CHECK(medium.density(6, 1) == doctest::Approx(2200.0));
  CHECK(medium.velocity(9, 5) == doctest::Approx(3500.0));
  CHECK(medium.min_velocity() == doctest::Approx(1500.0));
  CHECK(medium.max_velocity() == doctest::Approx(3500.0));

  CHECK_THROWS_AS(seiswave::Medium::layered(grid, {}), seiswave::InvalidMediumError);
  CHECK_THROWS_AS(seiswave::Medium::layered(grid, {{2, 1500.0, 1000.0}}), seiswave::InvalidMediumError);
  CHECK_THROWS_AS(seiswave::Medium::layered(grid, {{0, 1500.0, 1000.0}, {0, 2000.0, 1000.0}}),
                  seiswave::InvalidMediumError);
  CHECK_THROWS_AS(seiswave::Medium::layered(grid, {{0, 1500.0, 1000.0}, {12, 2000.0, 1000.0}}),
                  seiswave::InvalidMediumError);
  CHECK_THROWS_AS(seiswave::Medium::layered(grid, {{0, -1500.0, 1000.0}}), seiswave::InvalidMediumError);
}
