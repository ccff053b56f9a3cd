#pragma once

#include <cstddef>
#include <cstdint>

#include <Eigen/Core>

#include "internal/optimizer/box_bfgs.hpp"

namespace fabplan::optimizer {

struct GridSearchResult {
  Eigen::VectorXd x;
  double          value       = 0.0;
  std::size_t     evaluations = 0;
};

/*
  Exhaustive search over a regular grid spanning [lower, upper].

  points_per_axis below 2 evaluates the box midpoint only. Ties keep the first
  grid point in odometer order, so the result is deterministic.
*/
GridSearchResult MinimizeOnGrid(const Objective& objective, const Eigen::VectorXd& lower, const Eigen::VectorXd& upper,
                                std::uint32_t points_per_axis);

} // namespace fabplan::optimizer
