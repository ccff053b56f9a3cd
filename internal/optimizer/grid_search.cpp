#include "grid_search.hpp"

#include <cmath>
#include <limits>
#include <vector>

namespace fabplan::optimizer {

GridSearchResult MinimizeOnGrid(const Objective& objective, const Eigen::VectorXd& lower, const Eigen::VectorXd& upper,
                                std::uint32_t points_per_axis) {
  const auto n = lower.size();

  GridSearchResult best;
  best.x     = 0.5 * (lower + upper);
  best.value = std::numeric_limits<double>::infinity();

  if (points_per_axis < 2) {
    best.value       = objective(best.x);
    best.evaluations = 1;
    return best;
  }

  std::vector<std::uint32_t> index(static_cast<std::size_t>(n), 0);
  Eigen::VectorXd            point(n);
  const double               steps = static_cast<double>(points_per_axis - 1);

  while (true) {
    for (Eigen::Index i = 0; i < n; ++i) {
      const double t = static_cast<double>(index[static_cast<std::size_t>(i)]) / steps;
      point(i)       = lower(i) + t * (upper(i) - lower(i));
    }

    const double value = objective(point);
    ++best.evaluations;
    if (std::isfinite(value) && value < best.value) {
      best.value = value;
      best.x     = point;
    }

    // Odometer increment; the last axis varies fastest.
    Eigen::Index axis = n - 1;
    while (axis >= 0) {
      auto& digit = index[static_cast<std::size_t>(axis)];
      if (++digit < points_per_axis) {
        break;
      }
      digit = 0;
      --axis;
    }
    if (axis < 0) {
      break;
    }
  }

  return best;
}

} // namespace fabplan::optimizer
