#include "box_bfgs.hpp"

#include <algorithm>
#include <cmath>

namespace fabplan::optimizer {

namespace {

constexpr double kArmijo           = 1e-4;
constexpr int    kMaxBacktracks    = 40;
constexpr double kRelativeStep     = 1e-6;
constexpr double kCurvatureEpsilon = 1e-12;

Eigen::VectorXd NumericGradient(const Objective& objective, const Eigen::VectorXd& x, const Eigen::VectorXd& lower,
                                const Eigen::VectorXd& upper) {
  Eigen::VectorXd gradient(x.size());
  for (Eigen::Index i = 0; i < x.size(); ++i) {
    const double h = kRelativeStep * std::max(1.0, upper(i) - lower(i));

    Eigen::VectorXd forward  = x;
    Eigen::VectorXd backward = x;
    forward(i)               = std::min(upper(i), x(i) + h);
    backward(i)              = std::max(lower(i), x(i) - h);

    const double span = forward(i) - backward(i);
    gradient(i)       = span > 0.0 ? (objective(forward) - objective(backward)) / span : 0.0;
  }
  return gradient;
}

} // namespace

Eigen::VectorXd ProjectOntoBox(const Eigen::VectorXd& x, const Eigen::VectorXd& lower, const Eigen::VectorXd& upper) {
  return x.cwiseMax(lower).cwiseMin(upper);
}

BoxBfgsResult MinimizeBoxBfgs(const Objective& objective, const Eigen::VectorXd& start, const Eigen::VectorXd& lower,
                              const Eigen::VectorXd& upper, const BoxBfgsOptions& options) {
  const auto n = start.size();

  BoxBfgsResult result;
  result.x     = ProjectOntoBox(start, lower, upper);
  result.value = objective(result.x);

  Eigen::VectorXd gradient         = NumericGradient(objective, result.x, lower, upper);
  Eigen::MatrixXd inverse_hessian  = Eigen::MatrixXd::Identity(n, n);
  bool            hessian_is_reset = true;

  while (result.iterations < options.max_iterations) {
    if (!std::isfinite(result.value) || !gradient.allFinite()) {
      return result;
    }

    const Eigen::VectorXd projected_gradient = ProjectOntoBox(result.x - gradient, lower, upper) - result.x;
    if (projected_gradient.lpNorm<Eigen::Infinity>() <= options.gradient_tolerance) {
      result.converged = true;
      return result;
    }

    ++result.iterations;

    Eigen::VectorXd direction = -inverse_hessian * gradient;
    for (Eigen::Index i = 0; i < n; ++i) {
      const bool at_lower = result.x(i) <= lower(i) && direction(i) < 0.0;
      const bool at_upper = result.x(i) >= upper(i) && direction(i) > 0.0;
      if (at_lower || at_upper) {
        direction(i) = 0.0;
      }
    }
    if (gradient.dot(direction) >= 0.0) {
      inverse_hessian.setIdentity();
      hessian_is_reset = true;
      direction        = projected_gradient;
    }

    // Without curvature information the raw gradient carries the
    // objective's units; cap the first trial step at unit length.
    double alpha = 1.0;
    if (hessian_is_reset) {
      const double largest = direction.lpNorm<Eigen::Infinity>();
      if (largest > 1.0) {
        alpha = 1.0 / largest;
      }
    }

    // Backtrack along the projected path.
    bool            accepted = false;
    Eigen::VectorXd candidate;
    double          candidate_value = result.value;
    for (int k = 0; k < kMaxBacktracks; ++k, alpha *= 0.5) {
      candidate                  = ProjectOntoBox(result.x + alpha * direction, lower, upper);
      const Eigen::VectorXd step = candidate - result.x;
      if (step.squaredNorm() == 0.0) {
        break;
      }
      candidate_value = objective(candidate);
      if (std::isfinite(candidate_value) && candidate_value <= result.value + kArmijo * gradient.dot(step)) {
        accepted = true;
        break;
      }
    }

    if (!accepted) {
      if (hessian_is_reset) {
        // Steepest descent made no progress either.
        return result;
      }
      inverse_hessian.setIdentity();
      hessian_is_reset = true;
      continue;
    }

    const Eigen::VectorXd next_gradient = NumericGradient(objective, candidate, lower, upper);
    const Eigen::VectorXd s             = candidate - result.x;
    const Eigen::VectorXd y             = next_gradient - gradient;
    const double          sy            = s.dot(y);

    const double previous_value = result.value;
    result.x                    = candidate;
    result.value                = candidate_value;
    gradient                    = next_gradient;

    if (sy > kCurvatureEpsilon * s.norm() * y.norm()) {
      const double          rho      = 1.0 / sy;
      const Eigen::MatrixXd identity = Eigen::MatrixXd::Identity(n, n);
      inverse_hessian = (identity - rho * s * y.transpose()) * inverse_hessian * (identity - rho * y * s.transpose()) + rho * s * s.transpose();
      hessian_is_reset = false;
    }

    const double scale = std::max({1.0, std::abs(previous_value), std::abs(result.value)});
    if (result.value == 0.0 || previous_value - result.value <= options.function_tolerance * scale) {
      result.converged = true;
      return result;
    }
  }

  return result;
}

} // namespace fabplan::optimizer
