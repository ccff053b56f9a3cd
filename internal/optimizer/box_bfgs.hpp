#pragma once

#include <cstdint>
#include <functional>

#include <Eigen/Core>

namespace fabplan::optimizer {

using Objective = std::function<double(const Eigen::VectorXd&)>;

struct BoxBfgsOptions {
  // Hard cap on quasi-Newton iterations. Bounds work, not wall-clock time.
  std::uint32_t max_iterations = 100;
  // Infinity norm of the projected gradient below which x is stationary.
  double gradient_tolerance = 1e-6;
  // Relative objective decrease below which the search has converged.
  double function_tolerance = 1e-12;
};

struct BoxBfgsResult {
  Eigen::VectorXd x;
  double          value      = 0.0;
  std::uint32_t   iterations = 0;
  bool            converged  = false;
};

/*
  Projected BFGS for box constrained minimization.

  Gradients are central differences (one sided at active bounds). Steps are
  projected onto [lower, upper] and accepted by Armijo backtracking along the
  projected path. Every iterate is feasible; a non-converged result is still
  the best feasible point found.
*/
BoxBfgsResult MinimizeBoxBfgs(const Objective& objective, const Eigen::VectorXd& start, const Eigen::VectorXd& lower,
                              const Eigen::VectorXd& upper, const BoxBfgsOptions& options);

// Component-wise clamp onto [lower, upper].
Eigen::VectorXd ProjectOntoBox(const Eigen::VectorXd& x, const Eigen::VectorXd& lower, const Eigen::VectorXd& upper);

} // namespace fabplan::optimizer
