#include "parameter_optimizer.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include <Eigen/Core>

#include "internal/observability/logging.hpp"
#include "internal/optimizer/box_bfgs.hpp"
#include "internal/optimizer/grid_search.hpp"
#include "internal/surrogate/surrogate_model.hpp"

namespace fabplan::optimizer {

using fabplan::observability::BoolField;
using fabplan::observability::DoubleField;
using fabplan::observability::IntField;
using fabplan::observability::StringField;

std::string AchievedMetricName(model::ProcessCategory category) {
  switch (category) {
    case model::ProcessCategory::kDeposition:
      return "achieved_thickness_nm";
    case model::ProcessCategory::kEtch:
      return "achieved_depth_nm";
    default:
      return "achieved_metric";
  }
}

ParameterOptimizer::ParameterOptimizer(OptimizerOptions options) : options_(std::move(options)) {
  for (const auto& bound : options_.bounds) {
    if (bound.name.empty() || !(bound.min <= bound.max)) {
      throw std::invalid_argument("invalid optimizer bound for parameter '" + bound.name + "'");
    }
  }
}

const ParameterBound& ParameterOptimizer::BoundFor(const std::string& name) const {
  for (const auto& bound : options_.bounds) {
    if (bound.name == name) {
      return bound;
    }
  }
  throw std::invalid_argument("no bound declared for parameter '" + name + "'");
}

model::RecipeParameters ParameterOptimizer::Optimize(const model::ToolRecord& tool, const model::Classification& classification,
                                                     const model::ChangeDescriptor& descriptor) const {
  if (!tool.surrogate_model) {
    throw std::invalid_argument("tool " + tool.tool_id + " has no surrogate model for " + std::string(model::ToString(classification.category)));
  }
  const auto& surrogate = *tool.surrogate_model;
  const auto& names     = surrogate.ParameterNames();
  const auto  n         = static_cast<Eigen::Index>(names.size());

  Eigen::VectorXd lower(n);
  Eigen::VectorXd span(n);
  for (Eigen::Index i = 0; i < n; ++i) {
    const auto& bound = BoundFor(names[static_cast<std::size_t>(i)]);
    lower(i)          = bound.min;
    span(i)           = bound.max - bound.min;
  }

  // Search runs on the unit box so parameters of different scale are
  // treated alike.
  const auto to_physical = [&](const Eigen::VectorXd& u) -> Eigen::VectorXd {
    return lower + span.cwiseProduct(u);
  };
  const double target    = descriptor.target_metric;
  const auto   objective = [&](const Eigen::VectorXd& u) {
    const double residual = surrogate.Predict(to_physical(u)) - target;
    return residual * residual;
  };

  const Eigen::VectorXd unit_lower = Eigen::VectorXd::Zero(n);
  const Eigen::VectorXd unit_upper = Eigen::VectorXd::Ones(n);
  const Eigen::VectorXd start      = Eigen::VectorXd::Constant(n, 0.5);

  BoxBfgsOptions bfgs_options;
  bfgs_options.max_iterations     = options_.max_iterations;
  bfgs_options.gradient_tolerance = options_.gradient_tolerance;
  bfgs_options.function_tolerance = options_.function_tolerance;

  const auto bfgs = MinimizeBoxBfgs(objective, start, unit_lower, unit_upper, bfgs_options);
  const auto grid = MinimizeOnGrid(objective, unit_lower, unit_upper, options_.grid_points_per_axis);
  if (!bfgs.converged) {
    FABPLAN_LOG_WARN("Optimizer did not converge, using grid fallback",
                     {StringField("tool_id", tool.tool_id), IntField("order_index", descriptor.order_index),
                      IntField("iterations", bfgs.iterations), IntField("grid_evaluations", static_cast<std::int64_t>(grid.evaluations))});
  }

  // A converged BFGS run can still sit in a local minimum at a bound; the
  // grid point wins whenever it is strictly better, refined from there.
  Eigen::VectorXd best = bfgs.x;
  if (!bfgs.converged || grid.value < bfgs.value) {
    const auto refined = MinimizeBoxBfgs(objective, grid.x, unit_lower, unit_upper, bfgs_options);
    best               = refined.value <= grid.value ? refined.x : grid.x;
    if (bfgs.converged) {
      FABPLAN_LOG_DEBUG("Grid start beat the midpoint start", {StringField("tool_id", tool.tool_id), DoubleField("bfgs_value", bfgs.value),
                                                              DoubleField("grid_value", grid.value), DoubleField("refined_value", refined.value)});
    }
  }

  // Guard the bound invariant against rounding in the affine map.
  Eigen::VectorXd physical = to_physical(ProjectOntoBox(best, unit_lower, unit_upper));

  model::RecipeParameters recipe;
  for (Eigen::Index i = 0; i < n; ++i) {
    const auto& bound = BoundFor(names[static_cast<std::size_t>(i)]);
    physical(i)       = std::min(bound.max, std::max(bound.min, physical(i)));
    recipe.numeric.push_back({bound.name, physical(i)});
  }
  recipe.achieved = model::NumericParameter{AchievedMetricName(classification.category), surrogate.Predict(physical)};

  FABPLAN_LOG_DEBUG("Optimized recipe", {StringField("tool_id", tool.tool_id), DoubleField("target", target),
                                         DoubleField("achieved", recipe.achieved->value), BoolField("converged", bfgs.converged)});
  return recipe;
}

} // namespace fabplan::optimizer
