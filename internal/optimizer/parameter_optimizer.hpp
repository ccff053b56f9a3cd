#pragma once

#include <cstdint>
#include <vector>

#include "internal/model/change_descriptor.hpp"
#include "internal/model/process_category.hpp"
#include "internal/model/recipe_parameters.hpp"
#include "internal/model/tool_record.hpp"
#include "internal/optimizer/parameter_bounds.hpp"

namespace fabplan::optimizer {

struct OptimizerOptions {
  std::vector<ParameterBound> bounds = DefaultBounds();

  std::uint32_t max_iterations       = 100;
  std::uint32_t grid_points_per_axis = 11;
  double        gradient_tolerance   = 1e-6;
  double        function_tolerance   = 1e-12;
};

/*
  Finds process parameters whose surrogate estimate matches the change's
  target metric.

  Search starts at the bound midpoint and runs projected BFGS. A coarse grid
  over the bounds backs it up: when the iteration cap is hit before
  convergence, or the best grid point beats the converged BFGS point, the
  search is refined from the grid point instead. The result is always inside
  the bounds and identical for identical inputs.
*/
class ParameterOptimizer {
 public:
  explicit ParameterOptimizer(OptimizerOptions options = {});

  // Throws std::invalid_argument when the tool carries no surrogate model or
  // the model uses a parameter without a declared bound.
  model::RecipeParameters Optimize(const model::ToolRecord& tool, const model::Classification& classification,
                                   const model::ChangeDescriptor& descriptor) const;

  const OptimizerOptions& Options() const {
    return options_;
  }

 private:
  const ParameterBound& BoundFor(const std::string& name) const;

  OptimizerOptions options_;
};

// achieved_thickness_nm for deposition, achieved_depth_nm for etch.
std::string AchievedMetricName(model::ProcessCategory category);

} // namespace fabplan::optimizer
