#pragma once

#include <string>
#include <vector>

#include <Eigen/Core>

namespace fabplan::surrogate {

/*
  Predict-only response model for one (tool, process category) pair.

  Maps process parameters, in ParameterNames() order, to the estimated
  geometric outcome in nm. How the model was fitted is not visible here.

  Implementations are not required to be thread-safe.
*/
class SurrogateModel {
 public:
  virtual ~SurrogateModel() = default;

  virtual const std::vector<std::string>& ParameterNames() const = 0;

  virtual double Predict(const Eigen::VectorXd& parameters) const = 0;
};

} // namespace fabplan::surrogate
