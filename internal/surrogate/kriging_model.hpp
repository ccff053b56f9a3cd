#pragma once

#include <memory>
#include <string>
#include <vector>

#include <Eigen/Core>

#include "internal/surrogate/surrogate_model.hpp"

namespace fabplan::surrogate {

struct TrainingSample {
  Eigen::VectorXd parameters;
  double          metric = 0.0;
};

/*
  Ordinary kriging interpolator with a Gaussian correlation kernel.

  Inputs are normalized to the bounding box of the training data. theta holds
  one inverse length scale per parameter in normalized units. Fitting happens
  once, when the knowledge store loads historical runs.
*/
class KrigingModel final : public SurrogateModel {
 public:
  static std::shared_ptr<KrigingModel> Fit(std::vector<std::string> parameter_names, const std::vector<TrainingSample>& samples,
                                           Eigen::VectorXd theta = Eigen::VectorXd());

  const std::vector<std::string>& ParameterNames() const override {
    return parameter_names_;
  }

  double Predict(const Eigen::VectorXd& parameters) const override;

  double Mean() const {
    return mean_;
  }

 private:
  KrigingModel() = default;

  double Correlation(const Eigen::VectorXd& a, const Eigen::VectorXd& b) const;

  Eigen::VectorXd Normalize(const Eigen::VectorXd& parameters) const;

  std::vector<std::string> parameter_names_;
  Eigen::VectorXd          lower_;
  Eigen::VectorXd          scale_;
  Eigen::VectorXd          theta_;
  Eigen::MatrixXd          normalized_samples_; // one sample per row
  Eigen::VectorXd          weights_;
  double                   mean_ = 0.0;
};

} // namespace fabplan::surrogate
