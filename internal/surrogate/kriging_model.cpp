#include "kriging_model.hpp"

#include <cmath>
#include <stdexcept>

#include <Eigen/Cholesky>

namespace fabplan::surrogate {

namespace {

// Keeps the correlation matrix positive definite when samples coincide.
constexpr double kNugget = 1e-10;

} // namespace

std::shared_ptr<KrigingModel> KrigingModel::Fit(std::vector<std::string> parameter_names, const std::vector<TrainingSample>& samples,
                                                Eigen::VectorXd theta) {
  const auto dims = static_cast<Eigen::Index>(parameter_names.size());
  if (dims == 0) {
    throw std::invalid_argument("kriging fit requires at least one parameter");
  }
  if (samples.empty()) {
    throw std::invalid_argument("kriging fit requires at least one training sample");
  }
  if (theta.size() == 0) {
    theta = Eigen::VectorXd::Ones(dims);
  }
  if (theta.size() != dims || (theta.array() <= 0.0).any()) {
    throw std::invalid_argument("kriging theta must hold one positive value per parameter");
  }

  const auto count = static_cast<Eigen::Index>(samples.size());
  Eigen::MatrixXd x(count, dims);
  Eigen::VectorXd y(count);
  for (Eigen::Index i = 0; i < count; ++i) {
    const auto& sample = samples[static_cast<std::size_t>(i)];
    if (sample.parameters.size() != dims) {
      throw std::invalid_argument("training sample has " + std::to_string(sample.parameters.size()) + " parameters, expected " +
                                  std::to_string(dims));
    }
    if (!sample.parameters.allFinite() || !std::isfinite(sample.metric)) {
      throw std::invalid_argument("training sample contains a non-finite value");
    }
    x.row(i) = sample.parameters.transpose();
    y(i)     = sample.metric;
  }

  auto model              = std::shared_ptr<KrigingModel>(new KrigingModel());
  model->parameter_names_ = std::move(parameter_names);
  model->theta_           = std::move(theta);
  model->lower_           = x.colwise().minCoeff().transpose();
  model->scale_           = (x.colwise().maxCoeff() - x.colwise().minCoeff()).transpose();
  for (Eigen::Index j = 0; j < dims; ++j) {
    if (model->scale_(j) <= 0.0) {
      model->scale_(j) = 1.0;
    }
  }

  model->normalized_samples_.resize(count, dims);
  for (Eigen::Index i = 0; i < count; ++i) {
    model->normalized_samples_.row(i) = model->Normalize(x.row(i).transpose()).transpose();
  }

  Eigen::MatrixXd correlation(count, count);
  for (Eigen::Index i = 0; i < count; ++i) {
    for (Eigen::Index j = i; j < count; ++j) {
      const double r    = model->Correlation(model->normalized_samples_.row(i).transpose(), model->normalized_samples_.row(j).transpose());
      correlation(i, j) = r;
      correlation(j, i) = r;
    }
    correlation(i, i) += kNugget;
  }

  Eigen::LDLT<Eigen::MatrixXd> solver(correlation);
  if (solver.info() != Eigen::Success) {
    throw std::runtime_error("kriging correlation matrix factorization failed");
  }

  const Eigen::VectorXd ones      = Eigen::VectorXd::Ones(count);
  const Eigen::VectorXd r_inv_one = solver.solve(ones);
  const Eigen::VectorXd r_inv_y   = solver.solve(y);
  model->mean_                    = ones.dot(r_inv_y) / ones.dot(r_inv_one);
  model->weights_                 = solver.solve(y - model->mean_ * ones);

  return model;
}

double KrigingModel::Predict(const Eigen::VectorXd& parameters) const {
  if (parameters.size() != static_cast<Eigen::Index>(parameter_names_.size())) {
    throw std::invalid_argument("kriging predict: parameter count mismatch");
  }

  const Eigen::VectorXd u = Normalize(parameters);
  double prediction = mean_;
  for (Eigen::Index i = 0; i < normalized_samples_.rows(); ++i) {
    prediction += weights_(i) * Correlation(u, normalized_samples_.row(i).transpose());
  }
  return prediction;
}

double KrigingModel::Correlation(const Eigen::VectorXd& a, const Eigen::VectorXd& b) const {
  const Eigen::VectorXd diff = a - b;
  return std::exp(-(theta_.array() * diff.array().square()).sum());
}

Eigen::VectorXd KrigingModel::Normalize(const Eigen::VectorXd& parameters) const {
  return ((parameters - lower_).array() / scale_.array()).matrix();
}

} // namespace fabplan::surrogate
