#include "response_model.hpp"

#include <stdexcept>

#include "internal/surrogate/kriging_model.hpp"

namespace fabplan::knowledge {

std::shared_ptr<const surrogate::SurrogateModel> FitResponseModel(const std::vector<HistoricalRun>& runs,
                                                                  const std::map<std::string, double>& theta) {
  if (runs.empty()) {
    throw std::invalid_argument("response model requires at least one historical run");
  }

  std::vector<std::string> names;
  for (const auto& [name, value] : runs.front().parameters) {
    names.push_back(name);
  }

  const auto dims = static_cast<Eigen::Index>(names.size());

  std::vector<surrogate::TrainingSample> samples;
  samples.reserve(runs.size());
  for (const auto& run : runs) {
    if (run.parameters.size() != names.size()) {
      throw std::invalid_argument("historical runs report different parameter sets");
    }

    surrogate::TrainingSample sample;
    sample.parameters.resize(dims);
    for (Eigen::Index i = 0; i < dims; ++i) {
      auto it = run.parameters.find(names[static_cast<std::size_t>(i)]);
      if (it == run.parameters.end()) {
        throw std::invalid_argument("historical run is missing parameter '" + names[static_cast<std::size_t>(i)] + "'");
      }
      sample.parameters(i) = it->second;
    }
    sample.metric = run.metric;
    samples.push_back(std::move(sample));
  }

  Eigen::VectorXd length_scales = Eigen::VectorXd::Ones(dims);
  for (Eigen::Index i = 0; i < dims; ++i) {
    auto it = theta.find(names[static_cast<std::size_t>(i)]);
    if (it != theta.end()) {
      length_scales(i) = it->second;
    }
  }

  return surrogate::KrigingModel::Fit(std::move(names), samples, std::move(length_scales));
}

} // namespace fabplan::knowledge
