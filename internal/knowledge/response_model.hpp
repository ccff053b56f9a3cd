#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/surrogate/surrogate_model.hpp"

namespace fabplan::knowledge {

struct HistoricalRun {
  std::map<std::string, double> parameters;
  double                        metric = 0.0;
};

/*
  Fits the response surface of one (tool, category) pair from its historical
  runs. Every run must report the same parameter names; theta entries default
  to 1.0 for parameters they do not mention.

  Throws std::invalid_argument for inconsistent runs.
*/
std::shared_ptr<const surrogate::SurrogateModel> FitResponseModel(const std::vector<HistoricalRun>& runs,
                                                                  const std::map<std::string, double>& theta = {});

} // namespace fabplan::knowledge
