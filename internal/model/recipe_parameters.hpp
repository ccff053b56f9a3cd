#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fabplan::model {

struct NumericParameter {
  std::string name;
  double      value = 0.0;
};

struct TextParameter {
  std::string name;
  std::string value;
};

/*
  Recipe for one process step.

  numeric holds optimized parameters in declaration order; every value lies
  inside its declared bound. achieved is the surrogate estimate of the target
  metric (achieved_thickness_nm / achieved_depth_nm). text carries the mask
  file and sub-recipe names of lithography steps.
*/
struct RecipeParameters {
  std::vector<NumericParameter>   numeric;
  std::optional<NumericParameter> achieved;
  std::vector<TextParameter>      text;

  std::optional<double>      Number(std::string_view name) const;
  std::optional<std::string> Text(std::string_view name) const;
};

inline std::optional<double> RecipeParameters::Number(std::string_view name) const {
  for (const auto& parameter : numeric) {
    if (parameter.name == name) {
      return parameter.value;
    }
  }
  if (achieved && achieved->name == name) {
    return achieved->value;
  }
  return std::nullopt;
}

inline std::optional<std::string> RecipeParameters::Text(std::string_view name) const {
  for (const auto& parameter : text) {
    if (parameter.name == name) {
      return parameter.value;
    }
  }
  return std::nullopt;
}

} // namespace fabplan::model
