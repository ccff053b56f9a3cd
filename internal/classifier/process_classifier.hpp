#pragma once

#include <array>
#include <string_view>

#include "internal/model/change_descriptor.hpp"
#include "internal/model/process_category.hpp"

namespace fabplan::classifier {

struct ClassifierThresholds {
  // ADDITION above this aspect ratio is conformal deposition.
  double conformal_aspect_ratio = 5.0;
  // REMOVAL below this aspect ratio is anisotropic etch.
  double anisotropic_aspect_ratio = 0.5;
};

/*
  One entry of the ordered rule table. Rules are evaluated in table order and
  the first match wins.
*/
struct ClassificationRule {
  std::string_view name;
  bool (*matches)(const model::ChangeDescriptor&, const ClassifierThresholds&);
  model::ProcessCategory category;
  model::ProcessSubtype  subtype;
};

inline constexpr std::string_view kFallbackRule = "unknown";

/*
  Maps a change descriptor to a process category.

  Total and side-effect free: combinations no rule covers classify as
  UNKNOWN with rule name kFallbackRule.
*/
class ProcessClassifier {
 public:
  explicit ProcessClassifier(ClassifierThresholds thresholds = {});

  model::Classification Classify(const model::ChangeDescriptor& descriptor) const;

  const ClassifierThresholds& Thresholds() const {
    return thresholds_;
  }

  static const std::array<ClassificationRule, 5>& Rules();

 private:
  ClassifierThresholds thresholds_;
};

} // namespace fabplan::classifier
