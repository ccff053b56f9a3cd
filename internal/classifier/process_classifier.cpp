#include "process_classifier.hpp"

namespace fabplan::classifier {

using model::ChangeDescriptor;
using model::Polarity;
using model::ProcessCategory;
using model::ProcessSubtype;

namespace {

bool ConformalAddition(const ChangeDescriptor& d, const ClassifierThresholds& t) {
  return d.polarity == Polarity::kAddition && d.aspect_ratio > t.conformal_aspect_ratio;
}

bool PlanarAddition(const ChangeDescriptor& d, const ClassifierThresholds&) {
  return d.polarity == Polarity::kAddition;
}

bool AnisotropicRemoval(const ChangeDescriptor& d, const ClassifierThresholds& t) {
  return d.polarity == Polarity::kRemoval && d.aspect_ratio < t.anisotropic_aspect_ratio;
}

bool IsotropicRemoval(const ChangeDescriptor& d, const ClassifierThresholds&) {
  return d.polarity == Polarity::kRemoval;
}

bool PatterningTransition(const ChangeDescriptor& d, const ClassifierThresholds&) {
  return d.patterning;
}

} // namespace

ProcessClassifier::ProcessClassifier(ClassifierThresholds thresholds) : thresholds_(thresholds) {
}

const std::array<ClassificationRule, 5>& ProcessClassifier::Rules() {
  static const std::array<ClassificationRule, 5> kRules = {{
      {"conformal_deposition", &ConformalAddition, ProcessCategory::kDeposition, ProcessSubtype::kConformal},
      {"planar_deposition", &PlanarAddition, ProcessCategory::kDeposition, ProcessSubtype::kPlanar},
      {"anisotropic_etch", &AnisotropicRemoval, ProcessCategory::kEtch, ProcessSubtype::kAnisotropic},
      {"isotropic_etch", &IsotropicRemoval, ProcessCategory::kEtch, ProcessSubtype::kIsotropic},
      {"patterning", &PatterningTransition, ProcessCategory::kLithography, ProcessSubtype::kNone},
  }};
  return kRules;
}

model::Classification ProcessClassifier::Classify(const ChangeDescriptor& descriptor) const {
  for (const auto& rule : Rules()) {
    if (rule.matches(descriptor, thresholds_)) {
      return {rule.category, rule.subtype, rule.name};
    }
  }
  return {ProcessCategory::kUnknown, ProcessSubtype::kNone, kFallbackRule};
}

} // namespace fabplan::classifier
