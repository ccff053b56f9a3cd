#include "internal/classifier/process_classifier.hpp"

#include <cassert>
#include <iostream>

namespace {

using fabplan::classifier::ClassifierThresholds;
using fabplan::classifier::ProcessClassifier;
using fabplan::model::ChangeDescriptor;
using fabplan::model::Polarity;
using fabplan::model::ProcessCategory;
using fabplan::model::ProcessSubtype;
using fabplan::model::WaferSize;

ChangeDescriptor MakeChange(Polarity polarity, double aspect_ratio, bool patterning = false) {
  ChangeDescriptor d;
  d.polarity           = polarity;
  d.primary_material   = "oxide";
  d.aspect_ratio       = aspect_ratio;
  d.conformality_score = 0.5;
  d.target_metric      = 100.0;
  d.wafer_size         = WaferSize::k300mm;
  d.patterning         = patterning;
  return d;
}

void TestAdditionRules() {
  ProcessClassifier classifier;

  auto conformal = classifier.Classify(MakeChange(Polarity::kAddition, 10.0));
  assert(conformal.category == ProcessCategory::kDeposition);
  assert(conformal.subtype == ProcessSubtype::kConformal);
  assert(conformal.rule == "conformal_deposition");

  auto planar = classifier.Classify(MakeChange(Polarity::kAddition, 2.0));
  assert(planar.category == ProcessCategory::kDeposition);
  assert(planar.subtype == ProcessSubtype::kPlanar);

  // Threshold itself is not above the threshold.
  assert(classifier.Classify(MakeChange(Polarity::kAddition, 5.0)).subtype == ProcessSubtype::kPlanar);
}

void TestRemovalRules() {
  ProcessClassifier classifier;

  auto anisotropic = classifier.Classify(MakeChange(Polarity::kRemoval, 0.2));
  assert(anisotropic.category == ProcessCategory::kEtch);
  assert(anisotropic.subtype == ProcessSubtype::kAnisotropic);

  auto isotropic = classifier.Classify(MakeChange(Polarity::kRemoval, 1.0));
  assert(isotropic.category == ProcessCategory::kEtch);
  assert(isotropic.subtype == ProcessSubtype::kIsotropic);

  assert(classifier.Classify(MakeChange(Polarity::kRemoval, 0.5)).subtype == ProcessSubtype::kIsotropic);
}

void TestPatterningAndFallback() {
  ProcessClassifier classifier;

  auto litho = classifier.Classify(MakeChange(Polarity::kModification, 1.0, true));
  assert(litho.category == ProcessCategory::kLithography);
  assert(litho.rule == "patterning");

  // Polarity rules come first in the table.
  assert(classifier.Classify(MakeChange(Polarity::kAddition, 1.0, true)).category == ProcessCategory::kDeposition);
  assert(classifier.Classify(MakeChange(Polarity::kRemoval, 1.0, true)).category == ProcessCategory::kEtch);

  auto unknown = classifier.Classify(MakeChange(Polarity::kModification, 1.0));
  assert(unknown.category == ProcessCategory::kUnknown);
  assert(unknown.subtype == ProcessSubtype::kNone);
  assert(unknown.rule == fabplan::classifier::kFallbackRule);

  assert(classifier.Classify(MakeChange(Polarity::kUnspecified, 1.0)).category == ProcessCategory::kUnknown);
}

void TestThresholdsAreConfigurable() {
  ClassifierThresholds thresholds;
  thresholds.conformal_aspect_ratio   = 12.0;
  thresholds.anisotropic_aspect_ratio = 0.1;
  ProcessClassifier classifier(thresholds);

  assert(classifier.Classify(MakeChange(Polarity::kAddition, 10.0)).subtype == ProcessSubtype::kPlanar);
  assert(classifier.Classify(MakeChange(Polarity::kAddition, 13.0)).subtype == ProcessSubtype::kConformal);
  assert(classifier.Classify(MakeChange(Polarity::kRemoval, 0.2)).subtype == ProcessSubtype::kIsotropic);
  assert(classifier.Classify(MakeChange(Polarity::kRemoval, 0.05)).subtype == ProcessSubtype::kAnisotropic);
}

void TestRuleTableOrder() {
  const auto& rules = ProcessClassifier::Rules();
  assert(rules[0].name == "conformal_deposition");
  assert(rules[1].name == "planar_deposition");
  assert(rules[2].name == "anisotropic_etch");
  assert(rules[3].name == "isotropic_etch");
  assert(rules[4].name == "patterning");

  ClassifierThresholds defaults;
  auto                 d = MakeChange(Polarity::kAddition, 10.0);
  assert(rules[0].matches(d, defaults));
  assert(rules[1].matches(d, defaults));
  assert(!rules[2].matches(d, defaults));
}

} // namespace

int main() {
  TestAdditionRules();
  TestRemovalRules();
  TestPatterningAndFallback();
  TestThresholdsAreConfigurable();
  TestRuleTableOrder();

  std::cout << "fabplan_unit_process_classifier: pass\n";
  return 0;
}
