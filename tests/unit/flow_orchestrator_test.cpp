#include "internal/core/flow_orchestrator.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/knowledge/memory/memory_tool_catalog.hpp"
#include "internal/surrogate/surrogate_model.hpp"
#include "internal/util/errors.hpp"

namespace {

using fabplan::core::FlowOrchestrator;
using fabplan::knowledge::memory::MemoryToolCatalog;
using fabplan::lithography::LithographyPlanner;
using fabplan::lithography::MaskExtractor;
using fabplan::model::ChangeDescriptor;
using fabplan::model::DiagnosticReason;
using fabplan::model::Polarity;
using fabplan::model::ProcessCategory;
using fabplan::model::ToolDefinition;
using fabplan::model::ToolStatus;
using fabplan::model::WaferSize;

class LinearSurrogate final : public fabplan::surrogate::SurrogateModel {
 public:
  LinearSurrogate(double a, double b) : a_(a), b_(b) {
  }

  const std::vector<std::string>& ParameterNames() const override {
    return names_;
  }

  double Predict(const Eigen::VectorXd& parameters) const override {
    return a_ * parameters(0) + b_ * parameters(1);
  }

 private:
  std::vector<std::string> names_ = {"time_s", "pressure_torr"};
  double                   a_;
  double                   b_;
};

class FakeMaskExtractor final : public MaskExtractor {
 public:
  enum class Mode { kOk, kFail, kUnreachable };

  explicit FakeMaskExtractor(Mode mode = Mode::kOk) : mode_(mode) {
  }

  std::string Extract(const std::string& layout_reference, const std::string& step_identifier) override {
    ++calls;
    if (mode_ == Mode::kFail) {
      throw fabplan::util::MaskExtractionFailed("layer missing in " + layout_reference);
    }
    if (mode_ == Mode::kUnreachable) {
      throw fabplan::util::CollaboratorUnavailable("mask-service", "connection refused");
    }
    return "masks/mask_" + step_identifier + ".gds";
  }

  int calls = 0;

 private:
  Mode mode_;
};

ToolDefinition MakeTool(const std::string& tool_id, ProcessCategory category) {
  ToolDefinition tool;
  tool.tool_id            = tool_id;
  tool.status             = ToolStatus::kAvailable;
  tool.wafer_size         = WaferSize::k300mm;
  tool.capable_categories = {category};
  if (category == ProcessCategory::kDeposition) {
    tool.models[category] = std::make_shared<LinearSurrogate>(10.0, 20.0);
  } else if (category == ProcessCategory::kEtch) {
    tool.models[category] = std::make_shared<LinearSurrogate>(2.0, 5.0);
  }
  return tool;
}

std::shared_ptr<MemoryToolCatalog> MakeFab() {
  return std::make_shared<MemoryToolCatalog>(std::vector<ToolDefinition>{
      MakeTool("CVD_01", ProcessCategory::kDeposition), MakeTool("LITHO_01", ProcessCategory::kLithography),
      MakeTool("ETCH_01", ProcessCategory::kEtch)});
}

FlowOrchestrator MakeOrchestrator(std::shared_ptr<fabplan::knowledge::ToolCatalog> catalog, std::shared_ptr<MaskExtractor> extractor) {
  return FlowOrchestrator(fabplan::classifier::ProcessClassifier(), std::make_shared<fabplan::selector::ToolSelector>(std::move(catalog)),
                          std::make_shared<fabplan::optimizer::ParameterOptimizer>(),
                          std::make_shared<LithographyPlanner>(std::move(extractor)));
}

ChangeDescriptor Addition(std::uint32_t order_index, double aspect_ratio, double target, const std::string& material = "oxide") {
  ChangeDescriptor d;
  d.polarity           = Polarity::kAddition;
  d.primary_material   = material;
  d.aspect_ratio       = aspect_ratio;
  d.conformality_score = 0.9;
  d.target_metric      = target;
  d.wafer_size         = WaferSize::k300mm;
  d.order_index        = order_index;
  return d;
}

ChangeDescriptor Removal(std::uint32_t order_index, double aspect_ratio, double target) {
  auto d     = Addition(order_index, aspect_ratio, target);
  d.polarity = Polarity::kRemoval;
  return d;
}

ChangeDescriptor Patterning(std::uint32_t order_index, const std::string& step_identifier) {
  auto d            = Addition(order_index, 1.0, 0.0, "photoresist");
  d.polarity        = Polarity::kModification;
  d.patterning      = true;
  d.step_identifier = step_identifier;
  return d;
}

void TestThreeStepFlow() {
  auto extractor    = std::make_shared<FakeMaskExtractor>();
  auto orchestrator = MakeOrchestrator(MakeFab(), extractor);

  auto result = orchestrator.Plan({Addition(0, 8.0, 200.0), Patterning(1, "S2"), Removal(2, 0.1, 50.0)}, {{"S2", "layout.gds"}});

  assert(result.diagnostics.empty());
  assert(result.flow.size() == 3);
  for (std::uint32_t i = 0; i < 3; ++i) {
    assert(result.flow[i].step_number == i + 1);
  }

  assert(result.flow[0].process_type == ProcessCategory::kDeposition);
  assert(result.flow[0].tool_id == "CVD_01");
  assert(std::abs(*result.flow[0].recipe_parameters.Number("achieved_thickness_nm") - 200.0) < 1e-3);

  assert(result.flow[1].process_type == ProcessCategory::kLithography);
  assert(result.flow[1].tool_id == "LITHO_01");
  auto mask = result.flow[1].recipe_parameters.Text("mask_file");
  assert(mask.has_value() && !mask->empty());
  assert(*mask == "masks/mask_S2.gds");
  assert(extractor->calls == 1);

  assert(result.flow[2].process_type == ProcessCategory::kEtch);
  assert(result.flow[2].tool_id == "ETCH_01");
  assert(std::abs(*result.flow[2].recipe_parameters.Number("achieved_depth_nm") - 50.0) < 1e-3);
}

void TestInputIsPlannedInOrderIndexOrder() {
  auto orchestrator = MakeOrchestrator(MakeFab(), std::make_shared<FakeMaskExtractor>());

  auto result = orchestrator.Plan({Removal(7, 0.1, 50.0), Addition(3, 8.0, 200.0)}, {});
  assert(result.flow.size() == 2);
  assert(result.flow[0].process_type == ProcessCategory::kDeposition);
  assert(result.flow[0].source_order_index == 3);
  assert(result.flow[1].process_type == ProcessCategory::kEtch);
  assert(result.flow[1].step_number == 2);
}

void TestMissingLayoutFailsWholeFlow() {
  auto extractor    = std::make_shared<FakeMaskExtractor>();
  auto orchestrator = MakeOrchestrator(MakeFab(), extractor);

  bool failed = false;
  try {
    (void)orchestrator.Plan({Addition(0, 8.0, 200.0), Patterning(1, "S2"), Removal(2, 0.1, 50.0)}, {{"S3", "other.gds"}});
  } catch (const fabplan::util::FlowFailed& e) {
    failed = true;
    assert(e.OrderIndex() == 1);
    assert(e.State() == "CLASSIFYING");
  }
  assert(failed && "no partial flow may be returned");
  assert(extractor->calls == 0);
}

void TestUnknownClassificationIsSkippedAndRenumbered() {
  auto orchestrator = MakeOrchestrator(MakeFab(), std::make_shared<FakeMaskExtractor>());

  auto unknown     = Addition(1, 1.0, 10.0);
  unknown.polarity = Polarity::kModification;

  auto result = orchestrator.Plan({Addition(0, 2.0, 150.0), unknown, Removal(2, 1.0, 40.0)}, {});
  assert(result.flow.size() == 2);
  assert(result.flow[0].step_number == 1);
  assert(result.flow[1].step_number == 2);
  assert(result.flow[1].source_order_index == 2);

  assert(result.diagnostics.size() == 1);
  assert(result.diagnostics[0].order_index == 1);
  assert(result.diagnostics[0].reason == DiagnosticReason::kUnknownClassification);
}

void TestNoCompatibleToolIsSkipped() {
  auto orchestrator = MakeOrchestrator(MakeFab(), std::make_shared<FakeMaskExtractor>());

  auto small_wafer       = Addition(1, 2.0, 150.0);
  small_wafer.wafer_size = WaferSize::k200mm;

  auto result = orchestrator.Plan({Addition(0, 2.0, 150.0), small_wafer, Removal(2, 1.0, 40.0)}, {});
  assert(result.flow.size() == 2);
  assert(result.flow[1].step_number == 2);
  assert(result.flow[1].process_type == ProcessCategory::kEtch);
  assert(result.diagnostics.size() == 1);
  assert(result.diagnostics[0].order_index == 1);
  assert(result.diagnostics[0].reason == DiagnosticReason::kNoCompatibleTool);
  assert(!result.diagnostics[0].detail.empty());
}

void TestLoadBalancingAcrossEquivalentTools() {
  auto catalog = MakeFab();
  catalog->Upsert(MakeTool("CVD_02", ProcessCategory::kDeposition));
  auto orchestrator = MakeOrchestrator(catalog, std::make_shared<FakeMaskExtractor>());

  auto result = orchestrator.Plan({Addition(0, 2.0, 100.0), Addition(1, 2.0, 120.0), Addition(2, 2.0, 140.0)}, {});
  assert(result.flow.size() == 3);
  assert(result.flow[0].tool_id == "CVD_01");
  assert(result.flow[1].tool_id == "CVD_02");
  assert(result.flow[2].tool_id == "CVD_01");
}

void TestDepositedMaterialsConstrainLaterSteps() {
  auto catalog                         = MakeFab();
  auto copper_averse                   = MakeTool("CVD_00", ProcessCategory::kDeposition);
  copper_averse.incompatible_materials = {"copper"};
  catalog->Upsert(copper_averse);
  auto orchestrator = MakeOrchestrator(catalog, std::make_shared<FakeMaskExtractor>());

  auto result = orchestrator.Plan({Addition(0, 2.0, 100.0, "copper"), Addition(1, 2.0, 100.0, "oxide")}, {});
  assert(result.flow.size() == 2);
  // CVD_00 cannot deposit copper, and copper is on the wafer afterwards.
  assert(result.flow[0].tool_id == "CVD_01");
  assert(result.flow[1].tool_id == "CVD_01");

  // Without copper on the wafer the lexicographically smaller tool wins.
  auto oxide_only = orchestrator.Plan({Addition(0, 2.0, 100.0, "oxide")}, {});
  assert(oxide_only.flow[0].tool_id == "CVD_00");
}

void TestInvalidInputFailsBeforePlanning() {
  auto extractor    = std::make_shared<FakeMaskExtractor>();
  auto orchestrator = MakeOrchestrator(MakeFab(), extractor);

  auto bad             = Addition(1, 2.0, 100.0);
  bad.primary_material = "";

  bool failed = false;
  try {
    (void)orchestrator.Plan({Patterning(0, "S1"), bad}, {{"S1", "layout.gds"}});
  } catch (const fabplan::util::FlowFailed& e) {
    failed = true;
    assert(e.OrderIndex() == 1);
    assert(e.State() == "INIT");
  }
  assert(failed);
  assert(extractor->calls == 0);

  failed = false;
  try {
    (void)orchestrator.Plan({Addition(4, 2.0, 100.0), Removal(4, 1.0, 10.0)}, {});
  } catch (const fabplan::util::FlowFailed& e) {
    failed = true;
    assert(e.OrderIndex() == 4);
  }
  assert(failed && "duplicate order_index must be rejected");
}

void TestMaskFailures() {
  auto failing = MakeOrchestrator(MakeFab(), std::make_shared<FakeMaskExtractor>(FakeMaskExtractor::Mode::kFail));
  bool failed  = false;
  try {
    (void)failing.Plan({Patterning(0, "S1")}, {{"S1", "layout.gds"}});
  } catch (const fabplan::util::FlowFailed& e) {
    failed = true;
    assert(e.State() == "OPTIMIZING");
  }
  assert(failed);

  auto unreachable = MakeOrchestrator(MakeFab(), std::make_shared<FakeMaskExtractor>(FakeMaskExtractor::Mode::kUnreachable));
  bool retry       = false;
  try {
    (void)unreachable.Plan({Patterning(0, "S1")}, {{"S1", "layout.gds"}});
  } catch (const fabplan::util::FlowFailed&) {
    assert(false && "unreachable collaborators are reported distinctly");
  } catch (const fabplan::util::CollaboratorUnavailable& e) {
    retry = e.Collaborator() == "mask-service";
  }
  assert(retry);
}

void TestRunsAreIndependent() {
  auto orchestrator = MakeOrchestrator(MakeFab(), std::make_shared<FakeMaskExtractor>());
  auto first        = orchestrator.Plan({Addition(0, 8.0, 200.0), Removal(1, 0.1, 50.0)}, {});
  auto second       = orchestrator.Plan({Addition(0, 8.0, 200.0), Removal(1, 0.1, 50.0)}, {});

  assert(first.flow.size() == second.flow.size());
  for (std::size_t i = 0; i < first.flow.size(); ++i) {
    assert(first.flow[i].tool_id == second.flow[i].tool_id);
    assert(first.flow[i].recipe_parameters.numeric[0].value == second.flow[i].recipe_parameters.numeric[0].value);
  }

  assert(orchestrator.Plan({}, {}).flow.empty());
}

} // namespace

int main() {
  TestThreeStepFlow();
  TestInputIsPlannedInOrderIndexOrder();
  TestMissingLayoutFailsWholeFlow();
  TestUnknownClassificationIsSkippedAndRenumbered();
  TestNoCompatibleToolIsSkipped();
  TestLoadBalancingAcrossEquivalentTools();
  TestDepositedMaterialsConstrainLaterSteps();
  TestInvalidInputFailsBeforePlanning();
  TestMaskFailures();
  TestRunsAreIndependent();

  std::cout << "fabplan_unit_flow_orchestrator: pass\n";
  return 0;
}
