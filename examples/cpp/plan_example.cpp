#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"

#include "internal/core/flow_orchestrator.hpp"
#include "internal/io/flow_writer.hpp"
#include "internal/knowledge/memory/memory_tool_catalog.hpp"
#include "internal/knowledge/response_model.hpp"
#include "internal/lithography/output_dir_mask_extractor.hpp"
#include "internal/observability/logging.hpp"

namespace {

using fabplan::knowledge::HistoricalRun;
using fabplan::model::ChangeDescriptor;
using fabplan::model::Polarity;
using fabplan::model::ProcessCategory;
using fabplan::model::ToolDefinition;
using fabplan::model::ToolStatus;
using fabplan::model::WaferSize;

// Four corner runs of a linear tool: metric = base + rate_t * time_s + rate_p * pressure_torr.
std::vector<HistoricalRun> CornerRuns(double base, double rate_t, double rate_p) {
  std::vector<HistoricalRun> runs;
  for (double time_s : {5.0, 30.0}) {
    for (double pressure_torr : {0.5, 3.0}) {
      runs.push_back({{{"time_s", time_s}, {"pressure_torr", pressure_torr}}, base + rate_t * time_s + rate_p * pressure_torr});
    }
  }
  return runs;
}

ToolDefinition Tool(const std::string& tool_id, ProcessCategory category) {
  ToolDefinition tool;
  tool.tool_id            = tool_id;
  tool.status             = ToolStatus::kAvailable;
  tool.wafer_size         = WaferSize::k300mm;
  tool.capable_categories = {category};
  return tool;
}

ChangeDescriptor Change(Polarity polarity, std::uint32_t order_index, double aspect_ratio, double target, const std::string& material) {
  ChangeDescriptor d;
  d.polarity           = polarity;
  d.primary_material   = material;
  d.aspect_ratio       = aspect_ratio;
  d.conformality_score = 0.8;
  d.target_metric      = target;
  d.wafer_size         = WaferSize::k300mm;
  d.order_index        = order_index;
  return d;
}

} // namespace

int main(int argc, char** argv) {
  // Optional GDS layout; without one the patterning step is left out.
  const std::string layout = argc > 1 ? argv[1] : "";

  fabplan::observability::InitializeLogging(fabplan::runtime::config::Config{});

  auto cvd                                 = Tool("CVD_01", ProcessCategory::kDeposition);
  cvd.models[ProcessCategory::kDeposition] = fabplan::knowledge::FitResponseModel(CornerRuns(0.0, 10.0, 20.0));

  auto etch                           = Tool("ETCH_01", ProcessCategory::kEtch);
  etch.models[ProcessCategory::kEtch] = fabplan::knowledge::FitResponseModel(CornerRuns(0.0, 2.0, 5.0));

  auto litho = Tool("LITHO_01", ProcessCategory::kLithography);

  auto catalog = std::make_shared<fabplan::knowledge::memory::MemoryToolCatalog>(std::vector<ToolDefinition>{cvd, etch, litho});

  fabplan::core::FlowOrchestrator orchestrator(
      fabplan::classifier::ProcessClassifier(), std::make_shared<fabplan::selector::ToolSelector>(catalog),
      std::make_shared<fabplan::optimizer::ParameterOptimizer>(),
      std::make_shared<fabplan::lithography::LithographyPlanner>(std::make_shared<fabplan::lithography::OutputDirMaskExtractor>("masks")));

  std::vector<ChangeDescriptor>      changes = {Change(Polarity::kAddition, 0, 8.0, 200.0, "oxide")};
  std::map<std::string, std::string> layouts;
  if (!layout.empty()) {
    auto pattern            = Change(Polarity::kModification, 1, 1.0, 0.0, "photoresist");
    pattern.patterning      = true;
    pattern.step_identifier = "CONTACT";
    changes.push_back(pattern);
    layouts[pattern.step_identifier] = layout;
  }
  changes.push_back(Change(Polarity::kRemoval, 2, 0.1, 50.0, "oxide"));

  int exit_code = 0;
  try {
    auto result = orchestrator.Plan(std::move(changes), layouts);
    std::cout << fabplan::io::FlowToJson(result.flow);
    for (const auto& diagnostic : result.diagnostics) {
      std::cerr << "skipped change " << diagnostic.order_index << ": " << diagnostic.detail << '\n';
    }
  } catch (const std::exception& e) {
    std::cerr << "Plan failed: " << e.what() << '\n';
    exit_code = 1;
  }

  fabplan::observability::ShutdownLogging();
  return exit_code;
}
