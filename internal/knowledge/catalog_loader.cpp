#include "catalog_loader.hpp"

#include <map>
#include <stdexcept>

#include "internal/config/config_loader.hpp"
#include "internal/knowledge/response_model.hpp"
#include "internal/model/proto_convert.hpp"

namespace fabplan::knowledge {

namespace {

std::vector<HistoricalRun> RunsFromSpec(const fabplan::v1::ResponseModelSpec& spec) {
  std::vector<HistoricalRun> runs;
  runs.reserve(static_cast<std::size_t>(spec.runs_size()));
  for (const auto& run_spec : spec.runs()) {
    HistoricalRun run;
    for (const auto& [name, value] : run_spec.parameters()) {
      run.parameters[name] = value;
    }
    run.metric = run_spec.metric();
    runs.push_back(std::move(run));
  }
  return runs;
}

} // namespace

fabplan::v1::ToolCatalogSpec LoadToolCatalogSpec(const std::string& path) {
  fabplan::v1::ToolCatalogSpec spec;
  config::ConfigLoader::LoadMessageFromYaml(path, &spec);
  return spec;
}

std::vector<model::ToolDefinition> ToolDefinitionsFromSpec(const fabplan::v1::ToolCatalogSpec& spec) {
  std::vector<model::ToolDefinition> definitions;
  definitions.reserve(static_cast<std::size_t>(spec.tools_size()));

  for (const auto& tool : spec.tools()) {
    if (tool.tool_id().empty()) {
      throw std::invalid_argument("tool catalog entry without tool_id");
    }

    model::ToolDefinition definition;
    definition.tool_id = tool.tool_id();
    definition.status  = model::FromProto(tool.status());

    auto wafer_size = model::WaferSizeFromMillimeters(tool.wafer_size_mm());
    if (!wafer_size) {
      throw std::invalid_argument("tool " + tool.tool_id() + ": unsupported wafer size " + std::to_string(tool.wafer_size_mm()));
    }
    definition.wafer_size = *wafer_size;

    for (int i = 0; i < tool.capabilities_size(); ++i) {
      definition.capable_categories.insert(model::FromProto(tool.capabilities(i)));
    }
    definition.incompatible_materials.insert(tool.incompatible_materials().begin(), tool.incompatible_materials().end());

    for (const auto& model_spec : tool.models()) {
      if (model_spec.runs().empty()) {
        continue;
      }
      std::map<std::string, double> theta;
      for (const auto& [name, value] : model_spec.theta()) {
        theta[name] = value;
      }
      try {
        definition.models[model::FromProto(model_spec.category())] = FitResponseModel(RunsFromSpec(model_spec), theta);
      } catch (const std::invalid_argument& e) {
        throw std::invalid_argument("tool " + tool.tool_id() + ": " + e.what());
      }
    }

    definitions.push_back(std::move(definition));
  }

  return definitions;
}

} // namespace fabplan::knowledge
