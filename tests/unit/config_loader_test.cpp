#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "fabplan/v1.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "fabplan_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
classifier:
  conformal_aspect_ratio: 6.5
  anisotropic_aspect_ratio: 0.4
optimizer:
  max_iterations: 50
  grid_points_per_axis: 21
  bounds:
    - name: time_s
      min: 5
      max: 60
    - name: power_w
      min: 100
      max: 500
planner:
  query_deadline_ms: 250
  initial_materials: [silicon, oxide]
knowledge:
  sqlite:
    path: "/var/lib/fabplan/tools.db"
    seed_catalog_path: tools.yaml
lithography:
  mask_output_dir: /tmp/masks
  exposure_recipe: EUV_EXPOSE_30mJ
)");

  auto config = fabplan::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.classifier().conformal_aspect_ratio() == 6.5);
  assert(config.classifier().anisotropic_aspect_ratio() == 0.4);
  assert(config.optimizer().max_iterations() == 50);
  assert(config.optimizer().bounds_size() == 2);
  assert(config.optimizer().bounds(1).name() == "power_w");
  assert(config.optimizer().bounds(1).max() == 500.0);
  assert(config.planner().query_deadline_ms() == 250);
  assert(config.planner().initial_materials_size() == 2);
  assert(config.knowledge().has_sqlite());
  assert(config.knowledge().sqlite().path() == "/var/lib/fabplan/tools.db");
  assert(config.lithography().exposure_recipe() == "EUV_EXPOSE_30mJ");
  assert(config.lithography().develop_recipe().empty());
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(knowledge:
  sqlite:
    path: "C:\\fabplan\\\"quoted\"\\tools.db"
)");

  auto config = fabplan::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.knowledge().sqlite().path() == "C:\\fabplan\\\"quoted\"\\tools.db");
}

void TestQuotedNumbersStayStrings() {
  const auto yaml_path = WriteYaml("quoted_number",
                                   R"(lithography:
  mask_output_dir: "2024"
  develop_recipe: "line1\nline2☃"
)");

  auto config = fabplan::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.lithography().mask_output_dir() == "2024");
  assert(config.lithography().develop_recipe() == std::string("line1\nline2☃"));
}

void TestEmptyDocumentIsDefaultConfig() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = fabplan::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(!config.has_knowledge());
  assert(config.optimizer().max_iterations() == 0);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(planner:
  query_deadline_ms: 10
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)fabplan::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)fabplan::config::ConfigLoader::LoadFromYaml("/nonexistent/fabplan.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestToolCatalogDocument() {
  fabplan::v1::ToolCatalogSpec spec;
  fabplan::config::ConfigLoader::ParseMessageFromYaml(R"(tools:
  - tool_id: CVD_01
    status: TOOL_STATUS_AVAILABLE
    wafer_size_mm: 300
    capabilities: [PROCESS_CATEGORY_DEPOSITION]
    incompatible_materials: [gold]
    models:
      - category: PROCESS_CATEGORY_DEPOSITION
        theta: {time_s: 2.0}
        runs:
          - {parameters: {time_s: 5, pressure_torr: 0.5}, metric: 60}
          - {parameters: {time_s: 30, pressure_torr: 3.0}, metric: 360}
)",
                                                      &spec);

  assert(spec.tools_size() == 1);
  const auto& tool = spec.tools(0);
  assert(tool.status() == fabplan::v1::TOOL_STATUS_AVAILABLE);
  assert(tool.capabilities(0) == fabplan::v1::PROCESS_CATEGORY_DEPOSITION);
  assert(tool.models(0).runs_size() == 2);
  assert(tool.models(0).runs(1).parameters().at("time_s") == 30.0);
  assert(tool.models(0).theta().at("time_s") == 2.0);
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestEmptyDocumentIsDefaultConfig();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestToolCatalogDocument();

  std::cout << "fabplan_unit_config_loader: pass\n";
  return 0;
}
