#include "internal/factory.hpp"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/knowledge/memory/memory_tool_catalog.hpp"
#include "internal/knowledge/sqlite/sqlite_tool_catalog.hpp"

namespace {

using fabplan::model::ChangeDescriptor;
using fabplan::model::Polarity;
using fabplan::model::ProcessCategory;
using fabplan::model::WaferSize;
using fabplan::runtime::config::Config;

constexpr const char* kCatalog = R"(tools:
  - tool_id: CVD_01
    status: TOOL_STATUS_AVAILABLE
    wafer_size_mm: 300
    capabilities: [PROCESS_CATEGORY_DEPOSITION]
    models:
      - category: PROCESS_CATEGORY_DEPOSITION
        runs:
          - {parameters: {time_s: 5, pressure_torr: 0.5}, metric: 60}
          - {parameters: {time_s: 30, pressure_torr: 0.5}, metric: 310}
          - {parameters: {time_s: 5, pressure_torr: 3.0}, metric: 110}
          - {parameters: {time_s: 30, pressure_torr: 3.0}, metric: 360}
  - tool_id: LITHO_01
    status: TOOL_STATUS_AVAILABLE
    wafer_size_mm: 300
    capabilities: [PROCESS_CATEGORY_LITHOGRAPHY]
)";

std::filesystem::path TestDir() {
  const auto dir = std::filesystem::temp_directory_path() / "fabplan_factory_tests";
  std::filesystem::create_directories(dir);
  return dir;
}

std::filesystem::path WriteFile(const std::string& name, const std::string& content) {
  const auto    path = TestDir() / name;
  std::ofstream out(path);
  out << content;
  return path;
}

Config ParseConfig(const std::string& yaml) {
  Config config;
  fabplan::config::ConfigLoader::ParseMessageFromYaml(yaml, &config);
  return config;
}

ChangeDescriptor Deposition(std::uint32_t order_index, double target) {
  ChangeDescriptor d;
  d.polarity           = Polarity::kAddition;
  d.primary_material   = "oxide";
  d.aspect_ratio       = 2.0;
  d.conformality_score = 0.5;
  d.target_metric      = target;
  d.wafer_size         = WaferSize::k300mm;
  d.order_index        = order_index;
  return d;
}

void TestEmptyConfigSelectsDefaults() {
  const Config config;

  auto thresholds = fabplan::factory::ClassifierThresholdsFrom(config);
  assert(thresholds.conformal_aspect_ratio == 5.0);
  assert(thresholds.anisotropic_aspect_ratio == 0.5);

  auto optimizer = fabplan::factory::OptimizerOptionsFrom(config);
  assert(optimizer.max_iterations == 100);
  assert(optimizer.bounds.size() == 2);

  auto selector = fabplan::factory::SelectorOptionsFrom(config);
  assert(selector.query_deadline.count() == 0);

  auto lithography = fabplan::factory::LithographyOptionsFrom(config);
  assert(lithography.resist_coat_recipe == "STANDARD_COAT_1UM");
  assert(lithography.exposure_recipe == "STANDARD_EXPOSE_200mJ");
  assert(lithography.develop_recipe == "STANDARD_DEV_60S");

  auto orchestrator = fabplan::factory::OrchestratorOptionsFrom(config);
  assert(orchestrator.initial_materials.size() == 1);
  assert(orchestrator.initial_materials.contains("silicon"));
}

void TestConfiguredValuesOverrideDefaults() {
  auto config = ParseConfig(R"(classifier:
  conformal_aspect_ratio: 6.5
optimizer:
  grid_points_per_axis: 21
  bounds:
    - {name: time_s, min: 2, max: 60}
    - {name: power_w, min: 100, max: 500}
planner:
  query_deadline_ms: 250
  initial_materials: [silicon, oxide]
lithography:
  develop_recipe: DEV_90S
)");

  auto thresholds = fabplan::factory::ClassifierThresholdsFrom(config);
  assert(thresholds.conformal_aspect_ratio == 6.5);
  assert(thresholds.anisotropic_aspect_ratio == 0.5);

  auto optimizer = fabplan::factory::OptimizerOptionsFrom(config);
  assert(optimizer.grid_points_per_axis == 21);
  assert(optimizer.bounds.size() == 3);
  assert(optimizer.bounds[0].name == "time_s");
  assert(optimizer.bounds[0].min == 2.0);
  assert(optimizer.bounds[0].max == 60.0);
  assert(optimizer.bounds[1].name == "pressure_torr");
  assert(optimizer.bounds[2].name == "power_w");

  assert(fabplan::factory::SelectorOptionsFrom(config).query_deadline.count() == 250);

  auto lithography = fabplan::factory::LithographyOptionsFrom(config);
  assert(lithography.develop_recipe == "DEV_90S");
  assert(lithography.exposure_recipe == "STANDARD_EXPOSE_200mJ");

  auto orchestrator = fabplan::factory::OrchestratorOptionsFrom(config);
  assert(orchestrator.initial_materials.size() == 2);
  assert(orchestrator.initial_materials.contains("oxide"));
}

void TestMissingCatalogYieldsEmptyStore() {
  auto catalog = fabplan::factory::BuildCatalog(Config{});
  auto memory  = std::dynamic_pointer_cast<fabplan::knowledge::memory::MemoryToolCatalog>(catalog);
  assert(memory != nullptr);
  assert(memory->Size() == 0);
}

void TestSqliteWithoutPathIsRejected() {
  auto config = ParseConfig("knowledge:\n  sqlite:\n    seed_catalog_path: tools.yaml\n");

  bool threw = false;
  try {
    (void)fabplan::factory::BuildCatalog(config);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestSqliteCatalogIsSeeded() {
  const auto catalog_path = WriteFile("sqlite_seed.yaml", kCatalog);
  auto       config       = ParseConfig("knowledge:\n  sqlite:\n    path: \":memory:\"\n    seed_catalog_path: \"" + catalog_path.string() + "\"\n");

  auto catalog = fabplan::factory::BuildCatalog(config);
  assert(std::dynamic_pointer_cast<fabplan::knowledge::sqlite::SqliteToolCatalog>(catalog) != nullptr);

  fabplan::knowledge::ToolQuery query;
  query.category   = ProcessCategory::kLithography;
  query.wafer_size = WaferSize::k300mm;
  auto result      = catalog->FindCandidates(query);
  assert(result.status);
  assert(result.tools.size() == 1);
  assert(result.tools[0].tool_id == "LITHO_01");
}

void TestBuiltRuntimePlansAFlow() {
  const auto catalog_path = WriteFile("memory_catalog.yaml", kCatalog);
  const auto layout_path  = WriteFile("gate.gds", "GDSII");
  const auto mask_dir     = TestDir() / "masks";
  std::filesystem::remove_all(mask_dir);

  auto config = ParseConfig("knowledge:\n  memory:\n    catalog_path: \"" + catalog_path.string() + "\"\nlithography:\n  mask_output_dir: \"" +
                            mask_dir.string() + "\"\n");

  auto runtime = fabplan::factory::Build(config);
  assert(runtime.catalog != nullptr);
  assert(runtime.orchestrator != nullptr);

  auto patterning             = Deposition(1, 0.0);
  patterning.polarity         = Polarity::kModification;
  patterning.primary_material = "photoresist";
  patterning.patterning       = true;
  patterning.step_identifier  = "GATE";

  auto result = runtime.orchestrator->Plan({Deposition(0, 200.0), patterning}, {{"GATE", layout_path.string()}});
  assert(result.diagnostics.empty());
  assert(result.flow.size() == 2);

  const auto& deposition = result.flow[0];
  assert(deposition.tool_id == "CVD_01");
  auto time_s = deposition.recipe_parameters.Number("time_s");
  assert(time_s.has_value() && *time_s >= 5.0 && *time_s <= 30.0);
  auto achieved = deposition.recipe_parameters.Number("achieved_thickness_nm");
  assert(achieved.has_value() && std::abs(*achieved - 200.0) < 1.0);

  const auto& lithography = result.flow[1];
  assert(lithography.tool_id == "LITHO_01");
  auto mask = lithography.recipe_parameters.Text("mask_file");
  assert(mask.has_value());
  assert(std::filesystem::exists(*mask));
  assert(std::filesystem::path(*mask).parent_path() == mask_dir);
}

} // namespace

int main() {
  TestEmptyConfigSelectsDefaults();
  TestConfiguredValuesOverrideDefaults();
  TestMissingCatalogYieldsEmptyStore();
  TestSqliteWithoutPathIsRejected();
  TestSqliteCatalogIsSeeded();
  TestBuiltRuntimePlansAFlow();

  std::cout << "fabplan_unit_factory: pass\n";
  return 0;
}
