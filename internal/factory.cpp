#include "factory.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/knowledge/catalog_loader.hpp"
#include "internal/knowledge/memory/memory_tool_catalog.hpp"
#include "internal/knowledge/sqlite/sqlite_db.hpp"
#include "internal/knowledge/sqlite/sqlite_tool_catalog.hpp"
#include "internal/lithography/output_dir_mask_extractor.hpp"
#include "internal/observability/logging.hpp"

namespace fabplan::factory {

using fabplan::observability::IntField;
using fabplan::observability::StringField;

namespace {

constexpr const char* kDefaultMaskOutputDir = "masks";

} // namespace

classifier::ClassifierThresholds ClassifierThresholdsFrom(const fabplan::runtime::config::Config& config) {
  classifier::ClassifierThresholds thresholds;
  const auto&                      section = config.classifier();
  if (section.conformal_aspect_ratio() > 0.0) {
    thresholds.conformal_aspect_ratio = section.conformal_aspect_ratio();
  }
  if (section.anisotropic_aspect_ratio() > 0.0) {
    thresholds.anisotropic_aspect_ratio = section.anisotropic_aspect_ratio();
  }
  return thresholds;
}

optimizer::OptimizerOptions OptimizerOptionsFrom(const fabplan::runtime::config::Config& config) {
  optimizer::OptimizerOptions options;
  const auto&                 section = config.optimizer();
  if (section.max_iterations() > 0) {
    options.max_iterations = section.max_iterations();
  }
  if (section.grid_points_per_axis() > 0) {
    options.grid_points_per_axis = section.grid_points_per_axis();
  }
  if (section.gradient_tolerance() > 0.0) {
    options.gradient_tolerance = section.gradient_tolerance();
  }
  if (section.function_tolerance() > 0.0) {
    options.function_tolerance = section.function_tolerance();
  }

  // Configured bounds override defaults of the same name and add new ones.
  for (const auto& bound : section.bounds()) {
    bool replaced = false;
    for (auto& existing : options.bounds) {
      if (existing.name == bound.name()) {
        existing.min = bound.min();
        existing.max = bound.max();
        replaced     = true;
      }
    }
    if (!replaced) {
      options.bounds.push_back({bound.name(), bound.min(), bound.max()});
    }
  }
  return options;
}

selector::SelectorOptions SelectorOptionsFrom(const fabplan::runtime::config::Config& config) {
  selector::SelectorOptions options;
  options.query_deadline = std::chrono::milliseconds(config.planner().query_deadline_ms());
  return options;
}

lithography::LithographyOptions LithographyOptionsFrom(const fabplan::runtime::config::Config& config) {
  lithography::LithographyOptions options;
  const auto&                     section = config.lithography();
  if (!section.resist_coat_recipe().empty()) {
    options.resist_coat_recipe = section.resist_coat_recipe();
  }
  if (!section.exposure_recipe().empty()) {
    options.exposure_recipe = section.exposure_recipe();
  }
  if (!section.develop_recipe().empty()) {
    options.develop_recipe = section.develop_recipe();
  }
  return options;
}

core::OrchestratorOptions OrchestratorOptionsFrom(const fabplan::runtime::config::Config& config) {
  core::OrchestratorOptions options;
  if (config.planner().initial_materials_size() > 0) {
    options.initial_materials.clear();
    for (const auto& material : config.planner().initial_materials()) {
      options.initial_materials.insert(material);
    }
  }
  return options;
}

std::shared_ptr<knowledge::ToolCatalog> BuildCatalog(const fabplan::runtime::config::Config& config) {
  const auto& knowledge = config.knowledge();

  if (knowledge.has_sqlite()) {
    const auto& sqlite = knowledge.sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("knowledge.sqlite.path is required");
    }
    knowledge::sqlite::SqliteOptions options;
    if (sqlite.busy_timeout_ms() > 0) {
      options.busy_timeout_ms = static_cast<int>(sqlite.busy_timeout_ms());
    }
    auto db = std::make_shared<knowledge::sqlite::SqliteDB>(sqlite.path(), options);
    knowledge::sqlite::SqliteToolCatalog::BootstrapSchema(*db);
    auto catalog = std::make_shared<knowledge::sqlite::SqliteToolCatalog>(std::move(db));
    if (!sqlite.seed_catalog_path().empty()) {
      auto status = catalog->Import(knowledge::LoadToolCatalogSpec(sqlite.seed_catalog_path()));
      if (!status) {
        throw std::runtime_error("Failed to import " + sqlite.seed_catalog_path() + ": " + status.message);
      }
    }
    FABPLAN_LOG_INFO("Knowledge store ready", {StringField("backend", "sqlite"), StringField("path", sqlite.path())});
    return catalog;
  }

  if (knowledge.has_memory() && !knowledge.memory().catalog_path().empty()) {
    auto definitions = knowledge::ToolDefinitionsFromSpec(knowledge::LoadToolCatalogSpec(knowledge.memory().catalog_path()));
    FABPLAN_LOG_INFO("Knowledge store ready", {StringField("backend", "memory"), StringField("path", knowledge.memory().catalog_path()),
                                               IntField("tools", static_cast<std::int64_t>(definitions.size()))});
    return std::make_shared<knowledge::memory::MemoryToolCatalog>(std::move(definitions));
  }

  FABPLAN_LOG_WARN("No tool catalog configured; every optimized step will be skipped");
  return std::make_shared<knowledge::memory::MemoryToolCatalog>();
}

Runtime Build(const fabplan::runtime::config::Config& config) {
  Runtime runtime;
  runtime.catalog = BuildCatalog(config);

  auto tool_selector       = std::make_shared<selector::ToolSelector>(runtime.catalog, SelectorOptionsFrom(config));
  auto parameter_optimizer = std::make_shared<optimizer::ParameterOptimizer>(OptimizerOptionsFrom(config));

  const auto& mask_dir            = config.lithography().mask_output_dir();
  auto        extractor           = std::make_shared<lithography::OutputDirMaskExtractor>(mask_dir.empty() ? kDefaultMaskOutputDir : mask_dir);
  auto        lithography_planner = std::make_shared<lithography::LithographyPlanner>(std::move(extractor), LithographyOptionsFrom(config));

  runtime.orchestrator = std::make_shared<core::FlowOrchestrator>(classifier::ProcessClassifier(ClassifierThresholdsFrom(config)),
                                                                  std::move(tool_selector), std::move(parameter_optimizer),
                                                                  std::move(lithography_planner), OrchestratorOptionsFrom(config));
  return runtime;
}

} // namespace fabplan::factory
