#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/classifier/process_classifier.hpp"
#include "internal/core/flow_orchestrator.hpp"
#include "internal/knowledge/api/tool_catalog.hpp"
#include "internal/lithography/lithography_planner.hpp"
#include "internal/optimizer/parameter_optimizer.hpp"
#include "internal/selector/tool_selector.hpp"

namespace fabplan::factory {

/*
  Runtime

  Owns the long-lived components of one planner process.
*/
struct Runtime {
  std::shared_ptr<knowledge::ToolCatalog> catalog;
  std::shared_ptr<core::FlowOrchestrator> orchestrator;
};

/*
  Build

  Composition root: the only place that knows concrete catalog and mask
  backends. Zero or empty config values select the built-in defaults.
*/
Runtime Build(const fabplan::runtime::config::Config& config);

classifier::ClassifierThresholds ClassifierThresholdsFrom(const fabplan::runtime::config::Config& config);
optimizer::OptimizerOptions      OptimizerOptionsFrom(const fabplan::runtime::config::Config& config);
selector::SelectorOptions        SelectorOptionsFrom(const fabplan::runtime::config::Config& config);
lithography::LithographyOptions  LithographyOptionsFrom(const fabplan::runtime::config::Config& config);
core::OrchestratorOptions        OrchestratorOptionsFrom(const fabplan::runtime::config::Config& config);

std::shared_ptr<knowledge::ToolCatalog> BuildCatalog(const fabplan::runtime::config::Config& config);

} // namespace fabplan::factory
