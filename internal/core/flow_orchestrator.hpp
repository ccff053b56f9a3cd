#pragma once

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "internal/classifier/process_classifier.hpp"
#include "internal/lithography/lithography_planner.hpp"
#include "internal/model/change_descriptor.hpp"
#include "internal/model/plan_state.hpp"
#include "internal/model/planning_context.hpp"
#include "internal/model/process_step.hpp"
#include "internal/optimizer/parameter_optimizer.hpp"
#include "internal/selector/tool_selector.hpp"

namespace fabplan::core {

struct OrchestratorOptions {
  // Materials on the wafer before the first change.
  std::set<std::string> initial_materials = {"silicon"};
};

/*
  Drives one planning cycle over an ordered change sequence.

  Per change: CLASSIFYING -> SELECTING_TOOL -> OPTIMIZING -> STEP_EMITTED,
  or STEP_SKIPPED with a diagnostic for UNKNOWN classifications and changes
  without a compatible tool. Input errors end in FLOW_FAILED and throw
  util::FlowFailed; unreachable collaborators throw
  util::CollaboratorUnavailable. Neither returns a partial flow.

  Plan is reentrant: all per-cycle state lives in a PlanningContext local to
  the call.
*/
class FlowOrchestrator {
 public:
  FlowOrchestrator(classifier::ProcessClassifier classifier, std::shared_ptr<selector::ToolSelector> selector,
                   std::shared_ptr<optimizer::ParameterOptimizer> optimizer, std::shared_ptr<lithography::LithographyPlanner> lithography,
                   OrchestratorOptions options = {});

  model::PlanResult Plan(std::vector<model::ChangeDescriptor> changes, const std::map<std::string, std::string>& layouts) const;

 private:
  classifier::ProcessClassifier                    classifier_;
  std::shared_ptr<selector::ToolSelector>          selector_;
  std::shared_ptr<optimizer::ParameterOptimizer>   optimizer_;
  std::shared_ptr<lithography::LithographyPlanner> lithography_;
  OrchestratorOptions                              options_;
};

} // namespace fabplan::core
