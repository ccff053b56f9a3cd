#include "flow_orchestrator.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fabplan::core {

using fabplan::model::PlanState;
using fabplan::observability::IntField;
using fabplan::observability::StringField;

namespace {

class StateMachine {
 public:
  void MoveTo(PlanState next) {
    if (!model::CanTransition(state_, next)) {
      throw std::logic_error("illegal planning transition " + std::string(model::ToString(state_)) + " -> " +
                             std::string(model::ToString(next)));
    }
    state_ = next;
  }

  PlanState Current() const {
    return state_;
  }

 private:
  PlanState state_ = PlanState::kInit;
};

[[noreturn]] void Fail(StateMachine& machine, std::uint32_t order_index, const std::string& cause) {
  const std::string state(model::ToString(machine.Current()));
  machine.MoveTo(PlanState::kFlowFailed);
  FABPLAN_LOG_ERROR("Planning failed", {IntField("order_index", order_index), StringField("state", state), StringField("cause", cause)});
  throw util::FlowFailed(order_index, state, cause);
}

[[noreturn]] void Unavailable(StateMachine& machine, std::uint32_t order_index, const util::CollaboratorUnavailable& e) {
  const std::string state(model::ToString(machine.Current()));
  machine.MoveTo(PlanState::kFlowFailed);
  FABPLAN_LOG_ERROR("Collaborator unavailable", {IntField("order_index", order_index), StringField("state", state),
                                                  StringField("collaborator", e.Collaborator()), StringField("cause", e.what())});
  throw e;
}

void Skip(StateMachine& machine, model::PlanResult& result, const model::ChangeDescriptor& change, model::DiagnosticReason reason,
          std::string detail) {
  machine.MoveTo(PlanState::kStepSkipped);
  FABPLAN_LOG_WARN("Skipped change", {IntField("order_index", change.order_index), StringField("reason", model::ToString(reason)),
                                      StringField("change", model::Describe(change)), StringField("detail", detail)});
  result.diagnostics.push_back({change.order_index, reason, std::move(detail)});
}

} // namespace

FlowOrchestrator::FlowOrchestrator(classifier::ProcessClassifier classifier, std::shared_ptr<selector::ToolSelector> selector,
                                   std::shared_ptr<optimizer::ParameterOptimizer>   optimizer,
                                   std::shared_ptr<lithography::LithographyPlanner> lithography, OrchestratorOptions options)
    : classifier_(classifier),
      selector_(std::move(selector)),
      optimizer_(std::move(optimizer)),
      lithography_(std::move(lithography)),
      options_(std::move(options)) {
  if (!selector_ || !optimizer_ || !lithography_) {
    throw std::invalid_argument("flow orchestrator requires selector, optimizer and lithography planner");
  }
}

model::PlanResult FlowOrchestrator::Plan(std::vector<model::ChangeDescriptor> changes, const std::map<std::string, std::string>& layouts) const {
  StateMachine machine;

  std::stable_sort(changes.begin(), changes.end(),
                   [](const model::ChangeDescriptor& a, const model::ChangeDescriptor& b) { return a.order_index < b.order_index; });

  for (std::size_t i = 0; i < changes.size(); ++i) {
    try {
      model::Validate(changes[i]);
    } catch (const util::InvalidDescriptor& e) {
      Fail(machine, changes[i].order_index, e.what());
    }
    if (i > 0 && changes[i - 1].order_index == changes[i].order_index) {
      Fail(machine, changes[i].order_index, "duplicate order_index " + std::to_string(changes[i].order_index));
    }
  }

  FABPLAN_LOG_INFO("Planning started", {IntField("changes", static_cast<std::int64_t>(changes.size())),
                                        IntField("layouts", static_cast<std::int64_t>(layouts.size()))});

  model::PlanningContext context;
  context.materials_present = options_.initial_materials;

  model::PlanResult result;
  for (const auto& change : changes) {
    machine.MoveTo(PlanState::kClassifying);
    const auto classification = classifier_.Classify(change);
    FABPLAN_LOG_DEBUG("Classified change", {IntField("order_index", change.order_index), StringField("rule", classification.rule),
                                            StringField("process", model::ToString(classification.category)),
                                            StringField("subtype", model::ToString(classification.subtype))});

    if (classification.category == model::ProcessCategory::kUnknown) {
      Skip(machine, result, change, model::DiagnosticReason::kUnknownClassification, "no classification rule matches " + model::Describe(change));
      continue;
    }

    const bool         patterning = classification.category == model::ProcessCategory::kLithography;
    const std::string* layout     = nullptr;
    if (patterning) {
      try {
        layout = &lithography_->LayoutFor(change, layouts);
      } catch (const util::MissingLayoutReference& e) {
        Fail(machine, change.order_index, e.what());
      }
    }

    machine.MoveTo(PlanState::kSelectingTool);
    model::ToolRecord tool;
    try {
      tool = selector_->Select(classification, change, context);
    } catch (const util::NoCompatibleTool& e) {
      Skip(machine, result, change, model::DiagnosticReason::kNoCompatibleTool, e.what());
      continue;
    } catch (const util::CollaboratorUnavailable& e) {
      Unavailable(machine, change.order_index, e);
    }

    machine.MoveTo(PlanState::kOptimizing);
    model::ProcessStep step;
    step.process_type       = classification.category;
    step.subtype            = classification.subtype;
    step.tool_id            = tool.tool_id;
    step.source_order_index = change.order_index;
    try {
      step.recipe_parameters = patterning ? lithography_->Plan(change, *layout) : optimizer_->Optimize(tool, classification, change);
    } catch (const util::MaskExtractionFailed& e) {
      Fail(machine, change.order_index, e.what());
    } catch (const util::CollaboratorUnavailable& e) {
      Unavailable(machine, change.order_index, e);
    } catch (const std::invalid_argument& e) {
      Fail(machine, change.order_index, e.what());
    }

    machine.MoveTo(PlanState::kStepEmitted);
    step.step_number = static_cast<std::uint32_t>(result.flow.size() + 1);
    ++context.assigned_steps[tool.tool_id];
    if (change.polarity == model::Polarity::kAddition) {
      context.materials_present.insert(change.primary_material);
    }

    FABPLAN_LOG_INFO("Emitted step", {IntField("step_number", step.step_number), IntField("order_index", change.order_index),
                                      StringField("process", model::ToString(step.process_type)), StringField("tool_id", step.tool_id)});
    result.flow.push_back(std::move(step));
  }

  machine.MoveTo(PlanState::kDone);
  FABPLAN_LOG_INFO("Planning finished", {IntField("steps", static_cast<std::int64_t>(result.flow.size())),
                                         IntField("skipped", static_cast<std::int64_t>(result.diagnostics.size()))});
  return result;
}

} // namespace fabplan::core
