#pragma once

#include <cstdint>
#include <string_view>

namespace fabplan::model {

enum class PlanState : std::uint8_t {
  kInit          = 0,
  kClassifying   = 1,
  kSelectingTool = 2,
  kOptimizing    = 3,
  kStepEmitted   = 4,
  kStepSkipped   = 5,
  kDone          = 6,
  kFlowFailed    = 7,
};

constexpr bool IsTerminal(PlanState state) {
  return state == PlanState::kDone || state == PlanState::kFlowFailed;
}

constexpr bool CanTransition(PlanState from, PlanState to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (to == PlanState::kFlowFailed) {
    return true;
  }

  switch (from) {
    case PlanState::kInit:
    case PlanState::kStepEmitted:
    case PlanState::kStepSkipped:
      return to == PlanState::kClassifying || to == PlanState::kDone;
    case PlanState::kClassifying:
      return to == PlanState::kSelectingTool || to == PlanState::kStepSkipped;
    case PlanState::kSelectingTool:
      return to == PlanState::kOptimizing || to == PlanState::kStepSkipped;
    case PlanState::kOptimizing:
      return to == PlanState::kStepEmitted;
    default:
      return false;
  }
}

constexpr std::string_view ToString(PlanState state) {
  switch (state) {
    case PlanState::kInit:
      return "INIT";
    case PlanState::kClassifying:
      return "CLASSIFYING";
    case PlanState::kSelectingTool:
      return "SELECTING_TOOL";
    case PlanState::kOptimizing:
      return "OPTIMIZING";
    case PlanState::kStepEmitted:
      return "STEP_EMITTED";
    case PlanState::kStepSkipped:
      return "STEP_SKIPPED";
    case PlanState::kDone:
      return "DONE";
    case PlanState::kFlowFailed:
    default:
      return "FLOW_FAILED";
  }
}

} // namespace fabplan::model
