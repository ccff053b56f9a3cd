#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/process_category.hpp"
#include "internal/model/recipe_parameters.hpp"

namespace fabplan::model {

struct ProcessStep {
  std::uint32_t    step_number  = 0;
  ProcessCategory  process_type = ProcessCategory::kUnknown;
  ProcessSubtype   subtype      = ProcessSubtype::kNone;
  std::string      tool_id;
  RecipeParameters recipe_parameters;

  // order_index of the change this step was planned from.
  std::uint32_t source_order_index = 0;
};

enum class DiagnosticReason : std::uint8_t {
  kUnknownClassification = 1,
  kNoCompatibleTool      = 2,
};

constexpr std::string_view ToString(DiagnosticReason reason) {
  switch (reason) {
    case DiagnosticReason::kUnknownClassification:
      return "UNKNOWN_CLASSIFICATION";
    case DiagnosticReason::kNoCompatibleTool:
    default:
      return "NO_COMPATIBLE_TOOL";
  }
}

struct PlanDiagnostic {
  std::uint32_t    order_index = 0;
  DiagnosticReason reason      = DiagnosticReason::kUnknownClassification;
  std::string      detail;
};

/*
  Result of one planning cycle. flow is in manufacturing order and must not be
  reordered downstream.
*/
struct PlanResult {
  std::vector<ProcessStep>    flow;
  std::vector<PlanDiagnostic> diagnostics;
};

} // namespace fabplan::model
