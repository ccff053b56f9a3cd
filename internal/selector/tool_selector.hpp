#pragma once

#include <chrono>
#include <memory>
#include <set>
#include <string>

#include "internal/knowledge/api/tool_catalog.hpp"
#include "internal/model/change_descriptor.hpp"
#include "internal/model/planning_context.hpp"
#include "internal/model/process_category.hpp"
#include "internal/model/tool_record.hpp"
#include "internal/util/time.hpp"

namespace fabplan::selector {

struct SelectorOptions {
  // Zero disables the deadline.
  std::chrono::milliseconds query_deadline{0};
  util::NowFn               now = util::Now;
};

/*
  Resolves a concrete tool for a classified change.

  Hard constraints: status AVAILABLE, matching wafer size, capable of the
  category, no incompatible material among the change's materials or the
  materials already on the wafer, and a fitted response model for optimized
  categories. Ties go to the tool with the fewest steps assigned in this
  cycle, then to the smallest tool_id.
*/
class ToolSelector {
 public:
  explicit ToolSelector(std::shared_ptr<knowledge::ToolCatalog> catalog, SelectorOptions options = {});

  // Throws util::NoCompatibleTool when nothing qualifies (or the query
  // deadline passed) and util::CollaboratorUnavailable when the knowledge
  // store cannot answer.
  model::ToolRecord Select(const model::Classification& classification, const model::ChangeDescriptor& descriptor,
                           const model::PlanningContext& context) const;

  // Returns an empty string for eligible tools, otherwise the first violated
  // constraint.
  static std::string IneligibilityReason(const model::ToolRecord& tool, model::ProcessCategory category, model::WaferSize wafer_size,
                                         const std::set<std::string>& materials);

 private:
  std::shared_ptr<knowledge::ToolCatalog> catalog_;
  SelectorOptions                         options_;
};

// Whether steps of this category need a surrogate model to be planned.
bool RequiresResponseModel(model::ProcessCategory category);

} // namespace fabplan::selector
