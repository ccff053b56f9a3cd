#include "tool_selector.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fabplan::selector {

using fabplan::observability::IntField;
using fabplan::observability::StringField;

bool RequiresResponseModel(model::ProcessCategory category) {
  return category == model::ProcessCategory::kDeposition || category == model::ProcessCategory::kEtch;
}

ToolSelector::ToolSelector(std::shared_ptr<knowledge::ToolCatalog> catalog, SelectorOptions options)
    : catalog_(std::move(catalog)), options_(std::move(options)) {
  if (!catalog_) {
    throw std::invalid_argument("tool selector requires a catalog");
  }
  if (!options_.now) {
    options_.now = util::Now;
  }
}

std::string ToolSelector::IneligibilityReason(const model::ToolRecord& tool, model::ProcessCategory category, model::WaferSize wafer_size,
                                              const std::set<std::string>& materials) {
  if (tool.status != model::ToolStatus::kAvailable) {
    return "status " + std::string(model::ToString(tool.status));
  }
  if (tool.wafer_size != wafer_size) {
    return "wafer size " + std::to_string(model::Millimeters(tool.wafer_size)) + " mm";
  }
  if (!tool.capable_categories.contains(category)) {
    return "not capable of " + std::string(model::ToString(category));
  }
  for (const auto& material : materials) {
    if (tool.incompatible_materials.contains(material)) {
      return "incompatible with " + material;
    }
  }
  if (RequiresResponseModel(category) && !tool.surrogate_model) {
    return "no response model for " + std::string(model::ToString(category));
  }
  return {};
}

model::ToolRecord ToolSelector::Select(const model::Classification& classification, const model::ChangeDescriptor& descriptor,
                                       const model::PlanningContext& context) const {
  std::set<std::string> materials = model::MaterialsOf(descriptor);
  materials.insert(context.materials_present.begin(), context.materials_present.end());

  knowledge::ToolQuery query;
  query.category   = classification.category;
  query.wafer_size = descriptor.wafer_size;
  query.materials  = materials;
  query.deadline   = util::DeadlineAfter(options_.now(), static_cast<std::uint64_t>(options_.query_deadline.count()));

  const std::string what = std::string(model::ToString(classification.category)) + " on " + descriptor.primary_material + " (" +
                           std::to_string(model::Millimeters(descriptor.wafer_size)) + " mm)";

  auto result = catalog_->FindCandidates(query);
  if (result.status.code == knowledge::ErrorCode::DeadlineExceeded || (result.status && util::Expired(query.deadline, options_.now()))) {
    throw util::NoCompatibleTool("knowledge store query deadline exceeded for " + what);
  }
  if (!result.status) {
    throw util::CollaboratorUnavailable("knowledge-store",
                                        std::string(knowledge::ToString(result.status.code)) + ": " + result.status.message);
  }

  std::vector<const model::ToolRecord*> eligible;
  for (const auto& tool : result.tools) {
    auto reason = IneligibilityReason(tool, classification.category, descriptor.wafer_size, materials);
    if (reason.empty()) {
      eligible.push_back(&tool);
      continue;
    }
    FABPLAN_LOG_DEBUG("Filtered out tool", {StringField("tool_id", tool.tool_id), IntField("order_index", descriptor.order_index),
                                            StringField("reason", reason)});
  }

  if (eligible.empty()) {
    throw util::NoCompatibleTool("no compatible tool for " + what + " among " + std::to_string(result.tools.size()) + " candidates");
  }

  const auto* chosen = *std::min_element(eligible.begin(), eligible.end(), [&](const model::ToolRecord* a, const model::ToolRecord* b) {
    const auto load_a = context.AssignedTo(a->tool_id);
    const auto load_b = context.AssignedTo(b->tool_id);
    if (load_a != load_b) {
      return load_a < load_b;
    }
    return a->tool_id < b->tool_id;
  });

  FABPLAN_LOG_INFO("Selected tool", {StringField("tool_id", chosen->tool_id), IntField("order_index", descriptor.order_index),
                                     StringField("process", model::ToString(classification.category)),
                                     IntField("eligible", static_cast<std::int64_t>(eligible.size()))});
  return *chosen;
}

} // namespace fabplan::selector
