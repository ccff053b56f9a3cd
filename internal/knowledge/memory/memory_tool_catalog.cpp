#include "memory_tool_catalog.hpp"

namespace fabplan::knowledge::memory {

MemoryToolCatalog::MemoryToolCatalog(std::vector<model::ToolDefinition> definitions) {
  for (auto& definition : definitions) {
    Upsert(std::move(definition));
  }
}

CatalogResult MemoryToolCatalog::FindCandidates(const ToolQuery& query) {
  std::lock_guard lock(mutex_);

  CatalogResult result;
  for (const auto& [tool_id, definition] : tools_) {
    if (definition.wafer_size != query.wafer_size) continue;
    if (!definition.capable_categories.contains(query.category)) continue;
    result.tools.push_back(model::ResolveFor(definition, query.category));
  }
  return result;
}

void MemoryToolCatalog::Upsert(model::ToolDefinition definition) {
  std::lock_guard lock(mutex_);
  auto            tool_id = definition.tool_id;
  tools_[tool_id]         = std::move(definition);
}

bool MemoryToolCatalog::Remove(const std::string& tool_id) {
  std::lock_guard lock(mutex_);
  return tools_.erase(tool_id) > 0;
}

std::size_t MemoryToolCatalog::Size() const {
  std::lock_guard lock(mutex_);
  return tools_.size();
}

} // namespace fabplan::knowledge::memory
