#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "internal/knowledge/api/tool_catalog.hpp"

namespace fabplan::knowledge::memory {

/*
  In-memory knowledge store.

  Backs YAML tool catalogs and serves as the test double for the planner.
*/
class MemoryToolCatalog final : public ToolCatalog {
 public:
  MemoryToolCatalog() = default;
  explicit MemoryToolCatalog(std::vector<model::ToolDefinition> definitions);

  CatalogResult FindCandidates(const ToolQuery& query) override;

  // Replaces any tool with the same id.
  void Upsert(model::ToolDefinition definition);

  bool Remove(const std::string& tool_id);

  std::size_t Size() const;

 private:
  mutable std::mutex                           mutex_;
  std::map<std::string, model::ToolDefinition> tools_;
};

} // namespace fabplan::knowledge::memory
