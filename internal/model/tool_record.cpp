#include "tool_record.hpp"

namespace fabplan::model {

ToolRecord ResolveFor(const ToolDefinition& definition, ProcessCategory category) {
  ToolRecord record;
  record.tool_id                = definition.tool_id;
  record.status                 = definition.status;
  record.wafer_size             = definition.wafer_size;
  record.capable_categories     = definition.capable_categories;
  record.incompatible_materials = definition.incompatible_materials;

  auto it = definition.models.find(category);
  if (it != definition.models.end()) {
    record.surrogate_model = it->second;
  }
  return record;
}

} // namespace fabplan::model
