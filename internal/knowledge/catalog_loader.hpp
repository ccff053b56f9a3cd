#pragma once

#include <string>
#include <vector>

#include "fabplan/v1.hpp"
#include "internal/model/tool_record.hpp"

namespace fabplan::knowledge {

// Reads a YAML tool catalog document.
fabplan::v1::ToolCatalogSpec LoadToolCatalogSpec(const std::string& path);

// Converts catalog entries into tool definitions, fitting one response model
// per (tool, category) that reports historical runs.
std::vector<model::ToolDefinition> ToolDefinitionsFromSpec(const fabplan::v1::ToolCatalogSpec& spec);

} // namespace fabplan::knowledge
