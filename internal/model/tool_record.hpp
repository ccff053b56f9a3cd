#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>

#include "internal/model/change_descriptor.hpp"
#include "internal/model/process_category.hpp"

namespace fabplan::surrogate {
class SurrogateModel;
}

namespace fabplan::model {

enum class ToolStatus : std::uint8_t {
  kUnspecified = 0,
  kAvailable   = 1,
  kDown        = 2,
  kMaintenance = 3,
};

constexpr std::string_view ToString(ToolStatus status) {
  switch (status) {
    case ToolStatus::kAvailable:
      return "available";
    case ToolStatus::kDown:
      return "down";
    case ToolStatus::kMaintenance:
      return "maintenance";
    case ToolStatus::kUnspecified:
    default:
      return "unspecified";
  }
}

/*
  A tool as returned by one knowledge-store query.

  surrogate_model is the fitted response model for the queried category and
  may be null for categories that are not optimized (lithography).
*/
struct ToolRecord {
  std::string               tool_id;
  ToolStatus                status     = ToolStatus::kUnspecified;
  WaferSize                 wafer_size = WaferSize::kUnspecified;
  std::set<ProcessCategory> capable_categories;
  std::set<std::string>     incompatible_materials;

  std::shared_ptr<const surrogate::SurrogateModel> surrogate_model;
};

/*
  Catalog-side definition of a tool, with one fitted model per category.
*/
struct ToolDefinition {
  std::string               tool_id;
  ToolStatus                status     = ToolStatus::kUnspecified;
  WaferSize                 wafer_size = WaferSize::kUnspecified;
  std::set<ProcessCategory> capable_categories;
  std::set<std::string>     incompatible_materials;

  std::map<ProcessCategory, std::shared_ptr<const surrogate::SurrogateModel>> models;
};

// Projects a definition onto the record seen by a query for `category`.
ToolRecord ResolveFor(const ToolDefinition& definition, ProcessCategory category);

} // namespace fabplan::model
