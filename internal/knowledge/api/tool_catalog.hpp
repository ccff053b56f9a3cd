#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/knowledge/api/result.hpp"
#include "internal/model/change_descriptor.hpp"
#include "internal/model/process_category.hpp"
#include "internal/model/tool_record.hpp"
#include "internal/util/time.hpp"

namespace fabplan::knowledge {

struct ToolQuery {
  model::ProcessCategory category   = model::ProcessCategory::kUnknown;
  model::WaferSize       wafer_size = model::WaferSize::kUnspecified;
  std::set<std::string>  materials;

  // Optional; backends should give up once it has passed.
  std::optional<util::TimePoint> deadline;
};

struct CatalogResult {
  Result                         status;
  std::vector<model::ToolRecord> tools;
};

/*
  Knowledge-store query capability: resolve candidate tools for constraints.

  Returns every tool capable of query.category at query.wafer_size, in any
  status and in no particular order. Eligibility filtering is the caller's
  job. Queries are idempotent and have no side effects visible to the caller.
*/
class ToolCatalog {
 public:
  virtual ~ToolCatalog() = default;

  virtual CatalogResult FindCandidates(const ToolQuery& query) = 0;
};

} // namespace fabplan::knowledge
