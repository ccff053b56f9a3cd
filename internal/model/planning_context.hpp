#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <unordered_map>

namespace fabplan::model {

/*
  Mutable state of one planning cycle.

  Owned and mutated by the orchestrator only; other components receive it
  by const reference. A fresh context per run keeps the engine reentrant.
*/
struct PlanningContext {
  // tool_id -> steps already assigned to it in this cycle.
  std::unordered_map<std::string, std::uint32_t> assigned_steps;

  // Materials on the wafer so far, starting from the bare substrate.
  std::set<std::string> materials_present;

  std::uint32_t AssignedTo(const std::string& tool_id) const {
    auto it = assigned_steps.find(tool_id);
    return it == assigned_steps.end() ? 0 : it->second;
  }
};

} // namespace fabplan::model
