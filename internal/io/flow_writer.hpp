#pragma once

#include <string>
#include <vector>

#include "fabplan/v1.hpp"
#include "internal/model/process_step.hpp"

namespace fabplan::io {

// recipe_parameters is flattened into one Struct: numeric parameters, the
// achieved metric, then text parameters.
fabplan::v1::ProcessStep ToProto(const model::ProcessStep& step);

// JSON array of ProcessStep objects in flow order.
std::string FlowToJson(const std::vector<model::ProcessStep>& flow);

// Writes FlowToJson to `path`. Throws std::runtime_error on I/O failure.
void WriteFlowJson(const std::string& path, const std::vector<model::ProcessStep>& flow);

} // namespace fabplan::io
