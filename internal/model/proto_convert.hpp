#pragma once

#include "fabplan/v1.hpp"
#include "internal/model/change_descriptor.hpp"
#include "internal/model/process_category.hpp"
#include "internal/model/tool_record.hpp"

namespace fabplan::model {

/*
  Boundary conversions between wire messages and engine types.
*/

Polarity        FromProto(fabplan::v1::Polarity polarity);
ProcessCategory FromProto(fabplan::v1::ProcessCategory category);
ToolStatus      FromProto(fabplan::v1::ToolStatus status);

fabplan::v1::ProcessCategory ToProto(ProcessCategory category);
fabplan::v1::ToolStatus      ToProto(ToolStatus status);

// Throws util::InvalidDescriptor for an unsupported wafer size. Range checks
// on the remaining fields happen in Validate().
ChangeDescriptor FromProto(const fabplan::v1::ChangeDescriptor& message);

} // namespace fabplan::model
