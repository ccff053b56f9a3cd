#include "proto_convert.hpp"

#include "internal/util/errors.hpp"

namespace fabplan::model {

using namespace fabplan::v1;

Polarity FromProto(fabplan::v1::Polarity polarity) {
  switch (polarity) {
    case POLARITY_ADDITION:
      return Polarity::kAddition;
    case POLARITY_REMOVAL:
      return Polarity::kRemoval;
    case POLARITY_MODIFICATION:
      return Polarity::kModification;
    default:
      return Polarity::kUnspecified;
  }
}

ProcessCategory FromProto(fabplan::v1::ProcessCategory category) {
  switch (category) {
    case PROCESS_CATEGORY_DEPOSITION:
      return ProcessCategory::kDeposition;
    case PROCESS_CATEGORY_ETCH:
      return ProcessCategory::kEtch;
    case PROCESS_CATEGORY_LITHOGRAPHY:
      return ProcessCategory::kLithography;
    default:
      return ProcessCategory::kUnknown;
  }
}

ToolStatus FromProto(fabplan::v1::ToolStatus status) {
  switch (status) {
    case TOOL_STATUS_AVAILABLE:
      return ToolStatus::kAvailable;
    case TOOL_STATUS_DOWN:
      return ToolStatus::kDown;
    case TOOL_STATUS_MAINTENANCE:
      return ToolStatus::kMaintenance;
    default:
      return ToolStatus::kUnspecified;
  }
}

fabplan::v1::ProcessCategory ToProto(ProcessCategory category) {
  switch (category) {
    case ProcessCategory::kDeposition:
      return PROCESS_CATEGORY_DEPOSITION;
    case ProcessCategory::kEtch:
      return PROCESS_CATEGORY_ETCH;
    case ProcessCategory::kLithography:
      return PROCESS_CATEGORY_LITHOGRAPHY;
    default:
      return PROCESS_CATEGORY_UNKNOWN;
  }
}

fabplan::v1::ToolStatus ToProto(ToolStatus status) {
  switch (status) {
    case ToolStatus::kAvailable:
      return TOOL_STATUS_AVAILABLE;
    case ToolStatus::kDown:
      return TOOL_STATUS_DOWN;
    case ToolStatus::kMaintenance:
      return TOOL_STATUS_MAINTENANCE;
    default:
      return TOOL_STATUS_UNSPECIFIED;
  }
}

ChangeDescriptor FromProto(const fabplan::v1::ChangeDescriptor& message) {
  ChangeDescriptor descriptor;
  descriptor.polarity         = FromProto(message.polarity());
  descriptor.primary_material = message.primary_material();
  descriptor.affected_materials.insert(message.affected_materials().begin(), message.affected_materials().end());
  descriptor.aspect_ratio       = message.aspect_ratio();
  descriptor.conformality_score = message.conformality_score();
  descriptor.target_metric      = message.target_metric();
  descriptor.order_index        = message.order_index();
  descriptor.patterning         = message.patterning();
  descriptor.step_identifier    = message.step_identifier();

  if (message.wafer_size_mm() != 0) {
    auto size = WaferSizeFromMillimeters(message.wafer_size_mm());
    if (!size) {
      throw util::InvalidDescriptor("change " + std::to_string(message.order_index()) + ": unsupported wafer size " +
                                    std::to_string(message.wafer_size_mm()) + " mm");
    }
    descriptor.wafer_size = *size;
  }
  return descriptor;
}

} // namespace fabplan::model
