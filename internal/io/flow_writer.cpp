#include "flow_writer.hpp"

#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <stdexcept>

namespace fabplan::io {

fabplan::v1::ProcessStep ToProto(const model::ProcessStep& step) {
  fabplan::v1::ProcessStep message;
  message.set_step_number(step.step_number);
  message.set_process_type(std::string(model::ToString(step.process_type)));
  message.set_tool_id(step.tool_id);

  auto& fields = *message.mutable_recipe_parameters()->mutable_fields();
  for (const auto& parameter : step.recipe_parameters.numeric) {
    fields[parameter.name].set_number_value(parameter.value);
  }
  if (step.recipe_parameters.achieved) {
    fields[step.recipe_parameters.achieved->name].set_number_value(step.recipe_parameters.achieved->value);
  }
  for (const auto& parameter : step.recipe_parameters.text) {
    fields[parameter.name].set_string_value(parameter.value);
  }
  return message;
}

std::string FlowToJson(const std::vector<model::ProcessStep>& flow) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json = "[";
  for (std::size_t i = 0; i < flow.size(); ++i) {
    std::string step_json;
    auto        status = google::protobuf::util::MessageToJsonString(ToProto(flow[i]), &step_json, options);
    if (!status.ok()) {
      throw std::runtime_error("Failed to serialize step " + std::to_string(flow[i].step_number) + ": " + std::string(status.message()));
    }
    json += i == 0 ? "\n  " : ",\n  ";
    json += step_json;
  }
  json += flow.empty() ? "]\n" : "\n]\n";
  return json;
}

void WriteFlowJson(const std::string& path, const std::vector<model::ProcessStep>& flow) {
  const auto    json = FlowToJson(flow);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("Failed to open " + path + " for writing");
  }
  out << json;
  if (!out) {
    throw std::runtime_error("Failed to write " + path);
  }
}

} // namespace fabplan::io
