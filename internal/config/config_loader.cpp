#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace fabplan::config {

namespace {

using google::protobuf::Value;

std::string Where(const YAML::Node& node) {
  const auto mark = node.Mark();
  if (mark.is_null()) {
    return "";
  }
  return " at line " + std::to_string(mark.line + 1) + ", column " + std::to_string(mark.column + 1);
}

bool ParseNumber(const std::string& text, double* number) {
  if (text.empty()) {
    return false;
  }
  char* end = nullptr;
  *number   = std::strtod(text.c_str(), &end);
  return end != nullptr && *end == '\0';
}

void ConvertScalar(const YAML::Node& node, Value* value) {
  const std::string& text = node.Scalar();

  // Quoted scalars stay strings so identifiers like "2" survive.
  if (node.Tag() == "!") {
    value->set_string_value(text);
    return;
  }

  if (text == "true" || text == "false") {
    value->set_bool_value(text == "true");
    return;
  }

  double number = 0.0;
  if (ParseNumber(text, &number)) {
    value->set_number_value(number);
    return;
  }

  value->set_string_value(text);
}

void ConvertNode(const YAML::Node& node, Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NULL_VALUE);
      return;

    case YAML::NodeType::Scalar:
      ConvertScalar(node, value);
      return;

    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (const auto& element : node) {
        ConvertNode(element, list->add_values());
      }
      return;
    }

    case YAML::NodeType::Map: {
      auto& fields = *value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        if (!entry.first.IsScalar()) {
          throw std::runtime_error("YAML mapping keys must be scalars" + Where(entry.first));
        }
        ConvertNode(entry.second, &fields[entry.first.Scalar()]);
      }
      return;
    }

    case YAML::NodeType::Undefined:
    default:
      throw std::runtime_error("Unsupported YAML node" + Where(node));
  }
}

// YAML -> google.protobuf.Value -> JSON -> message, so the JSON parser
// enforces field names and types.
void FillMessage(const YAML::Node& document, google::protobuf::Message* message) {
  Value root;
  if (document.IsNull()) {
    root.mutable_struct_value();
  } else {
    ConvertNode(document, &root);
  }

  std::string json;
  const auto  encoded = google::protobuf::util::MessageToJsonString(root, &json);
  if (!encoded.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(encoded.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  const auto parsed = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!parsed.ok()) {
    throw std::runtime_error("Invalid " + message->GetDescriptor()->name() + ": " + std::string(parsed.message()));
  }
}

} // namespace

void ConfigLoader::LoadMessageFromYaml(const std::string& path, google::protobuf::Message* message) {
  YAML::Node document;
  try {
    document = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML file " + path + ": " + e.what());
  }
  FillMessage(document, message);
}

void ConfigLoader::ParseMessageFromYaml(const std::string& yaml_text, google::protobuf::Message* message) {
  YAML::Node document;
  try {
    document = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to parse YAML: ") + e.what());
  }
  FillMessage(document, message);
}

fabplan::runtime::config::Config ConfigLoader::LoadFromYaml(const std::string& path) {
  fabplan::runtime::config::Config config;
  LoadMessageFromYaml(path, &config);
  return config;
}

} // namespace fabplan::config
