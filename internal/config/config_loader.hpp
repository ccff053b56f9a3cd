#pragma once

#include <string>

#include <google/protobuf/message.h>

#include "config/config.pb.h"

namespace fabplan::config {

/*
  Loads protobuf documents from YAML files.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected.
*/
class ConfigLoader {
 public:
  static fabplan::runtime::config::Config LoadFromYaml(const std::string& path);

  // Any message type; used for change sequences and tool catalogs.
  static void LoadMessageFromYaml(const std::string& path, google::protobuf::Message* message);

  static void ParseMessageFromYaml(const std::string& yaml_text, google::protobuf::Message* message);
};

} // namespace fabplan::config
