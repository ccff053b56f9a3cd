#pragma once

#include <map>
#include <string>
#include <vector>

#include "fabplan/v1.hpp"
#include "internal/model/change_descriptor.hpp"

namespace fabplan::io {

struct ChangeInput {
  std::vector<model::ChangeDescriptor> changes;

  // Lithography step identifier -> layout file reference.
  std::map<std::string, std::string> layouts;
};

// Reads a YAML change sequence (fabplan.v1.ChangeSequence).
ChangeInput LoadChangeSequence(const std::string& path);

ChangeInput FromProto(const fabplan::v1::ChangeSequence& sequence);

} // namespace fabplan::io
