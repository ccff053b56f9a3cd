#include "change_loader.hpp"

#include "internal/config/config_loader.hpp"
#include "internal/model/proto_convert.hpp"

namespace fabplan::io {

ChangeInput LoadChangeSequence(const std::string& path) {
  fabplan::v1::ChangeSequence sequence;
  config::ConfigLoader::LoadMessageFromYaml(path, &sequence);
  return FromProto(sequence);
}

ChangeInput FromProto(const fabplan::v1::ChangeSequence& sequence) {
  ChangeInput input;
  input.changes.reserve(static_cast<std::size_t>(sequence.changes_size()));
  for (const auto& change : sequence.changes()) {
    input.changes.push_back(model::FromProto(change));
  }
  for (const auto& [step, layout] : sequence.layouts()) {
    input.layouts.emplace(step, layout);
  }
  return input;
}

} // namespace fabplan::io
