#pragma once

#include <filesystem>
#include <string>

#include "internal/lithography/mask_extractor.hpp"

namespace fabplan::lithography {

/*
  Local mask backend.

  Stages the referenced layout as <output_dir>/mask_<step>.gds. Layer
  extraction from the layout itself belongs to the layout tooling.
*/
class OutputDirMaskExtractor final : public MaskExtractor {
 public:
  explicit OutputDirMaskExtractor(std::filesystem::path output_dir);

  std::string Extract(const std::string& layout_reference, const std::string& step_identifier) override;

  static std::string MaskFileName(const std::string& step_identifier);

 private:
  std::filesystem::path output_dir_;
};

} // namespace fabplan::lithography
