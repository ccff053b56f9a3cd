#include "output_dir_mask_extractor.hpp"

#include <cctype>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fabplan::lithography {

using fabplan::observability::StringField;

OutputDirMaskExtractor::OutputDirMaskExtractor(std::filesystem::path output_dir) : output_dir_(std::move(output_dir)) {
}

std::string OutputDirMaskExtractor::MaskFileName(const std::string& step_identifier) {
  std::string name = "mask_";
  for (char c : step_identifier) {
    const auto uc = static_cast<unsigned char>(c);
    name.push_back(std::isalnum(uc) || c == '-' || c == '_' ? c : '_');
  }
  return name + ".gds";
}

std::string OutputDirMaskExtractor::Extract(const std::string& layout_reference, const std::string& step_identifier) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(layout_reference, ec)) {
    throw util::MaskExtractionFailed("layout " + layout_reference + " for step " + step_identifier + " is not a readable file");
  }

  std::filesystem::create_directories(output_dir_, ec);
  if (ec) {
    throw util::CollaboratorUnavailable("mask-service", "cannot create " + output_dir_.string() + ": " + ec.message());
  }

  const auto mask_path = output_dir_ / MaskFileName(step_identifier);
  std::filesystem::copy_file(layout_reference, mask_path, std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    throw util::CollaboratorUnavailable("mask-service", "cannot write " + mask_path.string() + ": " + ec.message());
  }

  FABPLAN_LOG_INFO("Mask file written", {StringField("step", step_identifier), StringField("layout", layout_reference),
                                         StringField("mask_file", mask_path.string())});
  return mask_path.string();
}

} // namespace fabplan::lithography
