#pragma once

#include <string>

namespace fabplan::lithography {

/*
  Mask-extraction collaborator: turns a layout reference into the mask file
  for one lithography step.

  Extract throws util::MaskExtractionFailed when the layout cannot produce a
  mask and util::CollaboratorUnavailable when the service cannot be reached.
*/
class MaskExtractor {
 public:
  virtual ~MaskExtractor() = default;

  virtual std::string Extract(const std::string& layout_reference, const std::string& step_identifier) = 0;
};

} // namespace fabplan::lithography
