#pragma once

#include <cstdint>
#include <string_view>

namespace fabplan::model {

enum class ProcessCategory : std::uint8_t {
  kUnknown     = 0,
  kDeposition  = 1,
  kEtch        = 2,
  kLithography = 3,
};

enum class ProcessSubtype : std::uint8_t {
  kNone        = 0,
  kConformal   = 1,
  kPlanar      = 2,
  kAnisotropic = 3,
  kIsotropic   = 4,
};

// Display names are part of the output contract.
constexpr std::string_view ToString(ProcessCategory category) {
  switch (category) {
    case ProcessCategory::kDeposition:
      return "Deposition";
    case ProcessCategory::kEtch:
      return "Etch";
    case ProcessCategory::kLithography:
      return "Lithography";
    case ProcessCategory::kUnknown:
    default:
      return "Unknown";
  }
}

constexpr std::string_view ToString(ProcessSubtype subtype) {
  switch (subtype) {
    case ProcessSubtype::kConformal:
      return "conformal";
    case ProcessSubtype::kPlanar:
      return "planar";
    case ProcessSubtype::kAnisotropic:
      return "anisotropic";
    case ProcessSubtype::kIsotropic:
      return "isotropic";
    case ProcessSubtype::kNone:
    default:
      return "none";
  }
}

struct Classification {
  ProcessCategory category = ProcessCategory::kUnknown;
  ProcessSubtype  subtype  = ProcessSubtype::kNone;

  // Name of the rule that produced this classification.
  std::string_view rule;
};

} // namespace fabplan::model
