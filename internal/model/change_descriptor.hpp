#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace fabplan::model {

enum class Polarity : std::uint8_t {
  kUnspecified  = 0,
  kAddition     = 1,
  kRemoval      = 2,
  kModification = 3,
};

enum class WaferSize : std::uint16_t {
  kUnspecified = 0,
  k100mm       = 100,
  k150mm       = 150,
  k200mm       = 200,
  k300mm       = 300,
  k450mm       = 450,
};

constexpr std::string_view ToString(Polarity polarity) {
  switch (polarity) {
    case Polarity::kAddition:
      return "addition";
    case Polarity::kRemoval:
      return "removal";
    case Polarity::kModification:
      return "modification";
    case Polarity::kUnspecified:
    default:
      return "unspecified";
  }
}

std::optional<WaferSize> WaferSizeFromMillimeters(std::uint32_t millimeters);

constexpr std::uint32_t Millimeters(WaferSize size) {
  return static_cast<std::uint32_t>(size);
}

/*
  One detected transition between consecutive manufacturing stages.

  Produced by the perception collaborators; never mutated by the engine.
*/
struct ChangeDescriptor {
  Polarity              polarity = Polarity::kUnspecified;
  std::string           primary_material;
  std::set<std::string> affected_materials;

  double aspect_ratio       = 0.0;
  double conformality_score = 0.0;

  // Target thickness (addition) or depth (removal) in nm.
  double target_metric = 0.0;

  WaferSize     wafer_size  = WaferSize::kUnspecified;
  std::uint32_t order_index = 0;

  bool        patterning = false;
  std::string step_identifier;
};

// Throws util::InvalidDescriptor when a required attribute is missing or out
// of range.
void Validate(const ChangeDescriptor& descriptor);

// Explicit step identifier, or LITHO_STEP_<order_index + 1>.
std::string StepIdentifier(const ChangeDescriptor& descriptor);

// Primary material plus affected materials.
std::set<std::string> MaterialsOf(const ChangeDescriptor& descriptor);

// Compact one-line summary for logs and diagnostics.
std::string Describe(const ChangeDescriptor& descriptor);

} // namespace fabplan::model
