#include "change_descriptor.hpp"

#include <cmath>
#include <sstream>

#include "internal/util/errors.hpp"

namespace fabplan::model {

namespace {

[[noreturn]] void Reject(const ChangeDescriptor& descriptor, const std::string& reason) {
  throw util::InvalidDescriptor("change " + std::to_string(descriptor.order_index) + ": " + reason);
}

} // namespace

std::optional<WaferSize> WaferSizeFromMillimeters(std::uint32_t millimeters) {
  switch (millimeters) {
    case 100:
      return WaferSize::k100mm;
    case 150:
      return WaferSize::k150mm;
    case 200:
      return WaferSize::k200mm;
    case 300:
      return WaferSize::k300mm;
    case 450:
      return WaferSize::k450mm;
    default:
      return std::nullopt;
  }
}

void Validate(const ChangeDescriptor& descriptor) {
  if (descriptor.polarity == Polarity::kUnspecified) {
    Reject(descriptor, "polarity is required");
  }
  if (descriptor.primary_material.empty()) {
    Reject(descriptor, "primary_material is required");
  }
  if (!std::isfinite(descriptor.aspect_ratio) || descriptor.aspect_ratio <= 0.0) {
    Reject(descriptor, "aspect_ratio must be a positive number");
  }
  if (!std::isfinite(descriptor.conformality_score) || descriptor.conformality_score < 0.0 || descriptor.conformality_score > 1.0) {
    Reject(descriptor, "conformality_score must lie in [0, 1]");
  }
  if (!std::isfinite(descriptor.target_metric) || descriptor.target_metric < 0.0) {
    Reject(descriptor, "target_metric must be a non-negative number");
  }
  if (descriptor.wafer_size == WaferSize::kUnspecified) {
    Reject(descriptor, "wafer_size is required");
  }
}

std::string StepIdentifier(const ChangeDescriptor& descriptor) {
  if (!descriptor.step_identifier.empty()) {
    return descriptor.step_identifier;
  }
  return "LITHO_STEP_" + std::to_string(descriptor.order_index + 1);
}

std::set<std::string> MaterialsOf(const ChangeDescriptor& descriptor) {
  std::set<std::string> materials = descriptor.affected_materials;
  if (!descriptor.primary_material.empty()) {
    materials.insert(descriptor.primary_material);
  }
  return materials;
}

std::string Describe(const ChangeDescriptor& descriptor) {
  std::ostringstream out;
  out << "order_index=" << descriptor.order_index << " polarity=" << ToString(descriptor.polarity)
      << " material=" << descriptor.primary_material << " aspect_ratio=" << descriptor.aspect_ratio
      << " target_metric=" << descriptor.target_metric << " wafer_size_mm=" << Millimeters(descriptor.wafer_size);
  if (descriptor.patterning) {
    out << " patterning=true step=" << StepIdentifier(descriptor);
  }
  return out.str();
}

} // namespace fabplan::model
