#include "lithography_planner.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace fabplan::lithography {

LithographyPlanner::LithographyPlanner(std::shared_ptr<MaskExtractor> extractor, LithographyOptions options)
    : extractor_(std::move(extractor)), options_(std::move(options)) {
  if (!extractor_) {
    throw std::invalid_argument("lithography planner requires a mask extractor");
  }
}

const std::string& LithographyPlanner::LayoutFor(const model::ChangeDescriptor& descriptor,
                                                 const std::map<std::string, std::string>& layouts) const {
  const auto step = model::StepIdentifier(descriptor);
  auto       it   = layouts.find(step);
  if (it == layouts.end() || it->second.empty()) {
    throw util::MissingLayoutReference("no layout reference for lithography step " + step);
  }
  return it->second;
}

model::RecipeParameters LithographyPlanner::Plan(const model::ChangeDescriptor& descriptor, const std::string& layout_reference) const {
  const auto step      = model::StepIdentifier(descriptor);
  auto       mask_file = extractor_->Extract(layout_reference, step);
  if (mask_file.empty()) {
    throw util::MaskExtractionFailed("mask extraction for step " + step + " returned no file");
  }

  model::RecipeParameters recipe;
  recipe.text.push_back({"mask_file", std::move(mask_file)});
  recipe.text.push_back({"resist_coat_recipe", options_.resist_coat_recipe});
  recipe.text.push_back({"exposure_recipe", options_.exposure_recipe});
  recipe.text.push_back({"develop_recipe", options_.develop_recipe});
  return recipe;
}

} // namespace fabplan::lithography
