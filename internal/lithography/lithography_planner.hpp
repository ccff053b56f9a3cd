#pragma once

#include <map>
#include <memory>
#include <string>

#include "internal/lithography/mask_extractor.hpp"
#include "internal/model/change_descriptor.hpp"
#include "internal/model/recipe_parameters.hpp"

namespace fabplan::lithography {

struct LithographyOptions {
  std::string resist_coat_recipe = "STANDARD_COAT_1UM";
  std::string exposure_recipe    = "STANDARD_EXPOSE_200mJ";
  std::string develop_recipe     = "STANDARD_DEV_60S";
};

/*
  Builds patterning recipes: a mask file plus the fixed coat / expose /
  develop sub-recipes. No numeric optimization is involved.
*/
class LithographyPlanner {
 public:
  explicit LithographyPlanner(std::shared_ptr<MaskExtractor> extractor, LithographyOptions options = {});

  // Layout reference for the change's step identifier. Throws
  // util::MissingLayoutReference when none was supplied.
  const std::string& LayoutFor(const model::ChangeDescriptor& descriptor, const std::map<std::string, std::string>& layouts) const;

  model::RecipeParameters Plan(const model::ChangeDescriptor& descriptor, const std::string& layout_reference) const;

  const LithographyOptions& Options() const {
    return options_;
  }

 private:
  std::shared_ptr<MaskExtractor> extractor_;
  LithographyOptions             options_;
};

} // namespace fabplan::lithography
