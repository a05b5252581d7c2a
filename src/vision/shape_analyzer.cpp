#include <portiona/vision/shape_analyzer.hpp>
#include <portiona/core/volume_calculator.hpp>
#include <array>
#include <string>

namespace portiona::vision {

namespace pc = portiona::core;

pc::FoodShape ShapeAnalyzer::classify(double aspect_ratio, pc::FoodShape shape_prior) noexcept {
  if (aspect_ratio >= 0.8 && aspect_ratio <= 1.2) {
    return pc::FoodShape::Spherical;
  }
  if (aspect_ratio > 2.0 || aspect_ratio < 0.5) {
    return pc::FoodShape::Cylindrical;
  }
  return shape_prior;
}

pc::ShapeAnalysis ShapeAnalyzer::analyze(const pc::BoundingBox& box,
                                         pc::FoodShape shape_prior) const {
  pc::ShapeAnalysis out;
  out.shape = classify(box.aspect_ratio(), shape_prior);

  const double mean_side = (box.width + box.height) / 2.0;
  out.dimensions.length = box.width * kPixelToLengthHeuristic;
  out.dimensions.width = box.height * kPixelToLengthHeuristic;
  out.dimensions.height = mean_side * kHeightFromMeanSideHeuristic;
  out.surface_area = pc::surface_area_for(out.shape, out.dimensions);
  return out;
}

pc::FoodShape resolve_shape_prior(std::string_view food_name,
                                  const std::optional<pc::FoodDensityEntry>& entry) {
  if (entry) {
    return entry->shape_prior;
  }
  static constexpr std::array<std::string_view, 2> kRectangularKeywords{"bread", "cheese"};
  const std::string key = pc::normalize_food_name(food_name);
  for (const auto keyword : kRectangularKeywords) {
    if (key.find(keyword) != std::string::npos) {
      return pc::FoodShape::Rectangular;
    }
  }
  return pc::FoodShape::Irregular;
}

}  // namespace portiona::vision
