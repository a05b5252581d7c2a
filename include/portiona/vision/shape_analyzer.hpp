#pragma once

#include <portiona/core/food.hpp>
#include <portiona/core/food_density.hpp>
#include <portiona/core/geometry.hpp>
#include <optional>
#include <string_view>

namespace portiona::vision {

/// Image-relative length units per pixel.
inline constexpr double kPixelToLengthHeuristic = 0.1;
/// Height estimate as a fraction of the mean box side (pixels).
inline constexpr double kHeightFromMeanSideHeuristic = 0.08;

/// Classifies a food region into a canonical shape and estimates its extents.
///
/// Aspect ratio r = width / height:
///   0.8 <= r <= 1.2       -> spherical
///   r > 2 or r < 0.5      -> cylindrical
///   otherwise             -> the food's shape prior
/// Dimensions are image-relative (not calibrated); the estimator rescales them.
class ShapeAnalyzer {
 public:
  /// Precondition: box.is_valid().
  [[nodiscard]] portiona::core::ShapeAnalysis analyze(
      const portiona::core::BoundingBox& box,
      portiona::core::FoodShape shape_prior) const;

  [[nodiscard]] static portiona::core::FoodShape classify(
      double aspect_ratio,
      portiona::core::FoodShape shape_prior) noexcept;
};

/// Shape prior of a food: its density entry's prior when known; for unknown
/// foods "bread" / "cheese" in the name give rectangular, anything else irregular.
[[nodiscard]] portiona::core::FoodShape resolve_shape_prior(
    std::string_view food_name,
    const std::optional<portiona::core::FoodDensityEntry>& entry);

}  // namespace portiona::vision
