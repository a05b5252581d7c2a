#pragma once

#include <portiona/core/food.hpp>
#include <cmath>

namespace portiona::core {

/// Axis-aligned food region in image pixels.
struct BoundingBox {
  double x{0.0};
  double y{0.0};
  double width{0.0};
  double height{0.0};

  /// width > 0, height > 0 and every field finite.
  [[nodiscard]] bool is_valid() const noexcept {
    return std::isfinite(x) && std::isfinite(y) && std::isfinite(width) &&
           std::isfinite(height) && width > 0.0 && height > 0.0;
  }

  [[nodiscard]] double aspect_ratio() const noexcept { return width / height; }
  [[nodiscard]] double area() const noexcept { return width * height; }
};

/// Extents along three axes. Units depend on the producer: the shape analyzer
/// reports image-relative units, the estimator centimeters.
struct Dimensions {
  double length{0.0};
  double width{0.0};
  double height{0.0};
};

struct ShapeAnalysis {
  FoodShape shape{FoodShape::Irregular};
  Dimensions dimensions{};
  double surface_area{0.0};
};

}  // namespace portiona::core
