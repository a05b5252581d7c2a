#pragma once

#include <optional>
#include <string>

namespace portiona::core {

/// Physical size of a reference object in centimeters.
struct RealWorldSize {
  double width{0.0};
  double height{0.0};
  std::optional<double> depth;
};

/// Observed size of a reference object in image pixels.
struct PixelSize {
  double width{0.0};
  double height{0.0};
};

/// Detected calibration object with known physical dimensions.
struct ReferenceObject {
  std::string name;
  RealWorldSize real_world_size{};
  PixelSize pixel_size{};
  double confidence{0.0};

  /// Has positive sizes on both axes, so a pixel -> cm scale can be derived.
  [[nodiscard]] bool has_usable_scale() const noexcept {
    return real_world_size.width > 0.0 && real_world_size.height > 0.0 &&
           pixel_size.width > 0.0 && pixel_size.height > 0.0;
  }
};

/// Depth evidence for one bounding box. average_depth and depth_variance are
/// zero whenever has_depth_data is false.
struct DepthEstimate {
  bool has_depth_data{false};
  double average_depth{0.0};  // cm
  double depth_variance{0.0};

  [[nodiscard]] static DepthEstimate none() noexcept { return {}; }
};

}  // namespace portiona::core
