#pragma once

#include <portiona/core/evidence.hpp>
#include <portiona/core/geometry.hpp>
#include <cstdint>
#include <string_view>
#include <variant>

namespace portiona::core {

/// Evidence path that produced a result.
enum class EstimationMethod : std::uint8_t {
  ReferenceObject,  // "reference_object"
  DepthAnalysis,    // "3d_analysis"
  MlEstimation,     // "ml_estimation"
};

[[nodiscard]] std::string_view to_string(EstimationMethod method) noexcept;

/// Scale taken from a detected reference object.
struct ReferenceObjectEvidence {
  ReferenceObject reference;
  double cm_per_pixel{0.0};
};

/// Measured depth used as the height axis.
struct DepthEvidence {
  DepthEstimate depth;
  double cm_per_pixel{0.0};
};

/// Uncalibrated bounding-box heuristic.
struct HeuristicEvidence {
  double volume_multiplier{0.0};
};

/// One arm per method; only the fields meaningful to that method exist.
using Evidence =
    std::variant<ReferenceObjectEvidence, DepthEvidence, HeuristicEvidence>;

/// Result of one estimate() call. Volume and weight are rounded to whole ml / g.
struct VolumeEstimationResult {
  std::int64_t estimated_volume{0};  // ml
  std::int64_t estimated_weight{0};  // g
  double confidence{0.0};
  double density{0.0};  // g/ml used for the weight
  BoundingBox bounding_box{};
  ShapeAnalysis shape_analysis{};
  Evidence evidence{HeuristicEvidence{}};

  [[nodiscard]] EstimationMethod method() const noexcept;

  /// Depth evidence, or nullptr when the result did not come from the depth path.
  [[nodiscard]] const DepthEstimate* depth_estimation() const noexcept;

  /// Reference object used, or nullptr when the result did not come from it.
  [[nodiscard]] const ReferenceObject* reference_object() const noexcept;
};

}  // namespace portiona::core
