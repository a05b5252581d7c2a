#pragma once

#include <portiona/core/error.hpp>
#include <portiona/core/estimation_result.hpp>
#include <portiona/core/evidence.hpp>
#include <portiona/core/food.hpp>
#include <portiona/core/food_density.hpp>
#include <portiona/core/frame.hpp>
#include <portiona/core/geometry.hpp>
#include <portiona/vision/depth_estimator.hpp>
#include <portiona/vision/reference_object_detector.hpp>
#include <portiona/vision/shape_analyzer.hpp>
#include <expected>
#include <memory>
#include <string_view>

namespace portiona::app {

/// Reference-object confidence = detector confidence x this factor.
inline constexpr double kReferenceConfidenceFactor = 0.9;
inline constexpr double kDepthConfidence = 0.85;
inline constexpr double kHeuristicConfidence = 0.6;

/// Pixel -> cm for the depth path (no scale reference in the frame).
inline constexpr double kDepthPathCmPerPixel = 0.1;
/// Reference path height = this x the shorter real-world side.
inline constexpr double kReferenceHeightRatio = 0.8;
/// Heuristic path: volume = sqrt(box area) x multiplier x this.
inline constexpr double kHeuristicAreaToVolume = 10.0;

/// spherical 0.5, cylindrical 0.6, rectangular 0.8, irregular 0.4.
[[nodiscard]] double heuristic_volume_multiplier(portiona::core::FoodShape shape) noexcept;

/// Reference path: cm/px is the mean of the horizontal and vertical ratios of
/// the reference object; the box is rescaled and its height taken as 0.8 x
/// the shorter side. Precondition: reference.has_usable_scale().
[[nodiscard]] portiona::core::VolumeEstimationResult estimate_from_reference(
    const portiona::core::BoundingBox& box,
    const portiona::core::ShapeAnalysis& shape,
    const portiona::core::ReferenceObject& reference,
    double density);

/// Depth path: box sides at kDepthPathCmPerPixel, measured depth as the height
/// axis (bounds a sphere's diameter, is a cylinder's axis).
/// Precondition: depth.has_depth_data.
[[nodiscard]] portiona::core::VolumeEstimationResult estimate_from_depth(
    const portiona::core::BoundingBox& box,
    const portiona::core::ShapeAnalysis& shape,
    const portiona::core::DepthEstimate& depth,
    double density);

/// Heuristic path: sqrt(box area) x shape multiplier x kHeuristicAreaToVolume.
[[nodiscard]] portiona::core::VolumeEstimationResult estimate_from_heuristic(
    const portiona::core::BoundingBox& box,
    const portiona::core::ShapeAnalysis& shape,
    double density);

struct EstimatorOptions {
  /// Reference objects at or below this confidence are ignored.
  double min_reference_confidence{0.0};
};

/// Chooses the best available evidence for one food region and turns it into
/// volume and weight.
///
/// Priority: reference object > depth > heuristic. Reference detection runs on
/// a separate task while depth is estimated on the calling thread. Missing or
/// unavailable evidence only moves the decision down the list; the only errors
/// returned are InvalidBoundingBox and MissingFoodName.
///
/// Thread-safe: estimate() may be called concurrently; the detectors serialize
/// their own inference and the density repository handles its own locking.
class VolumeEstimator {
 public:
  /// detector / depth may be null, which removes that evidence source.
  VolumeEstimator(std::shared_ptr<portiona::core::IFoodDensityRepository> densities,
                  std::unique_ptr<portiona::vision::IReferenceObjectDetector> detector,
                  std::unique_ptr<portiona::vision::IDepthEstimator> depth,
                  EstimatorOptions options = {});

  [[nodiscard]] std::expected<portiona::core::VolumeEstimationResult,
                              portiona::core::EstimationError>
  estimate(const portiona::core::Frame& image,
           std::string_view food_name,
           portiona::core::FoodCategory category,
           const portiona::core::BoundingBox& box) const;

  [[nodiscard]] std::expected<portiona::core::VolumeEstimationResult,
                              portiona::core::EstimationError>
  estimate(const portiona::core::Frame& image,
           const portiona::core::FoodIdentity& food,
           const portiona::core::BoundingBox& box) const {
    return estimate(image, food.name, food.category, box);
  }

  [[nodiscard]] const std::shared_ptr<portiona::core::IFoodDensityRepository>& densities()
      const noexcept {
    return densities_;
  }

 private:
  std::shared_ptr<portiona::core::IFoodDensityRepository> densities_;
  std::unique_ptr<portiona::vision::IReferenceObjectDetector> detector_;
  std::unique_ptr<portiona::vision::IDepthEstimator> depth_;
  portiona::vision::ShapeAnalyzer shape_analyzer_;
  EstimatorOptions options_;
};

}  // namespace portiona::app
