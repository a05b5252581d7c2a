#pragma once

#include <portiona/app/config.hpp>
#include <portiona/app/volume_estimator.hpp>
#include <portiona/core/error.hpp>
#include <portiona/core/food_density.hpp>
#include <portiona/vision/depth_estimator.hpp>
#include <portiona/vision/reference_object_detector.hpp>
#include <expected>
#include <memory>

namespace portiona::app {

/// Demo mock detection: a credit card at (40, 40) 80 x 50 model-input pixels,
/// score 0.8.
inline constexpr float kMockReferenceScore = 0.8f;
/// Demo mock depth, model units.
inline constexpr float kMockDepthValue = 6.f;

/// Detector for config.detector_backend; nullptr for None.
/// Throws std::invalid_argument for onnx without detector_model_path.
[[nodiscard]] std::unique_ptr<portiona::vision::IReferenceObjectDetector> make_reference_detector(
    const EstimatorConfig& config);

/// Depth estimator for config.depth_backend; nullptr for None.
/// Throws std::invalid_argument for onnx without depth_model_path.
[[nodiscard]] std::unique_ptr<portiona::vision::IDepthEstimator> make_depth_estimator(
    const EstimatorConfig& config);

/// Seed table, overlaid with config.density_table_path when set. An
/// unreadable table is logged and the seed table kept.
[[nodiscard]] std::shared_ptr<portiona::core::IFoodDensityRepository> make_density_repository(
    const EstimatorConfig& config);

/// Writes the repository back to config.density_table_path so calibrated
/// densities survive the process. No-op when no path is configured.
[[nodiscard]] std::expected<void, portiona::core::EstimationError> save_density_repository(
    const EstimatorConfig& config, const portiona::core::IFoodDensityRepository& densities);

/// Wires an estimator from config. Models are not loaded here: each backend
/// is constructed on first use. A null repository uses make_density_repository().
[[nodiscard]] std::unique_ptr<VolumeEstimator> build_estimator(
    const EstimatorConfig& config,
    std::shared_ptr<portiona::core::IFoodDensityRepository> densities = nullptr);

}  // namespace portiona::app
