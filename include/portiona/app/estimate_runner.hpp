#pragma once

#include <portiona/app/volume_estimator.hpp>
#include <portiona/core/error.hpp>
#include <portiona/core/estimation_result.hpp>
#include <portiona/core/food.hpp>
#include <portiona/core/frame.hpp>
#include <portiona/core/geometry.hpp>
#include <cstddef>
#include <expected>
#include <vector>

namespace portiona::app {

/// One classified food region of a photo.
struct EstimationItem {
  portiona::core::FoodIdentity food;
  portiona::core::BoundingBox box;
};

using ItemResult =
    std::expected<portiona::core::VolumeEstimationResult, portiona::core::EstimationError>;

/// Estimates every item of one frame sequentially. Results are in item order.
[[nodiscard]] std::vector<ItemResult> estimate_items_sequential(
    const VolumeEstimator& estimator,
    const portiona::core::Frame& frame,
    const std::vector<EstimationItem>& items);

/// Estimates every item of one frame on a pool of worker threads.
/// Results are in item order whatever the completion order.
/// num_workers 0 = hardware concurrency; 1 runs on the calling thread.
[[nodiscard]] std::vector<ItemResult> estimate_items(
    const VolumeEstimator& estimator,
    const portiona::core::Frame& frame,
    const std::vector<EstimationItem>& items,
    std::size_t num_workers = 0);

}  // namespace portiona::app
