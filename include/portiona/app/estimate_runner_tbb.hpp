#pragma once

#include <portiona/app/estimate_runner.hpp>
#include <vector>

#ifdef PORTIONA_HAS_TBB

namespace portiona::app {

/// estimate_items() on tbb::parallel_for. Results are in item order.
[[nodiscard]] std::vector<ItemResult> estimate_items_tbb(
    const VolumeEstimator& estimator,
    const portiona::core::Frame& frame,
    const std::vector<EstimationItem>& items);

}  // namespace portiona::app

#endif  // PORTIONA_HAS_TBB
