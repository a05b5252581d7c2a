#include <portiona/app/estimate_runner_tbb.hpp>

#ifdef PORTIONA_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>

namespace portiona::app {

std::vector<ItemResult> estimate_items_tbb(const VolumeEstimator& estimator,
                                           const portiona::core::Frame& frame,
                                           const std::vector<EstimationItem>& items) {
  std::vector<ItemResult> results(
      items.size(), std::unexpected(portiona::core::EstimationError::None));
  if (items.empty()) return results;

  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, items.size()),
      [&](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          results[i] = estimator.estimate(frame, items[i].food, items[i].box);
        }
      });
  return results;
}

}  // namespace portiona::app

#endif  // PORTIONA_HAS_TBB
