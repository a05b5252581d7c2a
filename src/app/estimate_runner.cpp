#include <portiona/app/estimate_runner.hpp>
#include <algorithm>
#include <mutex>
#include <queue>
#include <thread>

namespace portiona::app {

namespace pc = portiona::core;

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

ItemResult placeholder() {
  return std::unexpected(pc::EstimationError::None);
}

}  // namespace

std::vector<ItemResult> estimate_items_sequential(const VolumeEstimator& estimator,
                                                  const pc::Frame& frame,
                                                  const std::vector<EstimationItem>& items) {
  std::vector<ItemResult> results;
  results.reserve(items.size());
  for (const auto& item : items) {
    results.push_back(estimator.estimate(frame, item.food, item.box));
  }
  return results;
}

std::vector<ItemResult> estimate_items(const VolumeEstimator& estimator,
                                       const pc::Frame& frame,
                                       const std::vector<EstimationItem>& items,
                                       std::size_t num_workers) {
  const std::size_t n = items.size();
  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    return estimate_items_sequential(estimator, frame, items);
  }

  std::vector<ItemResult> results(n, placeholder());
  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }
  std::mutex queue_mutex;

  // Each worker writes only its own slots of results.
  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }
      results[idx] = estimator.estimate(frame, items[idx].food, items[idx].box);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
  return results;
}

}  // namespace portiona::app
