#include <portiona/vision/depth_estimator.hpp>
#include "frame_cv_utils.hpp"
#include <portiona/core/logging.hpp>
#include <cmath>
#include <cstddef>

namespace portiona::vision {

namespace pc = portiona::core;

pc::DepthEstimate summarize_depth(const DepthMap& map,
                                  double depth_scale,
                                  double min_valid_fraction) {
  if (map.empty() || !(depth_scale > 0.0)) {
    return pc::DepthEstimate::none();
  }

  // Welford's running mean / variance over the valid samples.
  std::size_t count = 0;
  double mean = 0.0;
  double m2 = 0.0;
  for (const float raw : map.values) {
    const double v = static_cast<double>(raw);
    if (!std::isfinite(v) || v <= 0.0) continue;
    ++count;
    const double delta = v - mean;
    mean += delta / static_cast<double>(count);
    m2 += delta * (v - mean);
  }

  const double valid_fraction =
      static_cast<double>(count) / static_cast<double>(map.values.size());
  if (count == 0 || valid_fraction < min_valid_fraction || mean <= 0.0) {
    return pc::DepthEstimate::none();
  }

  pc::DepthEstimate out;
  out.has_depth_data = true;
  out.average_depth = mean * depth_scale;
  out.depth_variance = (m2 / static_cast<double>(count)) * depth_scale * depth_scale;
  return out;
}

DepthEstimator::DepthEstimator(BackendFactory factory, DepthEstimatorOptions options)
    : model_("depth-estimator", std::move(factory)), options_(options) {}

bool DepthEstimator::reinitialize() {
  std::lock_guard lock(inference_mutex_);
  return model_.reinitialize();
}

pc::DepthEstimate DepthEstimator::estimate(const pc::Frame& image, const pc::BoundingBox& box) {
  if (!image.is_consistent() || !box.is_valid()) {
    return pc::DepthEstimate::none();
  }

  std::lock_guard lock(inference_mutex_);
  IDepthBackend* backend = model_.get();
  if (!backend) {
    return pc::DepthEstimate::none();
  }

  auto region = detail::crop_frame(image, box);
  if (!region) {
    pc::logging::logger()->debug("depth: bounding box lies outside the frame");
    return pc::DepthEstimate::none();
  }

  ModelInputOptions input = options_.input;
  if (auto size = backend->input_size()) {
    input.size = *size;
  }
  auto pipeline = make_model_input_pipeline(input);
  auto prepared = pipeline.run(*region);
  if (!prepared) {
    pc::logging::logger()->warn("depth: preprocessing failed: {}",
                                pc::to_string(prepared.error()));
    return pc::DepthEstimate::none();
  }

  auto map = backend->infer(*prepared);
  if (!map) {
    pc::logging::logger()->warn("depth: inference failed: {}", pc::to_string(map.error()));
    return pc::DepthEstimate::none();
  }

  const auto result = summarize_depth(*map, options_.depth_scale, options_.min_valid_fraction);
  pc::logging::logger()->debug("depth: has_data={} mean={:.3f} variance={:.3f}",
                               result.has_depth_data, result.average_depth,
                               result.depth_variance);
  return result;
}

}  // namespace portiona::vision
