#pragma once

#include <portiona/core/evidence.hpp>
#include <portiona/core/frame.hpp>
#include <portiona/core/geometry.hpp>
#include <portiona/core/lazy_model.hpp>
#include <portiona/vision/depth_backend.hpp>
#include <portiona/vision/model_input.hpp>
#include <mutex>

namespace portiona::vision {

/// Produces depth evidence for one bounding box.
class IDepthEstimator {
 public:
  virtual ~IDepthEstimator() = default;

  /// has_depth_data == false (zeroed fields) when no confident depth signal
  /// exists. Never throws for a well-formed frame and box.
  [[nodiscard]] virtual portiona::core::DepthEstimate estimate(
      const portiona::core::Frame& image,
      const portiona::core::BoundingBox& box) = 0;
};

struct DepthEstimatorOptions {
  ModelInputOptions input{{256, 256}, 0.f, 1.f / 255.f};
  double depth_scale{1.0};         // cm per model output unit
  double min_valid_fraction{0.5};  // of finite, positive samples
};

/// Mean and population variance of the finite, positive samples of map,
/// multiplied by depth_scale (variance by depth_scale^2). No depth data when
/// the valid share is below min_valid_fraction or the mean is not positive.
[[nodiscard]] portiona::core::DepthEstimate summarize_depth(const DepthMap& map,
                                                            double depth_scale,
                                                            double min_valid_fraction);

/// Crop -> model input -> depth backend -> summarize_depth.
///
/// The backend is created on first estimate() through a LazyModel; a backend
/// that fails to initialize makes every later estimate() return no depth data
/// until reinitialize() succeeds. Inference calls are serialized.
class DepthEstimator : public IDepthEstimator {
 public:
  using BackendFactory = portiona::core::LazyModel<IDepthBackend>::Factory;

  explicit DepthEstimator(BackendFactory factory, DepthEstimatorOptions options = {});

  [[nodiscard]] portiona::core::DepthEstimate estimate(
      const portiona::core::Frame& image,
      const portiona::core::BoundingBox& box) override;

  [[nodiscard]] portiona::core::ModelState model_state() const noexcept {
    return model_.state();
  }

  bool reinitialize();

 private:
  portiona::core::LazyModel<IDepthBackend> model_;
  DepthEstimatorOptions options_;
  std::mutex inference_mutex_;
};

}  // namespace portiona::vision
