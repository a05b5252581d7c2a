#pragma once

#include <portiona/vision/depth_backend.hpp>
#include <cstddef>

namespace portiona::vision {

/// Backend returning a configured depth map regardless of input.
class MockDepthBackend : public IDepthBackend {
 public:
  void set_depth_map(DepthMap map);

  /// width x height map filled with value.
  void set_uniform_depth(float value, std::uint32_t width = 8, std::uint32_t height = 8);

  /// Makes infer() fail with InferenceFailed.
  void set_failure(bool fail) noexcept { fail_ = fail; }

  [[nodiscard]] std::expected<DepthMap, portiona::core::EstimationError>
  infer(const portiona::core::Frame& input) override;

  [[nodiscard]] std::size_t infer_count() const noexcept { return infer_count_; }

 private:
  DepthMap map_;
  bool fail_{false};
  std::size_t infer_count_{0};
};

}  // namespace portiona::vision
