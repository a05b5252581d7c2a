#pragma once

#include <portiona/vision/depth_backend.hpp>
#include <memory>
#include <string>

namespace portiona::vision {

/// ONNX Runtime monocular depth backend (MiDaS / Depth-Anything style).
///
/// Expected model: one float image input, first output [1, H, W] or
/// [1, 1, H, W]. Output values are passed through unchanged; the depth
/// estimator applies the configured scale.
///
/// Input contract: Float32RGB frame at input_size(). The constructor throws
/// Ort::Exception for a missing model and std::runtime_error for an
/// unsupported layout.
class OnnxDepthBackend : public IDepthBackend {
 public:
  explicit OnnxDepthBackend(const std::string& model_path,
                            std::uint32_t fallback_width = 256,
                            std::uint32_t fallback_height = 256);

  ~OnnxDepthBackend() override;

  OnnxDepthBackend(const OnnxDepthBackend&) = delete;
  OnnxDepthBackend& operator=(const OnnxDepthBackend&) = delete;

  [[nodiscard]] std::expected<DepthMap, portiona::core::EstimationError>
  infer(const portiona::core::Frame& input) override;

  void warmup() override;

  [[nodiscard]] std::optional<portiona::core::ImageSize> input_size() const override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace portiona::vision
