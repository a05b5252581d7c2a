#pragma once

#include <portiona/core/error.hpp>
#include <portiona/core/frame.hpp>
#include <portiona/vision/detection_backend.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace portiona::vision {

/// ONNX Runtime reference-object detector.
///
/// Expected model: one float image input and either
/// - one output [1, N, 6] or [1, 6, N] with (x1, y1, x2, y2, score, class_id)
///   per detection (YOLOv10 style), or
/// - three outputs boxes [1, N, 4] / [N, 4], scores [1, N], class_ids [1, N]
///   (int64 or float).
///
/// Input contract: Float32RGB frame at input_width() x input_height().
/// The constructor throws Ort::Exception for a missing or unreadable model
/// and std::runtime_error for an unsupported layout.
class OnnxDetectionBackend : public IDetectionBackend {
 public:
  /// \param fallback_width / fallback_height input size used when the model
  ///        declares dynamic spatial dimensions.
  explicit OnnxDetectionBackend(const std::string& model_path,
                                std::uint32_t fallback_width = 640,
                                std::uint32_t fallback_height = 640);

  ~OnnxDetectionBackend() override;

  OnnxDetectionBackend(const OnnxDetectionBackend&) = delete;
  OnnxDetectionBackend& operator=(const OnnxDetectionBackend&) = delete;

  [[nodiscard]] std::expected<RawDetections, portiona::core::EstimationError>
  infer(const portiona::core::Frame& input) override;

  [[nodiscard]] std::expected<void, portiona::core::EstimationError>
  validate_input(const portiona::core::Frame& input) const override;

  void warmup() override;

  [[nodiscard]] std::optional<portiona::core::ImageSize> input_size() const override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace portiona::vision
