#pragma once

#include <portiona/vision/detection_backend.hpp>
#include <cstdint>
#include <vector>

namespace portiona::vision {

/// Synthetic detection for tests and the CLI demo.
struct MockDetection {
  std::int64_t class_id{0};
  float x{0.f};
  float y{0.f};
  float width{0.f};
  float height{0.f};
  float score{0.f};
};

/// Backend that returns configurable detections.
class MockDetectionBackend : public IDetectionBackend {
 public:
  void set_detections(std::vector<MockDetection> detections);

  /// Makes infer() fail with InferenceFailed.
  void set_failure(bool fail) noexcept { fail_ = fail; }

  [[nodiscard]] std::expected<RawDetections, portiona::core::EstimationError>
  infer(const portiona::core::Frame& input) override;

  [[nodiscard]] std::size_t infer_count() const noexcept { return infer_count_; }

 private:
  std::vector<MockDetection> detections_;
  bool fail_{false};
  std::size_t infer_count_{0};
};

}  // namespace portiona::vision
