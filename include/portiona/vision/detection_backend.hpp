#pragma once

#include <portiona/core/error.hpp>
#include <portiona/core/frame.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <vector>

namespace portiona::vision {

/// Raw detector output before decoding. Boxes are [x1, y1, x2, y2] per
/// detection in model-input pixels.
struct RawDetections {
  std::vector<float> boxes;
  std::vector<float> scores;
  std::vector<std::int64_t> class_ids;
  std::uint32_t num_detections{0};
};

/// Abstract object-detection backend: preprocessed Frame -> RawDetections.
class IDetectionBackend {
 public:
  virtual ~IDetectionBackend() = default;

  [[nodiscard]] virtual std::expected<RawDetections, portiona::core::EstimationError>
  infer(const portiona::core::Frame& input) = 0;

  /// Default: accept any non-empty frame.
  [[nodiscard]] virtual std::expected<void, portiona::core::EstimationError>
  validate_input(const portiona::core::Frame& input) const {
    if (input.empty()) {
      return std::unexpected(portiona::core::EstimationError::InvalidFrame);
    }
    return {};
  }

  /// Optional warmup run after construction. Default: no-op.
  virtual void warmup() {}

  /// Fixed model input size, if the backend has one; callers resize to it.
  [[nodiscard]] virtual std::optional<portiona::core::ImageSize> input_size() const {
    return std::nullopt;
  }
};

}  // namespace portiona::vision
