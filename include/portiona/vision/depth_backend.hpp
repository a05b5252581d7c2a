#pragma once

#include <portiona/core/error.hpp>
#include <portiona/core/frame.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <vector>

namespace portiona::vision {

/// Dense depth prediction, row-major, in model units.
struct DepthMap {
  std::uint32_t width{0};
  std::uint32_t height{0};
  std::vector<float> values;

  [[nodiscard]] bool empty() const noexcept { return values.empty(); }
};

/// Abstract monocular depth backend: preprocessed region -> DepthMap.
class IDepthBackend {
 public:
  virtual ~IDepthBackend() = default;

  [[nodiscard]] virtual std::expected<DepthMap, portiona::core::EstimationError>
  infer(const portiona::core::Frame& input) = 0;

  virtual void warmup() {}

  /// Fixed model input size, if any.
  [[nodiscard]] virtual std::optional<portiona::core::ImageSize> input_size() const {
    return std::nullopt;
  }
};

}  // namespace portiona::vision
