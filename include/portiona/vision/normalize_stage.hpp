#pragma once

#include <portiona/core/error.hpp>
#include <portiona/core/frame.hpp>
#include <portiona/core/frame_stage.hpp>
#include <expected>

namespace portiona::vision {

/// Converts a 3-channel 8-bit frame to Float32RGB: (value - mean) * scale.
class NormalizeStage : public portiona::core::IFrameStage {
 public:
  NormalizeStage(float mean, float scale);

  [[nodiscard]] std::expected<portiona::core::Frame, portiona::core::EstimationError>
  process(const portiona::core::Frame& input) override;

 private:
  float mean_;
  float scale_;
};

}  // namespace portiona::vision
