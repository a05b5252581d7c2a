#pragma once

#include <portiona/core/error.hpp>
#include <portiona/core/frame.hpp>
#include <portiona/core/frame_stage.hpp>
#include <cstdint>
#include <expected>

namespace portiona::vision {

/// Resizes input frame to a fixed size (model input size).
class ResizeStage : public portiona::core::IFrameStage {
 public:
  ResizeStage(std::uint32_t target_width, std::uint32_t target_height);

  [[nodiscard]] std::expected<portiona::core::Frame, portiona::core::EstimationError>
  process(const portiona::core::Frame& input) override;

 private:
  std::uint32_t target_width_;
  std::uint32_t target_height_;
};

}  // namespace portiona::vision
