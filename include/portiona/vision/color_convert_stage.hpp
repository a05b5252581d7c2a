#pragma once

#include <portiona/core/error.hpp>
#include <portiona/core/frame.hpp>
#include <portiona/core/frame_stage.hpp>
#include <expected>

namespace portiona::vision {

/// Converts 8-bit frames between pixel formats (e.g. BGR camera frames to the
/// RGB order the models expect). Unsupported pairs fail with InvalidFrame.
class ColorConvertStage : public portiona::core::IFrameStage {
 public:
  explicit ColorConvertStage(portiona::core::PixelFormat output_format);

  [[nodiscard]] std::expected<portiona::core::Frame, portiona::core::EstimationError>
  process(const portiona::core::Frame& input) override;

 private:
  portiona::core::PixelFormat output_format_;
};

}  // namespace portiona::vision
