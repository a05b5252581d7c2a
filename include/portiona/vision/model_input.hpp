#pragma once

#include <portiona/core/frame.hpp>
#include <portiona/core/frame_pipeline.hpp>

namespace portiona::vision {

/// Model input preparation: size and (value - mean) * scale normalization.
struct ModelInputOptions {
  portiona::core::ImageSize size{640, 640};
  float mean{0.f};
  float scale{1.f / 255.f};
};

/// ColorConvert(RGB8) -> Resize(size) -> Normalize(mean, scale), producing
/// the Float32RGB frames the ONNX backends accept.
[[nodiscard]] portiona::core::FramePipeline make_model_input_pipeline(
    const ModelInputOptions& options);

}  // namespace portiona::vision
