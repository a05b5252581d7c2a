#include <portiona/vision/onnx_depth_backend.hpp>
#include "onnx_session.hpp"
#include <portiona/core/logging.hpp>

namespace portiona::vision {

using portiona::core::EstimationError;

struct OnnxDepthBackend::Impl {
  Impl(const std::string& model_path, std::uint32_t w, std::uint32_t h)
      : session(model_path, "portiona-depth", w, h) {}

  detail::OnnxSession session;
};

OnnxDepthBackend::OnnxDepthBackend(const std::string& model_path,
                                   std::uint32_t fallback_width,
                                   std::uint32_t fallback_height)
    : impl_(std::make_unique<Impl>(model_path, fallback_width, fallback_height)) {}

OnnxDepthBackend::~OnnxDepthBackend() = default;

std::expected<DepthMap, EstimationError> OnnxDepthBackend::infer(
    const portiona::core::Frame& input) {
  auto outputs = impl_->session.run(input);
  if (!outputs) {
    return std::unexpected(outputs.error());
  }

  const Ort::Value& out = outputs->front();
  const auto shape = out.GetTensorTypeAndShapeInfo().GetShape();
  // [1, H, W] or [1, 1, H, W]
  const bool rank3 = shape.size() == 3u && shape[0] == 1;
  const bool rank4 = shape.size() == 4u && shape[0] == 1 && shape[1] == 1;
  if (!rank3 && !rank4) {
    return std::unexpected(EstimationError::InferenceFailed);
  }
  const std::int64_t h = shape[shape.size() - 2];
  const std::int64_t w = shape[shape.size() - 1];
  if (h <= 0 || w <= 0) {
    return std::unexpected(EstimationError::InferenceFailed);
  }

  DepthMap map;
  map.width = static_cast<std::uint32_t>(w);
  map.height = static_cast<std::uint32_t>(h);
  const float* data = out.GetTensorData<float>();
  map.values.assign(data, data + static_cast<std::size_t>(h) * static_cast<std::size_t>(w));
  return map;
}

void OnnxDepthBackend::warmup() {
  auto result = infer(impl_->session.blank_input());
  if (!result) {
    portiona::core::logging::logger()->warn("depth warmup failed: {}",
                                            portiona::core::to_string(result.error()));
  }
}

std::optional<portiona::core::ImageSize> OnnxDepthBackend::input_size() const {
  return portiona::core::ImageSize{impl_->session.input_width(), impl_->session.input_height()};
}

}  // namespace portiona::vision
