#include <portiona/vision/onnx_detection_backend.hpp>
#include "onnx_session.hpp"
#include <portiona/core/logging.hpp>
#include <cstddef>
#include <stdexcept>
#include <vector>

namespace portiona::vision {

using portiona::core::EstimationError;

namespace {

constexpr std::int64_t kYoloFields = 6;
constexpr std::int64_t kBoxFields = 4;

/// Element i of a tensor whose element type is int64 or float.
std::int64_t class_id_at(const Ort::Value& value, std::size_t i) {
  const auto type = value.GetTensorTypeAndShapeInfo().GetElementType();
  if (type == ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64) {
    return value.GetTensorData<std::int64_t>()[i];
  }
  if (type == ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32) {
    return value.GetTensorData<std::int32_t>()[i];
  }
  return static_cast<std::int64_t>(value.GetTensorData<float>()[i]);
}

std::expected<RawDetections, EstimationError> decode_yolo(const Ort::Value& out) {
  const auto shape = out.GetTensorTypeAndShapeInfo().GetShape();
  if (shape.size() != 3u || shape[0] != 1) {
    return std::unexpected(EstimationError::InferenceFailed);
  }
  // [1, N, 6] is row-major per detection, [1, 6, N] is field-major.
  const bool rows_are_detections = shape[2] == kYoloFields;
  const std::int64_t n = rows_are_detections ? shape[1] : shape[2];
  if ((!rows_are_detections && shape[1] != kYoloFields) || n < 0) {
    return std::unexpected(EstimationError::InferenceFailed);
  }

  const float* data = out.GetTensorData<float>();
  auto field = [&](std::int64_t i, std::int64_t f) {
    return rows_are_detections ? data[i * kYoloFields + f] : data[f * n + i];
  };

  RawDetections result;
  result.num_detections = static_cast<std::uint32_t>(n);
  result.boxes.reserve(static_cast<std::size_t>(n) * kBoxFields);
  for (std::int64_t i = 0; i < n; ++i) {
    for (std::int64_t f = 0; f < kBoxFields; ++f) {
      result.boxes.push_back(field(i, f));
    }
    result.scores.push_back(field(i, 4));
    result.class_ids.push_back(static_cast<std::int64_t>(field(i, 5)));
  }
  return result;
}

std::expected<RawDetections, EstimationError> decode_three_outputs(
    const std::vector<Ort::Value>& outputs) {
  const Ort::Value& boxes = outputs[0];
  const Ort::Value& scores = outputs[1];
  const Ort::Value& classes = outputs[2];

  const auto shape = boxes.GetTensorTypeAndShapeInfo().GetShape();
  std::int64_t n = -1;
  if (shape.size() == 3u && shape[0] == 1 && shape[2] == kBoxFields) {
    n = shape[1];
  } else if (shape.size() == 2u && shape[1] == kBoxFields) {
    n = shape[0];
  }
  const auto count = static_cast<std::size_t>(n);
  if (n < 0 || scores.GetTensorTypeAndShapeInfo().GetElementCount() < count ||
      classes.GetTensorTypeAndShapeInfo().GetElementCount() < count) {
    return std::unexpected(EstimationError::InferenceFailed);
  }

  const float* box_data = boxes.GetTensorData<float>();
  const float* score_data = scores.GetTensorData<float>();

  RawDetections result;
  result.num_detections = static_cast<std::uint32_t>(n);
  result.boxes.assign(box_data, box_data + count * kBoxFields);
  result.scores.assign(score_data, score_data + count);
  result.class_ids.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    result.class_ids.push_back(class_id_at(classes, i));
  }
  return result;
}

}  // namespace

struct OnnxDetectionBackend::Impl {
  Impl(const std::string& model_path, std::uint32_t w, std::uint32_t h)
      : session(model_path, "portiona-detector", w, h) {}

  detail::OnnxSession session;
};

OnnxDetectionBackend::OnnxDetectionBackend(const std::string& model_path,
                                           std::uint32_t fallback_width,
                                           std::uint32_t fallback_height)
    : impl_(std::make_unique<Impl>(model_path, fallback_width, fallback_height)) {
  const std::size_t outputs = impl_->session.output_count();
  if (outputs != 1u && outputs < 3u) {
    throw std::runtime_error(
        "OnnxDetectionBackend: model must have 1 output (YOLO-style) or at least 3 "
        "outputs (boxes, scores, class_ids)");
  }
}

OnnxDetectionBackend::~OnnxDetectionBackend() = default;

std::expected<void, EstimationError> OnnxDetectionBackend::validate_input(
    const portiona::core::Frame& input) const {
  return impl_->session.validate_input(input);
}

std::expected<RawDetections, EstimationError> OnnxDetectionBackend::infer(
    const portiona::core::Frame& input) {
  auto outputs = impl_->session.run(input);
  if (!outputs) {
    return std::unexpected(outputs.error());
  }
  if (outputs->size() == 1u) {
    return decode_yolo(outputs->front());
  }
  return decode_three_outputs(*outputs);
}

void OnnxDetectionBackend::warmup() {
  auto result = infer(impl_->session.blank_input());
  if (!result) {
    portiona::core::logging::logger()->warn("detector warmup failed: {}",
                                            portiona::core::to_string(result.error()));
  }
}

std::optional<portiona::core::ImageSize> OnnxDetectionBackend::input_size() const {
  return portiona::core::ImageSize{impl_->session.input_width(), impl_->session.input_height()};
}

}  // namespace portiona::vision
