#include "onnx_session.hpp"
#include <portiona/core/logging.hpp>
#include <array>
#include <cstddef>
#include <stdexcept>

namespace portiona::vision::detail {

namespace {

constexpr std::int64_t kNumChannels = 3;

void hwc_to_nchw(const float* hwc, std::uint32_t h, std::uint32_t w, float* nchw) {
  const std::size_t plane = static_cast<std::size_t>(h) * w;
  for (std::size_t i = 0; i < plane; ++i) {
    nchw[0 * plane + i] = hwc[i * kNumChannels + 0];
    nchw[1 * plane + i] = hwc[i * kNumChannels + 1];
    nchw[2 * plane + i] = hwc[i * kNumChannels + 2];
  }
}

std::uint32_t dim_or(std::int64_t dim, std::uint32_t fallback) {
  return dim > 0 ? static_cast<std::uint32_t>(dim) : fallback;
}

}  // namespace

OnnxSession::OnnxSession(const std::string& model_path,
                         const char* log_id,
                         std::uint32_t fallback_width,
                         std::uint32_t fallback_height)
    : env_(ORT_LOGGING_LEVEL_WARNING, log_id) {
  session_options_.SetIntraOpNumThreads(1);
  session_options_.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  session_ = Ort::Session(env_, model_path.c_str(), session_options_);

  Ort::AllocatorWithDefaultOptions allocator;
  if (session_.GetInputCount() == 0) {
    throw std::runtime_error("OnnxSession: model has no inputs: " + model_path);
  }
  input_name_ = session_.GetInputNameAllocated(0, allocator).get();

  const auto dims = session_.GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
  if (dims.size() != 4u) {
    throw std::runtime_error("OnnxSession: expected 4D image input: " + model_path);
  }
  if (dims[1] == kNumChannels) {
    input_is_nchw_ = true;
    input_height_ = dim_or(dims[2], fallback_height);
    input_width_ = dim_or(dims[3], fallback_width);
  } else if (dims[3] == kNumChannels) {
    input_is_nchw_ = false;
    input_height_ = dim_or(dims[1], fallback_height);
    input_width_ = dim_or(dims[2], fallback_width);
  } else {
    throw std::runtime_error("OnnxSession: expected input shape [1,3,H,W] or [1,H,W,3]: " +
                             model_path);
  }
  if (input_width_ == 0 || input_height_ == 0) {
    throw std::runtime_error("OnnxSession: model input size unknown: " + model_path);
  }

  const std::size_t num_outputs = session_.GetOutputCount();
  if (num_outputs == 0) {
    throw std::runtime_error("OnnxSession: model has no outputs: " + model_path);
  }
  for (std::size_t i = 0; i < num_outputs; ++i) {
    output_names_.emplace_back(session_.GetOutputNameAllocated(i, allocator).get());
  }
  for (const auto& name : output_names_) {
    output_name_ptrs_.push_back(name.c_str());
  }

  portiona::core::logging::logger()->info(
      "loaded ONNX model '{}' ({}x{}, {}, {} output(s))", model_path, input_width_,
      input_height_, input_is_nchw_ ? "NCHW" : "NHWC", num_outputs);
}

std::expected<void, portiona::core::EstimationError> OnnxSession::validate_input(
    const portiona::core::Frame& input) const {
  if (input.format() != portiona::core::PixelFormat::Float32RGB ||
      input.width() != input_width_ || input.height() != input_height_ ||
      !input.is_consistent()) {
    return std::unexpected(portiona::core::EstimationError::InvalidFrame);
  }
  return {};
}

std::expected<std::vector<Ort::Value>, portiona::core::EstimationError> OnnxSession::run(
    const portiona::core::Frame& input) {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  const std::uint32_t h = input.height();
  const std::uint32_t w = input.width();
  const float* src = reinterpret_cast<const float*>(input.data().data());
  const std::size_t num_floats = static_cast<std::size_t>(kNumChannels) * h * w;

  Ort::MemoryInfo mem_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
  Ort::Value input_tensor{nullptr};
  if (input_is_nchw_) {
    nchw_buffer_.resize(num_floats);
    hwc_to_nchw(src, h, w, nchw_buffer_.data());
    const std::array<std::int64_t, 4> shape{1, kNumChannels, static_cast<std::int64_t>(h),
                                            static_cast<std::int64_t>(w)};
    input_tensor = Ort::Value::CreateTensor<float>(mem_info, nchw_buffer_.data(), num_floats,
                                                   shape.data(), shape.size());
  } else {
    const std::array<std::int64_t, 4> shape{1, static_cast<std::int64_t>(h),
                                            static_cast<std::int64_t>(w), kNumChannels};
    input_tensor = Ort::Value::CreateTensor<float>(mem_info, const_cast<float*>(src), num_floats,
                                                   shape.data(), shape.size());
  }

  const char* input_names[] = {input_name_.c_str()};
  try {
    return session_.Run(Ort::RunOptions{nullptr}, input_names, &input_tensor, 1,
                        output_name_ptrs_.data(), output_name_ptrs_.size());
  } catch (const Ort::Exception& e) {
    portiona::core::logging::logger()->warn("ONNX inference failed: {}", e.what());
    return std::unexpected(portiona::core::EstimationError::InferenceFailed);
  }
}

portiona::core::Frame OnnxSession::blank_input() const {
  const std::size_t num_bytes = portiona::core::Frame::min_bytes(
      input_width_, input_height_, portiona::core::PixelFormat::Float32RGB);
  return portiona::core::Frame(input_width_, input_height_,
                               portiona::core::PixelFormat::Float32RGB,
                               std::vector<std::byte>(num_bytes, std::byte{0}));
}

}  // namespace portiona::vision::detail
