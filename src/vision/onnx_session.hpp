#pragma once

#include <portiona/core/error.hpp>
#include <portiona/core/frame.hpp>
#include <onnxruntime_cxx_api.h>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace portiona::vision::detail {

/// ONNX Runtime session with one float image input, shared by the detection
/// and depth backends.
///
/// Input must be [1, 3, H, W] (NCHW) or [1, H, W, 3] (NHWC). Dynamic H/W take
/// the fallback size. Frames passed to run() are Float32RGB at that size; NCHW
/// models get a transposed copy.
///
/// Not thread-safe: run() reuses a scratch buffer.
class OnnxSession {
 public:
  /// Throws Ort::Exception when the model cannot be loaded and
  /// std::runtime_error when its input layout is unsupported.
  OnnxSession(const std::string& model_path,
              const char* log_id,
              std::uint32_t fallback_width,
              std::uint32_t fallback_height);

  OnnxSession(const OnnxSession&) = delete;
  OnnxSession& operator=(const OnnxSession&) = delete;

  [[nodiscard]] std::uint32_t input_width() const noexcept { return input_width_; }
  [[nodiscard]] std::uint32_t input_height() const noexcept { return input_height_; }
  [[nodiscard]] std::size_t output_count() const noexcept { return output_names_.size(); }

  [[nodiscard]] std::expected<void, portiona::core::EstimationError> validate_input(
      const portiona::core::Frame& input) const;

  /// Runs the model on all outputs.
  [[nodiscard]] std::expected<std::vector<Ort::Value>, portiona::core::EstimationError> run(
      const portiona::core::Frame& input);

  /// Zero-filled frame at the model input size.
  [[nodiscard]] portiona::core::Frame blank_input() const;

 private:
  Ort::Env env_;
  Ort::SessionOptions session_options_;
  Ort::Session session_{nullptr};

  std::string input_name_;
  std::vector<std::string> output_names_;
  std::vector<const char*> output_name_ptrs_;

  std::uint32_t input_width_{0};
  std::uint32_t input_height_{0};
  bool input_is_nchw_{true};

  std::vector<float> nchw_buffer_;
};

}  // namespace portiona::vision::detail
