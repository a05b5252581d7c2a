#include <portiona/vision/color_convert_stage.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgproc.hpp>
#include <optional>

namespace portiona::vision {

using portiona::core::EstimationError;
using portiona::core::Frame;
using portiona::core::PixelFormat;

namespace {

std::optional<int> conversion_code(PixelFormat from, PixelFormat to) {
  if (from == PixelFormat::BGR8 && to == PixelFormat::RGB8) return cv::COLOR_BGR2RGB;
  if (from == PixelFormat::RGB8 && to == PixelFormat::BGR8) return cv::COLOR_RGB2BGR;
  if (from == PixelFormat::BGRA8 && to == PixelFormat::RGB8) return cv::COLOR_BGRA2RGB;
  if (from == PixelFormat::RGBA8 && to == PixelFormat::RGB8) return cv::COLOR_RGBA2RGB;
  if (from == PixelFormat::BGRA8 && to == PixelFormat::RGBA8) return cv::COLOR_BGRA2RGBA;
  if (from == PixelFormat::RGBA8 && to == PixelFormat::BGRA8) return cv::COLOR_RGBA2BGRA;
  if (from == PixelFormat::Grayscale8 && to == PixelFormat::RGB8) return cv::COLOR_GRAY2RGB;
  if (from == PixelFormat::Grayscale8 && to == PixelFormat::BGR8) return cv::COLOR_GRAY2BGR;
  if (from == PixelFormat::RGB8 && to == PixelFormat::Grayscale8) return cv::COLOR_RGB2GRAY;
  if (from == PixelFormat::BGR8 && to == PixelFormat::Grayscale8) return cv::COLOR_BGR2GRAY;
  return std::nullopt;
}

}  // namespace

ColorConvertStage::ColorConvertStage(PixelFormat output_format)
    : output_format_(output_format) {}

std::expected<Frame, EstimationError> ColorConvertStage::process(const Frame& input) {
  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(EstimationError::InvalidFrame);
  }
  if (input.format() == output_format_) {
    return input;
  }

  const auto code = conversion_code(input.format(), output_format_);
  if (!code) {
    return std::unexpected(EstimationError::InvalidFrame);
  }
  cv::Mat mat_out;
  cv::cvtColor(*mat_in, mat_out, *code);
  return detail::mat_to_frame(mat_out, output_format_);
}

}  // namespace portiona::vision
