#include <portiona/vision/normalize_stage.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>

namespace portiona::vision {

using portiona::core::EstimationError;
using portiona::core::Frame;
using portiona::core::PixelFormat;

NormalizeStage::NormalizeStage(float mean, float scale)
    : mean_(mean), scale_(scale) {}

std::expected<Frame, EstimationError> NormalizeStage::process(const Frame& input) {
  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in || mat_in->channels() != 3 || mat_in->depth() != CV_8U) {
    return std::unexpected(EstimationError::InvalidFrame);
  }

  cv::Mat mat_float;
  mat_in->convertTo(mat_float, CV_32FC3, scale_, -mean_ * scale_);
  return detail::mat_to_frame(mat_float, PixelFormat::Float32RGB);
}

}  // namespace portiona::vision
