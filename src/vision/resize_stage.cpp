#include <portiona/vision/resize_stage.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgproc.hpp>

namespace portiona::vision {

using portiona::core::EstimationError;
using portiona::core::Frame;

ResizeStage::ResizeStage(std::uint32_t target_width,
                         std::uint32_t target_height)
    : target_width_(target_width), target_height_(target_height) {}

std::expected<Frame, EstimationError> ResizeStage::process(const Frame& input) {
  if (target_width_ == 0 || target_height_ == 0) {
    return std::unexpected(EstimationError::InvalidConfig);
  }
  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(EstimationError::InvalidFrame);
  }

  if (input.width() == target_width_ && input.height() == target_height_) {
    return input;
  }

  // Area interpolation when shrinking.
  const bool shrinking = input.width() > target_width_ || input.height() > target_height_;
  cv::Mat mat_out;
  cv::resize(*mat_in, mat_out,
             cv::Size(static_cast<int>(target_width_),
                      static_cast<int>(target_height_)),
             0, 0, shrinking ? cv::INTER_AREA : cv::INTER_LINEAR);

  return detail::mat_to_frame(mat_out, input.format());
}

}  // namespace portiona::vision
