#include <portiona/vision/load_image.hpp>
#include "frame_cv_utils.hpp"
#include <portiona/core/logging.hpp>
#include <opencv2/imgcodecs.hpp>

namespace portiona::vision {

std::optional<portiona::core::Frame> load_frame_from_image(const std::string& path) {
  cv::Mat mat = cv::imread(path, cv::IMREAD_UNCHANGED);
  if (mat.empty()) {
    portiona::core::logging::logger()->warn("could not read image '{}'", path);
    return std::nullopt;
  }
  if (mat.depth() != CV_8U) {
    mat.convertTo(mat, CV_8U, 1.0 / 256.0);
  }

  portiona::core::PixelFormat format = portiona::core::PixelFormat::BGR8;
  if (mat.channels() == 1) format = portiona::core::PixelFormat::Grayscale8;
  if (mat.channels() == 4) format = portiona::core::PixelFormat::BGRA8;

  return detail::mat_to_frame(mat, format);
}

}  // namespace portiona::vision
