#include "frame_cv_utils.hpp"
#include <portiona/core/frame.hpp>
#include <opencv2/core.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstring>
#include <vector>

namespace portiona::vision::detail {

namespace pc = portiona::core;

namespace {

int mat_type(pc::PixelFormat format) {
  switch (format) {
    case pc::PixelFormat::Grayscale8:
      return CV_8UC1;
    case pc::PixelFormat::RGB8:
    case pc::PixelFormat::BGR8:
      return CV_8UC3;
    case pc::PixelFormat::RGBA8:
    case pc::PixelFormat::BGRA8:
      return CV_8UC4;
    case pc::PixelFormat::Float32RGB:
      return CV_32FC3;
    case pc::PixelFormat::Unknown:
    default:
      return -1;
  }
}

}  // namespace

std::optional<cv::Mat> frame_to_mat(const pc::Frame& frame) {
  if (!frame.is_consistent()) return std::nullopt;
  const int type = mat_type(frame.format());
  if (type < 0) return std::nullopt;

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  // Rows are tightly packed; surplus bytes past the last row are ignored.
  const std::size_t step = pc::Frame::min_bytes(frame.width(), 1, frame.format());
  return cv::Mat(h, w, type, const_cast<std::byte*>(frame.data().data()), step);
}

pc::Frame mat_to_frame(const cv::Mat& mat, pc::PixelFormat format) {
  if (mat.empty()) return pc::Frame();

  const cv::Mat contiguous = mat.isContinuous() ? mat : mat.clone();
  const std::size_t len = contiguous.total() * contiguous.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), contiguous.ptr(), len);
  return pc::Frame(static_cast<std::uint32_t>(contiguous.cols),
                   static_cast<std::uint32_t>(contiguous.rows),
                   format, std::move(buffer));
}

std::optional<pc::Frame> crop_frame(const pc::Frame& frame, const pc::BoundingBox& box) {
  auto mat = frame_to_mat(frame);
  if (!mat || !box.is_valid()) return std::nullopt;

  const double x0 = std::clamp(std::floor(box.x), 0.0, static_cast<double>(mat->cols));
  const double y0 = std::clamp(std::floor(box.y), 0.0, static_cast<double>(mat->rows));
  const double x1 = std::clamp(std::ceil(box.x + box.width), 0.0, static_cast<double>(mat->cols));
  const double y1 = std::clamp(std::ceil(box.y + box.height), 0.0, static_cast<double>(mat->rows));
  if (x1 <= x0 || y1 <= y0) return std::nullopt;

  const cv::Rect roi(static_cast<int>(x0), static_cast<int>(y0),
                     static_cast<int>(x1 - x0), static_cast<int>(y1 - y0));
  return mat_to_frame((*mat)(roi), frame.format());
}

}  // namespace portiona::vision::detail
