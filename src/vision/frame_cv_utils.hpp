#pragma once

#include <portiona/core/frame.hpp>
#include <portiona/core/geometry.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace portiona::vision::detail {

/// Non-owning cv::Mat view over an 8-bit or Float32RGB frame.
/// Returns nullopt for empty, inconsistent or Unknown frames.
std::optional<cv::Mat> frame_to_mat(const portiona::core::Frame& frame);

/// Copies a cv::Mat into a new Frame.
portiona::core::Frame mat_to_frame(const cv::Mat& mat,
                                   portiona::core::PixelFormat format);

/// Copies the part of the frame covered by box (clamped to the frame).
/// Returns nullopt when the clamped region is empty.
std::optional<portiona::core::Frame> crop_frame(const portiona::core::Frame& frame,
                                                const portiona::core::BoundingBox& box);

}  // namespace portiona::vision::detail
