#pragma once

#include <portiona/core/frame.hpp>
#include <optional>
#include <string>

namespace portiona::vision {

/// Load an image file into a Frame (BGR8 or Grayscale8). Returns nullopt on failure.
std::optional<portiona::core::Frame> load_frame_from_image(const std::string& path);

}  // namespace portiona::vision
