#include <portiona/vision/mock_depth_backend.hpp>

namespace portiona::vision {

void MockDepthBackend::set_depth_map(DepthMap map) {
  map_ = std::move(map);
}

void MockDepthBackend::set_uniform_depth(float value,
                                         std::uint32_t width,
                                         std::uint32_t height) {
  map_.width = width;
  map_.height = height;
  map_.values.assign(static_cast<std::size_t>(width) * height, value);
}

std::expected<DepthMap, portiona::core::EstimationError>
MockDepthBackend::infer(const portiona::core::Frame& input) {
  ++infer_count_;
  if (input.empty()) {
    return std::unexpected(portiona::core::EstimationError::InvalidFrame);
  }
  if (fail_) {
    return std::unexpected(portiona::core::EstimationError::InferenceFailed);
  }
  return map_;
}

}  // namespace portiona::vision
