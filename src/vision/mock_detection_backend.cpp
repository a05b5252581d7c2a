#include <portiona/vision/mock_detection_backend.hpp>

namespace portiona::vision {

void MockDetectionBackend::set_detections(std::vector<MockDetection> detections) {
  detections_ = std::move(detections);
}

std::expected<RawDetections, portiona::core::EstimationError>
MockDetectionBackend::infer(const portiona::core::Frame& input) {
  ++infer_count_;
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  if (fail_) {
    return std::unexpected(portiona::core::EstimationError::InferenceFailed);
  }

  RawDetections r;
  r.num_detections = static_cast<std::uint32_t>(detections_.size());
  for (const auto& d : detections_) {
    r.boxes.push_back(d.x);
    r.boxes.push_back(d.y);
    r.boxes.push_back(d.x + d.width);
    r.boxes.push_back(d.y + d.height);
    r.scores.push_back(d.score);
    r.class_ids.push_back(d.class_id);
  }
  return r;
}

}  // namespace portiona::vision
