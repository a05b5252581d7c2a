#include <portiona/vision/reference_decoder.hpp>
#include <cstddef>

namespace portiona::vision {

ReferenceDecoder::ReferenceDecoder(float confidence_threshold,
                                   ClassToLabelMap class_to_label)
    : confidence_threshold_(confidence_threshold),
      class_to_label_(std::move(class_to_label)) {}

std::vector<LabeledDetection> ReferenceDecoder::decode(const RawDetections& result) const {
  std::vector<LabeledDetection> out;
  const std::size_t n = static_cast<std::size_t>(result.num_detections);

  for (std::size_t i = 0; i < n; ++i) {
    if (i >= result.scores.size() || i >= result.class_ids.size() ||
        i * 4 + 3 >= result.boxes.size()) {
      break;
    }
    const float score = result.scores[i];
    if (score < confidence_threshold_) {
      continue;
    }
    const auto cid = result.class_ids[i];
    if (cid < 0 || static_cast<std::size_t>(cid) >= class_to_label_.size()) {
      continue;
    }

    LabeledDetection d;
    d.label = class_to_label_[static_cast<std::size_t>(cid)];
    d.score = score;
    d.x = result.boxes[i * 4 + 0];
    d.y = result.boxes[i * 4 + 1];
    d.width = result.boxes[i * 4 + 2] - d.x;
    d.height = result.boxes[i * 4 + 3] - d.y;
    if (d.width <= 0.f || d.height <= 0.f) {
      continue;
    }
    out.push_back(std::move(d));
  }
  return out;
}

}  // namespace portiona::vision
