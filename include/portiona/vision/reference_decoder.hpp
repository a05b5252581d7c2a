#pragma once

#include <portiona/vision/detection_backend.hpp>
#include <string>
#include <vector>

namespace portiona::vision {

/// Maps model class id to reference catalog label (index = class id).
using ClassToLabelMap = std::vector<std::string>;

/// Decoded detection in model-input pixels.
struct LabeledDetection {
  std::string label;
  float x{0.f};
  float y{0.f};
  float width{0.f};
  float height{0.f};
  float score{0.f};
};

/// Decodes RawDetections with a confidence threshold; class ids outside the
/// label map and degenerate boxes are dropped.
class ReferenceDecoder {
 public:
  ReferenceDecoder(float confidence_threshold, ClassToLabelMap class_to_label);

  [[nodiscard]] std::vector<LabeledDetection> decode(const RawDetections& result) const;

  void set_confidence_threshold(float t) noexcept { confidence_threshold_ = t; }
  [[nodiscard]] float confidence_threshold() const noexcept {
    return confidence_threshold_;
  }

 private:
  float confidence_threshold_;
  ClassToLabelMap class_to_label_;
};

}  // namespace portiona::vision
