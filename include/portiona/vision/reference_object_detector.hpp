#pragma once

#include <portiona/core/evidence.hpp>
#include <portiona/core/frame.hpp>
#include <portiona/core/lazy_model.hpp>
#include <portiona/vision/detection_backend.hpp>
#include <portiona/vision/model_input.hpp>
#include <portiona/vision/reference_decoder.hpp>
#include <mutex>
#include <vector>

namespace portiona::vision {

/// Finds calibration objects of known size in a frame.
class IReferenceObjectDetector {
 public:
  virtual ~IReferenceObjectDetector() = default;

  /// Detected objects, highest confidence first; empty when none are found or
  /// the detector is unavailable. Never throws for a well-formed frame.
  [[nodiscard]] virtual std::vector<portiona::core::ReferenceObject> detect(
      const portiona::core::Frame& image) = 0;
};

/// Detection backend + decoder + reference catalog.
///
/// The backend is created on first detect() through a LazyModel; inference
/// calls are serialized. Pixel sizes are reported in the original frame's
/// pixels, and the catalog size is turned to match the detected box
/// orientation (a card lying portrait reports width < height).
class ReferenceObjectDetector : public IReferenceObjectDetector {
 public:
  using BackendFactory = portiona::core::LazyModel<IDetectionBackend>::Factory;

  ReferenceObjectDetector(BackendFactory factory,
                          ReferenceDecoder decoder,
                          ModelInputOptions input_options = {});

  [[nodiscard]] std::vector<portiona::core::ReferenceObject> detect(
      const portiona::core::Frame& image) override;

  [[nodiscard]] portiona::core::ModelState model_state() const noexcept {
    return model_.state();
  }

  /// Retries backend construction after a failure.
  bool reinitialize();

 private:
  portiona::core::LazyModel<IDetectionBackend> model_;
  ReferenceDecoder decoder_;
  ModelInputOptions input_options_;
  std::mutex inference_mutex_;
};

}  // namespace portiona::vision
