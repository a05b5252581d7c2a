#pragma once

#include <portiona/core/error.hpp>
#include <portiona/core/frame.hpp>
#include <portiona/core/frame_stage.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <vector>

namespace portiona::core {

/// Callback for per-stage timing: (stage_index, duration_ms).
using StageTimingCallback = std::function<void(std::size_t stage_index, double duration_ms)>;

/// Runs frame stages in order, feeding each output into the next stage.
/// Used to turn a camera frame into model input.
class FramePipeline {
 public:
  FramePipeline() = default;

  FramePipeline(FramePipeline&&) noexcept = default;
  FramePipeline& operator=(FramePipeline&&) noexcept = default;

  void add_stage(std::unique_ptr<IFrameStage> stage);

  /// Runs every stage; an empty pipeline returns a copy of the input.
  /// Stops at the first stage error.
  [[nodiscard]] std::expected<Frame, EstimationError> run(
      const Frame& input,
      StageTimingCallback* timing_cb = nullptr);

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }

 private:
  std::vector<std::unique_ptr<IFrameStage>> stages_;
};

}  // namespace portiona::core
