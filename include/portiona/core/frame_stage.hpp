#pragma once

#include <portiona/core/error.hpp>
#include <portiona/core/frame.hpp>
#include <expected>

namespace portiona::core {

/// One preprocessing step: Frame in, transformed Frame out.
class IFrameStage {
 public:
  virtual ~IFrameStage() = default;

  [[nodiscard]] virtual std::expected<Frame, EstimationError> process(
      const Frame& input) = 0;
};

}  // namespace portiona::core
