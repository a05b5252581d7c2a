#pragma once

#include <string_view>

namespace portiona::core {

/// Estimation error codes; used with std::expected for caller-visible failures.
/// Only invalid input crosses the estimation boundary; the backend codes stay
/// inside the detector / depth estimator and turn into "no evidence".
enum class EstimationError {
  None = 0,
  InvalidBoundingBox,
  MissingFoodName,
  InvalidFrame,
  InvalidFeedback,
  InferenceFailed,
  ModelUnavailable,
  InvalidConfig,
};

[[nodiscard]] std::string_view to_string(EstimationError error) noexcept;

}  // namespace portiona::core
