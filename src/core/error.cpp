#include <portiona/core/error.hpp>

namespace portiona::core {

std::string_view to_string(EstimationError error) noexcept {
  switch (error) {
    case EstimationError::None:
      return "none";
    case EstimationError::InvalidBoundingBox:
      return "invalid_bounding_box";
    case EstimationError::MissingFoodName:
      return "missing_food_name";
    case EstimationError::InvalidFrame:
      return "invalid_frame";
    case EstimationError::InvalidFeedback:
      return "invalid_feedback";
    case EstimationError::InferenceFailed:
      return "inference_failed";
    case EstimationError::ModelUnavailable:
      return "model_unavailable";
    case EstimationError::InvalidConfig:
      return "invalid_config";
  }
  return "unknown";
}

}  // namespace portiona::core
