#include <portiona/app/calibration.hpp>
#include <portiona/core/food.hpp>
#include <portiona/core/logging.hpp>
#include <cmath>
#include <stdexcept>

namespace portiona::app {

namespace pc = portiona::core;

namespace {

bool positive_finite(double v) noexcept {
  return std::isfinite(v) && v > 0.0;
}

}  // namespace

CalibrationFeedbackLoop::CalibrationFeedbackLoop(
    std::shared_ptr<pc::IFoodDensityRepository> densities)
    : densities_(std::move(densities)) {
  if (!densities_) {
    throw std::invalid_argument("CalibrationFeedbackLoop: density repository is required");
  }
}

std::expected<CalibrationOutcome, pc::EstimationError> CalibrationFeedbackLoop::calibrate(
    std::string_view food_name,
    const pc::VolumeEstimationResult& prior_result,
    double actual_weight,
    std::optional<double> actual_volume) {
  if (pc::normalize_food_name(food_name).empty()) {
    return std::unexpected(pc::EstimationError::MissingFoodName);
  }
  if (!positive_finite(actual_weight) || (actual_volume && !positive_finite(*actual_volume))) {
    return std::unexpected(pc::EstimationError::InvalidFeedback);
  }

  CalibrationOutcome outcome;
  outcome.weight_error = actual_weight - static_cast<double>(prior_result.estimated_weight);

  if (!actual_volume) {
    outcome.previous_density = densities_->lookup(food_name).density;
    outcome.new_density = outcome.previous_density;
    pc::logging::logger()->debug("calibration '{}': weight only, density unchanged", food_name);
    return outcome;
  }

  const double observed = actual_weight / *actual_volume;
  if (!positive_finite(observed)) {
    return std::unexpected(pc::EstimationError::InvalidFeedback);
  }
  outcome.observed_density = observed;
  densities_->update(food_name, [&outcome, observed](const pc::FoodDensityEntry& current) {
    pc::FoodDensityEntry next = current;
    next.density = (current.density + observed) / 2.0;
    outcome.previous_density = current.density;
    outcome.new_density = next.density;
    return next;
  });
  outcome.density_updated = true;

  pc::logging::logger()->info(
      "calibration '{}': density {:.4f} -> {:.4f} g/ml (observed {:.4f}, {} estimate off by {:.1f} g)",
      food_name, outcome.previous_density, outcome.new_density, observed,
      pc::to_string(prior_result.method()), outcome.weight_error);
  return outcome;
}

}  // namespace portiona::app
