#pragma once

#include <portiona/core/error.hpp>
#include <portiona/core/estimation_result.hpp>
#include <portiona/core/food_density.hpp>
#include <expected>
#include <memory>
#include <optional>
#include <string_view>

namespace portiona::app {

/// What a calibration event did to the density table.
struct CalibrationOutcome {
  bool density_updated{false};
  double previous_density{0.0};
  double new_density{0.0};
  std::optional<double> observed_density;  // actual_weight / actual_volume
  double weight_error{0.0};                // actual - estimated, grams
};

/// Folds user-confirmed ground truth into the density table.
///
/// With a measured volume the stored density moves halfway to the observed
/// one: new = (current + observed) / 2. Each event is applied once and only
/// affects later estimates. Without a volume nothing is updated: a weight
/// alone cannot separate volume error from density error. Unknown foods start
/// from the default profile.
class CalibrationFeedbackLoop {
 public:
  explicit CalibrationFeedbackLoop(std::shared_ptr<portiona::core::IFoodDensityRepository> densities);

  /// InvalidFeedback for a non-positive or non-finite weight or volume,
  /// MissingFoodName for an empty name.
  [[nodiscard]] std::expected<CalibrationOutcome, portiona::core::EstimationError> calibrate(
      std::string_view food_name,
      const portiona::core::VolumeEstimationResult& prior_result,
      double actual_weight,
      std::optional<double> actual_volume = std::nullopt);

 private:
  std::shared_ptr<portiona::core::IFoodDensityRepository> densities_;
};

}  // namespace portiona::app
