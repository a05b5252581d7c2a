#pragma once

#include <optional>

namespace portiona::core {

/// Nutrient amounts; per 100 g when used as a table row, absolute after scaling.
/// Units: calories kcal, sodium/cholesterol/potassium/calcium/iron mg, vitamins
/// as supplied by the nutrient table, everything else g.
struct NutritionInfo {
  double calories{0.0};
  double protein{0.0};
  double carbs{0.0};
  double fat{0.0};
  double fiber{0.0};
  double sugar{0.0};
  double sodium{0.0};
  std::optional<double> saturated_fat;
  std::optional<double> trans_fat;
  std::optional<double> cholesterol;
  std::optional<double> potassium;
  std::optional<double> calcium;
  std::optional<double> iron;
  std::optional<double> vitamin_a;
  std::optional<double> vitamin_c;
  std::optional<double> vitamin_d;
};

/// Scales every field by weight_g / 100. Absent optional fields stay absent;
/// a negative weight is treated as zero.
[[nodiscard]] NutritionInfo nutrition_for_portion(const NutritionInfo& per_100g,
                                                  double weight_g) noexcept;

}  // namespace portiona::core
