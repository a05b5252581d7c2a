#include <portiona/core/nutrition.hpp>
#include <algorithm>

namespace portiona::core {

namespace {

std::optional<double> scaled(const std::optional<double>& value, double factor) noexcept {
  if (!value) return std::nullopt;
  return *value * factor;
}

}  // namespace

NutritionInfo nutrition_for_portion(const NutritionInfo& per_100g,
                                    double weight_g) noexcept {
  const double factor = std::max(weight_g, 0.0) / 100.0;

  NutritionInfo out;
  out.calories = per_100g.calories * factor;
  out.protein = per_100g.protein * factor;
  out.carbs = per_100g.carbs * factor;
  out.fat = per_100g.fat * factor;
  out.fiber = per_100g.fiber * factor;
  out.sugar = per_100g.sugar * factor;
  out.sodium = per_100g.sodium * factor;
  out.saturated_fat = scaled(per_100g.saturated_fat, factor);
  out.trans_fat = scaled(per_100g.trans_fat, factor);
  out.cholesterol = scaled(per_100g.cholesterol, factor);
  out.potassium = scaled(per_100g.potassium, factor);
  out.calcium = scaled(per_100g.calcium, factor);
  out.iron = scaled(per_100g.iron, factor);
  out.vitamin_a = scaled(per_100g.vitamin_a, factor);
  out.vitamin_c = scaled(per_100g.vitamin_c, factor);
  out.vitamin_d = scaled(per_100g.vitamin_d, factor);
  return out;
}

}  // namespace portiona::core
