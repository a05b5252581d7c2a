#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace portiona::core {

/// Canonical 3-D shape a food region is approximated by.
enum class FoodShape : std::uint8_t {
  Spherical,
  Cylindrical,
  Rectangular,
  Irregular,
};

inline constexpr std::size_t kFoodShapeCount = 4;

/// Category reported by the upstream food classifier.
enum class FoodCategory : std::uint8_t {
  Fruits,
  Vegetables,
  Grains,
  Protein,
  Dairy,
  FatsOils,
  Beverages,
  Snacks,
  Desserts,
  FastFood,
  PreparedMeals,
  Condiments,
  Other,
};

/// Resolved classification result handed to the estimator.
struct FoodIdentity {
  std::string name;
  FoodCategory category{FoodCategory::Other};
};

[[nodiscard]] std::string_view to_string(FoodShape shape) noexcept;
[[nodiscard]] std::string_view to_string(FoodCategory category) noexcept;

/// Parses "spherical", "cylindrical", ... (case-insensitive).
[[nodiscard]] std::optional<FoodShape> parse_food_shape(std::string_view text);

/// Parses "fruits", "fats_oils", ... (case-insensitive); unknown text -> nullopt.
[[nodiscard]] std::optional<FoodCategory> parse_food_category(std::string_view text);

/// Key used by the density table: trimmed, lower-case, inner whitespace
/// collapsed to one space. "  Grilled   Chicken Breast" -> "grilled chicken breast".
[[nodiscard]] std::string normalize_food_name(std::string_view name);

}  // namespace portiona::core
