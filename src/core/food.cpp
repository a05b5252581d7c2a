#include <portiona/core/food.hpp>
#include <array>
#include <cctype>
#include <utility>

namespace portiona::core {

namespace {

constexpr std::array<std::pair<std::string_view, FoodCategory>, 13> kCategoryNames{{
    {"fruits", FoodCategory::Fruits},
    {"vegetables", FoodCategory::Vegetables},
    {"grains", FoodCategory::Grains},
    {"protein", FoodCategory::Protein},
    {"dairy", FoodCategory::Dairy},
    {"fats_oils", FoodCategory::FatsOils},
    {"beverages", FoodCategory::Beverages},
    {"snacks", FoodCategory::Snacks},
    {"desserts", FoodCategory::Desserts},
    {"fast_food", FoodCategory::FastFood},
    {"prepared_meals", FoodCategory::PreparedMeals},
    {"condiments", FoodCategory::Condiments},
    {"other", FoodCategory::Other},
}};

std::string lower(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

}  // namespace

std::string_view to_string(FoodShape shape) noexcept {
  switch (shape) {
    case FoodShape::Spherical:
      return "spherical";
    case FoodShape::Cylindrical:
      return "cylindrical";
    case FoodShape::Rectangular:
      return "rectangular";
    case FoodShape::Irregular:
      return "irregular";
  }
  return "irregular";
}

std::string_view to_string(FoodCategory category) noexcept {
  for (const auto& [name, value] : kCategoryNames) {
    if (value == category) return name;
  }
  return "other";
}

std::optional<FoodShape> parse_food_shape(std::string_view text) {
  const std::string key = lower(text);
  if (key == "spherical") return FoodShape::Spherical;
  if (key == "cylindrical") return FoodShape::Cylindrical;
  if (key == "rectangular") return FoodShape::Rectangular;
  if (key == "irregular") return FoodShape::Irregular;
  return std::nullopt;
}

std::optional<FoodCategory> parse_food_category(std::string_view text) {
  const std::string key = lower(text);
  for (const auto& [name, value] : kCategoryNames) {
    if (name == key) return value;
  }
  return std::nullopt;
}

std::string normalize_food_name(std::string_view name) {
  std::string out;
  out.reserve(name.size());
  bool pending_space = false;
  for (const char c : name) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isspace(uc)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(static_cast<char>(std::tolower(uc)));
  }
  return out;
}

}  // namespace portiona::core
