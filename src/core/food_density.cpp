#include <portiona/core/food_density.hpp>
#include <algorithm>
#include <mutex>

namespace portiona::core {

FoodDensityEntry default_density_entry() noexcept {
  return FoodDensityEntry{1.0, 0.0, FoodShape::Irregular, 0.5};
}

std::vector<std::pair<std::string, FoodDensityEntry>> seed_food_densities() {
  return {
      {"Apple", {0.85, 0.1, FoodShape::Spherical, 0.1}},
      {"Banana", {0.9, 0.05, FoodShape::Cylindrical, 0.2}},
      {"Orange", {0.87, 0.08, FoodShape::Spherical, 0.1}},
      {"Grilled Chicken Breast", {1.1, 0.15, FoodShape::Irregular, 0.05}},
      {"White Rice", {0.75, 0.1, FoodShape::Irregular, 0.3}},
      {"Broccoli", {0.6, 0.2, FoodShape::Irregular, 0.4}},
      {"Bread", {0.4, 0.1, FoodShape::Rectangular, 0.6}},
      {"Pasta", {0.8, 0.1, FoodShape::Irregular, 0.2}},
      {"Cheese", {1.2, 0.2, FoodShape::Rectangular, 0.1}},
      {"Salad", {0.3, 0.15, FoodShape::Irregular, 0.7}},
  };
}

FoodDensityEntry IFoodDensityRepository::lookup(std::string_view food_name) const {
  return find(food_name).value_or(default_density_entry());
}

InMemoryFoodDensityRepository::InMemoryFoodDensityRepository(
    const std::vector<std::pair<std::string, FoodDensityEntry>>& entries) {
  for (const auto& [name, entry] : entries) {
    entries_[normalize_food_name(name)] = entry;
  }
}

InMemoryFoodDensityRepository InMemoryFoodDensityRepository::with_seed_table() {
  return InMemoryFoodDensityRepository(seed_food_densities());
}

InMemoryFoodDensityRepository::InMemoryFoodDensityRepository(
    const InMemoryFoodDensityRepository& other) {
  std::shared_lock lock(other.mutex_);
  entries_ = other.entries_;
}

std::optional<FoodDensityEntry> InMemoryFoodDensityRepository::find(
    std::string_view food_name) const {
  const std::string key = normalize_food_name(food_name);
  std::shared_lock lock(mutex_);
  const auto it = entries_.find(key);
  if (it == entries_.end()) return std::nullopt;
  return it->second;
}

void InMemoryFoodDensityRepository::upsert(std::string_view food_name,
                                           const FoodDensityEntry& entry) {
  std::string key = normalize_food_name(food_name);
  std::unique_lock lock(mutex_);
  entries_[std::move(key)] = entry;
}

FoodDensityEntry InMemoryFoodDensityRepository::update(std::string_view food_name,
                                                       const Updater& updater) {
  std::string key = normalize_food_name(food_name);
  std::unique_lock lock(mutex_);
  const auto it = entries_.find(key);
  const FoodDensityEntry current =
      it != entries_.end() ? it->second : default_density_entry();
  FoodDensityEntry next = updater(current);
  entries_[std::move(key)] = next;
  return next;
}

std::vector<std::pair<std::string, FoodDensityEntry>>
InMemoryFoodDensityRepository::snapshot() const {
  std::vector<std::pair<std::string, FoodDensityEntry>> out;
  {
    std::shared_lock lock(mutex_);
    out.assign(entries_.begin(), entries_.end());
  }
  std::sort(out.begin(), out.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });
  return out;
}

std::size_t InMemoryFoodDensityRepository::size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

}  // namespace portiona::core
