#pragma once

#include <portiona/core/food.hpp>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace portiona::core {

/// Density profile of one food.
struct FoodDensityEntry {
  double density{1.0};  // g/ml
  double density_variance{0.0};
  FoodShape shape_prior{FoodShape::Irregular};
  double compressibility{0.5};  // 0-1
};

/// Profile used for foods the table does not know.
[[nodiscard]] FoodDensityEntry default_density_entry() noexcept;

/// Built-in table loaded at startup.
[[nodiscard]] std::vector<std::pair<std::string, FoodDensityEntry>> seed_food_densities();

/// Food-name keyed density store. Names are normalized with
/// normalize_food_name() by every implementation.
///
/// Contract: any number of concurrent readers together with writers; a read
/// never observes a partially written entry.
class IFoodDensityRepository {
 public:
  using Updater = std::function<FoodDensityEntry(const FoodDensityEntry&)>;

  virtual ~IFoodDensityRepository() = default;

  [[nodiscard]] virtual std::optional<FoodDensityEntry> find(std::string_view food_name) const = 0;

  /// Inserts or replaces the entry.
  virtual void upsert(std::string_view food_name, const FoodDensityEntry& entry) = 0;

  /// Atomic read-modify-write. The updater sees the current entry (or the
  /// default for unknown foods); its return value is stored and returned.
  virtual FoodDensityEntry update(std::string_view food_name, const Updater& updater) = 0;

  [[nodiscard]] virtual std::vector<std::pair<std::string, FoodDensityEntry>> snapshot() const = 0;

  /// find() or default_density_entry().
  [[nodiscard]] FoodDensityEntry lookup(std::string_view food_name) const;
};

/// In-memory repository guarded by a shared mutex.
class InMemoryFoodDensityRepository : public IFoodDensityRepository {
 public:
  /// Empty table.
  InMemoryFoodDensityRepository() = default;

  explicit InMemoryFoodDensityRepository(
      const std::vector<std::pair<std::string, FoodDensityEntry>>& entries);

  /// Table seeded with seed_food_densities().
  [[nodiscard]] static InMemoryFoodDensityRepository with_seed_table();

  InMemoryFoodDensityRepository(const InMemoryFoodDensityRepository& other);
  InMemoryFoodDensityRepository& operator=(const InMemoryFoodDensityRepository&) = delete;

  [[nodiscard]] std::optional<FoodDensityEntry> find(std::string_view food_name) const override;
  void upsert(std::string_view food_name, const FoodDensityEntry& entry) override;
  FoodDensityEntry update(std::string_view food_name, const Updater& updater) override;
  [[nodiscard]] std::vector<std::pair<std::string, FoodDensityEntry>> snapshot() const override;

  [[nodiscard]] std::size_t size() const;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, FoodDensityEntry> entries_;
};

}  // namespace portiona::core
