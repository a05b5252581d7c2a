#include <portiona/core/food_density.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

namespace pc = portiona::core;

TEST(FoodDensity, SeedTableHasTenFoods) {
  auto repo = pc::InMemoryFoodDensityRepository::with_seed_table();
  EXPECT_EQ(repo.size(), 10u);
  auto apple = repo.find("Apple");
  ASSERT_TRUE(apple.has_value());
  EXPECT_DOUBLE_EQ(apple->density, 0.85);
  EXPECT_DOUBLE_EQ(apple->density_variance, 0.1);
  EXPECT_EQ(apple->shape_prior, pc::FoodShape::Spherical);
  EXPECT_DOUBLE_EQ(apple->compressibility, 0.1);
}

TEST(FoodDensity, LookupIsCaseAndWhitespaceInsensitive) {
  auto repo = pc::InMemoryFoodDensityRepository::with_seed_table();
  auto chicken = repo.find("  grilled chicken   BREAST");
  ASSERT_TRUE(chicken.has_value());
  EXPECT_DOUBLE_EQ(chicken->density, 1.1);
}

TEST(FoodDensity, UnknownFoodGetsDefaultProfile) {
  auto repo = pc::InMemoryFoodDensityRepository::with_seed_table();
  EXPECT_FALSE(repo.find("dragonfruit").has_value());
  const auto entry = repo.lookup("dragonfruit");
  EXPECT_DOUBLE_EQ(entry.density, 1.0);
  EXPECT_DOUBLE_EQ(entry.density_variance, 0.0);
  EXPECT_EQ(entry.shape_prior, pc::FoodShape::Irregular);
  EXPECT_DOUBLE_EQ(entry.compressibility, 0.5);
}

TEST(FoodDensity, UpsertReplaces) {
  pc::InMemoryFoodDensityRepository repo;
  repo.upsert("Tofu", {0.95, 0.05, pc::FoodShape::Rectangular, 0.3});
  repo.upsert("tofu", {0.97, 0.05, pc::FoodShape::Rectangular, 0.3});
  EXPECT_EQ(repo.size(), 1u);
  EXPECT_DOUBLE_EQ(repo.lookup("TOFU").density, 0.97);
}

TEST(FoodDensity, UpdateStartsFromDefaultForUnknownFood) {
  pc::InMemoryFoodDensityRepository repo;
  const auto stored = repo.update("soup", [](const pc::FoodDensityEntry& cur) {
    auto next = cur;
    next.density = cur.density * 2.0;
    return next;
  });
  EXPECT_DOUBLE_EQ(stored.density, 2.0);
  EXPECT_DOUBLE_EQ(repo.lookup("soup").density, 2.0);
  EXPECT_EQ(repo.lookup("soup").shape_prior, pc::FoodShape::Irregular);
}

TEST(FoodDensity, SnapshotIsSortedCopy) {
  auto repo = pc::InMemoryFoodDensityRepository::with_seed_table();
  auto snap = repo.snapshot();
  ASSERT_EQ(snap.size(), 10u);
  EXPECT_EQ(snap.front().first, "apple");
  EXPECT_EQ(snap.back().first, "white rice");
  repo.upsert("apple", {2.0, 0.0, pc::FoodShape::Spherical, 0.1});
  EXPECT_DOUBLE_EQ(snap.front().second.density, 0.85);
}

TEST(FoodDensity, ConcurrentUpdatesAreNotLost) {
  pc::InMemoryFoodDensityRepository repo;
  repo.upsert("counter", {0.0, 0.0, pc::FoodShape::Irregular, 0.5});
  constexpr int kThreads = 4;
  constexpr int kIncrements = 500;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&repo]() {
      for (int i = 0; i < kIncrements; ++i) {
        (void)repo.update("counter", [](const pc::FoodDensityEntry& cur) {
          auto next = cur;
          next.density += 1.0;
          return next;
        });
        (void)repo.find("counter");
      }
    });
  }
  for (auto& t : threads) t.join();
  EXPECT_DOUBLE_EQ(repo.lookup("counter").density, kThreads * kIncrements);
}
