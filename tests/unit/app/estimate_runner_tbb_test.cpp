#ifdef PORTIONA_HAS_TBB

#include <portiona/app/estimate_runner_tbb.hpp>
#include <portiona/core/food_density.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <vector>

namespace pa = portiona::app;
namespace pc = portiona::core;

TEST(EstimateRunnerTbbTest, ResultsInItemOrder) {
  pa::VolumeEstimator estimator(std::make_shared<pc::InMemoryFoodDensityRepository>(
                                    pc::InMemoryFoodDensityRepository::with_seed_table()),
                                nullptr, nullptr);
  std::vector<pa::EstimationItem> items;
  for (int i = 1; i <= 64; ++i) {
    items.push_back({{"Apple", pc::FoodCategory::Fruits},
                     {0.0, 0.0, 10.0 * i, 10.0 * i}});
  }
  items.push_back({{"Apple", pc::FoodCategory::Fruits}, {0.0, 0.0, -1.0, 10.0}});

  const auto results = pa::estimate_items_tbb(estimator, pc::Frame{}, items);
  ASSERT_EQ(results.size(), items.size());
  for (std::size_t i = 1; i < 64; ++i) {
    ASSERT_TRUE(results[i].has_value());
    EXPECT_GT(results[i]->estimated_volume, results[i - 1]->estimated_volume);
  }
  ASSERT_FALSE(results.back().has_value());
  EXPECT_EQ(results.back().error(), pc::EstimationError::InvalidBoundingBox);
}

TEST(EstimateRunnerTbbTest, EmptyItemList) {
  pa::VolumeEstimator estimator(std::make_shared<pc::InMemoryFoodDensityRepository>(), nullptr,
                                nullptr);
  EXPECT_TRUE(pa::estimate_items_tbb(estimator, pc::Frame{}, {}).empty());
}

#endif  // PORTIONA_HAS_TBB
