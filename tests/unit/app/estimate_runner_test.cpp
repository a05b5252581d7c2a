#include <portiona/app/estimate_runner.hpp>
#include <portiona/core/food_density.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <vector>

namespace pa = portiona::app;
namespace pc = portiona::core;

namespace {

pa::VolumeEstimator make_estimator() {
  return pa::VolumeEstimator(std::make_shared<pc::InMemoryFoodDensityRepository>(
                                 pc::InMemoryFoodDensityRepository::with_seed_table()),
                             nullptr, nullptr);
}

std::vector<pa::EstimationItem> plate_items() {
  return {
      {{"Apple", pc::FoodCategory::Fruits}, {0.0, 0.0, 200.0, 180.0}},
      {{"White Rice", pc::FoodCategory::Grains}, {200.0, 0.0, 150.0, 100.0}},
      {{"Broccoli", pc::FoodCategory::Vegetables}, {0.0, 200.0, 0.0, 50.0}},
      {{"", pc::FoodCategory::Other}, {10.0, 10.0, 20.0, 20.0}},
      {{"Banana", pc::FoodCategory::Fruits}, {0.0, 300.0, 300.0, 100.0}},
      {{"Bread", pc::FoodCategory::Grains}, {320.0, 0.0, 120.0, 80.0}},
  };
}

}  // namespace

TEST(EstimateRunner, SequentialKeepsItemOrder) {
  const auto estimator = make_estimator();
  const auto results = pa::estimate_items_sequential(estimator, pc::Frame{}, plate_items());
  ASSERT_EQ(results.size(), 6u);
  ASSERT_TRUE(results[0].has_value());
  EXPECT_EQ(results[0]->estimated_volume, 949);
  ASSERT_FALSE(results[2].has_value());
  EXPECT_EQ(results[2].error(), pc::EstimationError::InvalidBoundingBox);
  ASSERT_FALSE(results[3].has_value());
  EXPECT_EQ(results[3].error(), pc::EstimationError::MissingFoodName);
  ASSERT_TRUE(results[4].has_value());
  EXPECT_EQ(results[4]->shape_analysis.shape, pc::FoodShape::Cylindrical);
}

TEST(EstimateRunner, ParallelMatchesSequential) {
  const auto estimator = make_estimator();
  const auto items = plate_items();
  const auto expected = pa::estimate_items_sequential(estimator, pc::Frame{}, items);
  for (std::size_t workers : {0u, 2u, 4u, 16u}) {
    const auto results = pa::estimate_items(estimator, pc::Frame{}, items, workers);
    ASSERT_EQ(results.size(), expected.size());
    for (std::size_t i = 0; i < results.size(); ++i) {
      ASSERT_EQ(results[i].has_value(), expected[i].has_value()) << "item " << i;
      if (results[i]) {
        EXPECT_EQ(results[i]->estimated_volume, expected[i]->estimated_volume);
        EXPECT_EQ(results[i]->estimated_weight, expected[i]->estimated_weight);
      } else {
        EXPECT_EQ(results[i].error(), expected[i].error());
      }
    }
  }
}

TEST(EstimateRunner, EmptyItemList) {
  const auto estimator = make_estimator();
  EXPECT_TRUE(pa::estimate_items(estimator, pc::Frame{}, {}).empty());
}
