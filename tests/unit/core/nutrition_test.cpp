#include <portiona/core/nutrition.hpp>
#include <gtest/gtest.h>

namespace pc = portiona::core;

TEST(Nutrition, ScalesByWeightOverHundred) {
  pc::NutritionInfo apple{52.0, 0.3, 14.0, 0.2, 2.4, 10.0, 1.0};
  apple.vitamin_c = 4.6;
  const auto portion = pc::nutrition_for_portion(apple, 150.0);
  EXPECT_DOUBLE_EQ(portion.calories, 78.0);
  EXPECT_DOUBLE_EQ(portion.carbs, 21.0);
  EXPECT_DOUBLE_EQ(portion.sodium, 1.5);
  ASSERT_TRUE(portion.vitamin_c.has_value());
  EXPECT_NEAR(*portion.vitamin_c, 6.9, 1e-12);
  EXPECT_FALSE(portion.iron.has_value());
}

TEST(Nutrition, NegativeWeightCountsAsZero) {
  pc::NutritionInfo rice{130.0, 2.7, 28.0, 0.3, 0.4, 0.1, 1.0};
  const auto portion = pc::nutrition_for_portion(rice, -20.0);
  EXPECT_DOUBLE_EQ(portion.calories, 0.0);
  EXPECT_DOUBLE_EQ(portion.protein, 0.0);
}
