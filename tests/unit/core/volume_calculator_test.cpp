#include <portiona/core/volume_calculator.hpp>
#include <gtest/gtest.h>
#include <cmath>
#include <numbers>

namespace pc = portiona::core;

namespace {
constexpr double kPi = std::numbers::pi;
}  // namespace

TEST(VolumeCalculator, SphereUsesShorterSide) {
  // r = min(10, 12) / 2 = 5
  EXPECT_NEAR(pc::spherical_volume({10.0, 12.0, 3.0}), 4.0 / 3.0 * kPi * 125.0, 1e-9);
  EXPECT_NEAR(pc::spherical_volume({10.0, 10.0, 0.0}), 523.5987755982989, 1e-9);
}

TEST(VolumeCalculator, BoxIsProductOfSides) {
  EXPECT_DOUBLE_EQ(pc::rectangular_volume({2.0, 3.0, 4.0}), 24.0);
  EXPECT_DOUBLE_EQ(pc::volume_for(pc::FoodShape::Rectangular, {2.0, 3.0, 4.0}), 24.0);
}

TEST(VolumeCalculator, CylinderAxisDefaultsToLongerSide) {
  // r = 2 / 2, h = 10
  EXPECT_NEAR(pc::cylindrical_volume({10.0, 2.0, 1.0}), kPi * 10.0, 1e-9);
}

TEST(VolumeCalculator, CylinderUsesMeasuredDepthWhenGiven) {
  EXPECT_NEAR(pc::cylindrical_volume({10.0, 2.0, 1.0}, 3.0), kPi * 3.0, 1e-9);
  EXPECT_NEAR(pc::volume_for(pc::FoodShape::Cylindrical, {10.0, 2.0, 1.0}, 3.0), kPi * 3.0, 1e-9);
}

TEST(VolumeCalculator, IrregularIsEllipsoid) {
  EXPECT_NEAR(pc::irregular_volume({2.0, 4.0, 6.0}), 4.0 / 3.0 * kPi * 1.0 * 2.0 * 3.0, 1e-9);
}

TEST(VolumeCalculator, NegativeDimensionsNeverGiveNegativeVolume) {
  const pc::Dimensions d{-5.0, 3.0, 2.0};
  for (const auto shape : {pc::FoodShape::Spherical, pc::FoodShape::Cylindrical,
                           pc::FoodShape::Rectangular, pc::FoodShape::Irregular}) {
    EXPECT_GE(pc::volume_for(shape, d), 0.0) << pc::to_string(shape);
    EXPECT_GE(pc::surface_area_for(shape, d), 0.0) << pc::to_string(shape);
  }
  EXPECT_GE(pc::cylindrical_volume({2.0, 2.0, 2.0}, -4.0), 0.0);
}

TEST(VolumeCalculator, FormulaTableMatchesShapeOrder) {
  const auto& table = pc::volume_formulas();
  const pc::Dimensions d{3.0, 4.0, 5.0};
  EXPECT_DOUBLE_EQ(table[0](d, std::nullopt), pc::spherical_volume(d));
  EXPECT_DOUBLE_EQ(table[1](d, std::nullopt), pc::cylindrical_volume(d));
  EXPECT_DOUBLE_EQ(table[2](d, std::nullopt), pc::rectangular_volume(d));
  EXPECT_DOUBLE_EQ(table[3](d, std::nullopt), pc::irregular_volume(d));
}

TEST(VolumeCalculator, SurfaceAreas) {
  // Sphere r = (4 + 4) / 4 = 2
  EXPECT_NEAR(pc::surface_area_for(pc::FoodShape::Spherical, {4.0, 4.0, 1.0}), 16.0 * kPi, 1e-9);
  // Cylinder r = 1, h = 6
  EXPECT_NEAR(pc::surface_area_for(pc::FoodShape::Cylindrical, {6.0, 2.0, 1.0}), 14.0 * kPi, 1e-9);
  EXPECT_DOUBLE_EQ(pc::surface_area_for(pc::FoodShape::Rectangular, {2.0, 3.0, 4.0}), 52.0);
  EXPECT_DOUBLE_EQ(pc::surface_area_for(pc::FoodShape::Irregular, {2.0, 3.0, 4.0}), 9.0);
}
