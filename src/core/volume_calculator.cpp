#include <portiona/core/volume_calculator.hpp>
#include <algorithm>
#include <cstddef>
#include <numbers>

namespace portiona::core {

namespace {

constexpr double kPi = std::numbers::pi;

Dimensions clamped(const Dimensions& d) noexcept {
  return {std::max(d.length, 0.0), std::max(d.width, 0.0), std::max(d.height, 0.0)};
}

double spherical_entry(const Dimensions& d, std::optional<double>) noexcept {
  return spherical_volume(d);
}

double rectangular_entry(const Dimensions& d, std::optional<double>) noexcept {
  return rectangular_volume(d);
}

double irregular_entry(const Dimensions& d, std::optional<double>) noexcept {
  return irregular_volume(d);
}

constexpr std::array<VolumeFormula, kFoodShapeCount> kFormulas{
    &spherical_entry,     // FoodShape::Spherical
    &cylindrical_volume,  // FoodShape::Cylindrical
    &rectangular_entry,   // FoodShape::Rectangular
    &irregular_entry,     // FoodShape::Irregular
};

}  // namespace

double spherical_volume(const Dimensions& d) noexcept {
  const Dimensions c = clamped(d);
  const double r = std::min(c.length, c.width) / 2.0;
  return (4.0 / 3.0) * kPi * r * r * r;
}

double cylindrical_volume(const Dimensions& d,
                          std::optional<double> measured_depth) noexcept {
  const Dimensions c = clamped(d);
  const double r = std::min(c.length, c.width) / 2.0;
  const double h = measured_depth ? std::max(*measured_depth, 0.0)
                                  : std::max(c.length, c.width);
  return kPi * r * r * h;
}

double rectangular_volume(const Dimensions& d) noexcept {
  const Dimensions c = clamped(d);
  return c.length * c.width * c.height;
}

double irregular_volume(const Dimensions& d) noexcept {
  const Dimensions c = clamped(d);
  return (4.0 / 3.0) * kPi * (c.length / 2.0) * (c.width / 2.0) * (c.height / 2.0);
}

const std::array<VolumeFormula, kFoodShapeCount>& volume_formulas() noexcept {
  return kFormulas;
}

double volume_for(FoodShape shape,
                  const Dimensions& d,
                  std::optional<double> measured_depth) noexcept {
  return kFormulas[static_cast<std::size_t>(shape)](d, measured_depth);
}

double surface_area_for(FoodShape shape, const Dimensions& d) noexcept {
  const Dimensions c = clamped(d);
  switch (shape) {
    case FoodShape::Spherical: {
      const double r = (c.length + c.width) / 4.0;
      return 4.0 * kPi * r * r;
    }
    case FoodShape::Cylindrical: {
      const double r = std::min(c.length, c.width) / 2.0;
      const double h = std::max(c.length, c.width);
      return 2.0 * kPi * r * (r + h);
    }
    case FoodShape::Rectangular:
      return 2.0 * (c.length * c.width + c.width * c.height + c.height * c.length);
    case FoodShape::Irregular:
    default:
      return c.length * c.width * 1.5;
  }
}

}  // namespace portiona::core
