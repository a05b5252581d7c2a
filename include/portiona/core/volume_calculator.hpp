#pragma once

#include <portiona/core/food.hpp>
#include <portiona/core/geometry.hpp>
#include <array>
#include <optional>

namespace portiona::core {

/// Closed-form volumes. Inputs are physical dimensions (cm), outputs cm^3,
/// which are treated numerically as ml. Negative extents count as zero.

/// (4/3) pi r^3, r = min(length, width) / 2.
[[nodiscard]] double spherical_volume(const Dimensions& d) noexcept;

/// pi r^2 h, r = min(length, width) / 2, h = measured_depth when given,
/// otherwise max(length, width).
[[nodiscard]] double cylindrical_volume(const Dimensions& d,
                                        std::optional<double> measured_depth = std::nullopt) noexcept;

/// length * width * height.
[[nodiscard]] double rectangular_volume(const Dimensions& d) noexcept;

/// Ellipsoid with semi-axes length/2, width/2, height/2.
[[nodiscard]] double irregular_volume(const Dimensions& d) noexcept;

using VolumeFormula = double (*)(const Dimensions&, std::optional<double>) noexcept;

/// Formula per FoodShape, indexed by the enum value.
[[nodiscard]] const std::array<VolumeFormula, kFoodShapeCount>& volume_formulas() noexcept;

/// Dispatches through volume_formulas().
[[nodiscard]] double volume_for(FoodShape shape,
                                const Dimensions& d,
                                std::optional<double> measured_depth = std::nullopt) noexcept;

/// Surface area matching the shape: sphere 4 pi r^2 with r = (length + width) / 4,
/// cylinder 2 pi r (r + h), box face sum, irregular length * width * 1.5.
[[nodiscard]] double surface_area_for(FoodShape shape, const Dimensions& d) noexcept;

}  // namespace portiona::core
