#pragma once

#include <portiona/core/error.hpp>
#include <portiona/core/food_density.hpp>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace portiona::app {

using DensityTable = std::vector<std::pair<std::string, portiona::core::FoodDensityEntry>>;

/// Parses "name = density, variance, shape, compressibility".
/// Blank and '#' lines, missing fields, unknown shapes and negative numbers
/// give nullopt. The name is normalized.
[[nodiscard]] std::optional<std::pair<std::string, portiona::core::FoodDensityEntry>>
parse_density_line(std::string_view line);

/// InvalidConfig when the file cannot be opened. Malformed lines are skipped
/// with a warning.
[[nodiscard]] std::expected<DensityTable, portiona::core::EstimationError> load_density_table(
    const std::string& path);

/// Writes one line per entry, sorted by name.
[[nodiscard]] std::expected<void, portiona::core::EstimationError> save_density_table(
    const std::string& path, DensityTable entries);

}  // namespace portiona::app
