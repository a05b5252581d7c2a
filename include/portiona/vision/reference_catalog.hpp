#pragma once

#include <optional>
#include <span>
#include <string_view>

namespace portiona::vision {

/// Everyday object with fixed physical dimensions (cm).
struct CatalogEntry {
  std::string_view label;         // detector label, e.g. "credit_card"
  std::string_view display_name;  // e.g. "Credit Card"
  double width{0.0};
  double height{0.0};
  std::optional<double> depth;
};

/// Static catalog: credit_card, coin, phone, fork, spoon, plate, cup.
[[nodiscard]] std::span<const CatalogEntry> reference_catalog() noexcept;

/// Catalog entry for a detector label, matched case-insensitively.
[[nodiscard]] std::optional<CatalogEntry> find_reference(std::string_view label);

}  // namespace portiona::vision
