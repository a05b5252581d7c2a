#include <portiona/vision/reference_catalog.hpp>
#include <array>
#include <cctype>

namespace portiona::vision {

namespace {

// ISO/IEC 7810 ID-1 card; a 1-euro-sized coin; a typical phone, cutlery,
// dinner plate and mug.
const std::array<CatalogEntry, 7> kCatalog{{
    {"credit_card", "Credit Card", 8.56, 5.398, 0.076},
    {"coin", "Coin", 2.4, 2.4, 0.175},
    {"phone", "Phone", 7.5, 15.0, 0.8},
    {"fork", "Fork", 2.0, 18.0, std::nullopt},
    {"spoon", "Spoon", 3.0, 16.0, std::nullopt},
    {"plate", "Plate", 25.0, 25.0, std::nullopt},
    {"cup", "Cup", 8.0, 10.0, std::nullopt},
}};

bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

}  // namespace

std::span<const CatalogEntry> reference_catalog() noexcept {
  return kCatalog;
}

std::optional<CatalogEntry> find_reference(std::string_view label) {
  for (const auto& entry : kCatalog) {
    if (iequals(entry.label, label) || iequals(entry.display_name, label)) {
      return entry;
    }
  }
  return std::nullopt;
}

}  // namespace portiona::vision
