#include <portiona/app/density_table_io.hpp>
#include <portiona/core/logging.hpp>
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace portiona::app {

namespace pc = portiona::core;

namespace {

std::string_view trim(std::string_view s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::optional<double> parse_non_negative(std::string_view text) {
  const std::string buf(trim(text));
  if (buf.empty()) return std::nullopt;
  std::size_t used = 0;
  double value = 0.0;
  try {
    value = std::stod(buf, &used);
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
  if (used != buf.size() || !(value >= 0.0)) return std::nullopt;
  return value;
}

}  // namespace

std::optional<std::pair<std::string, pc::FoodDensityEntry>> parse_density_line(
    std::string_view line) {
  line = trim(line);
  if (line.empty() || line.front() == '#') return std::nullopt;

  const auto eq = line.find('=');
  if (eq == std::string_view::npos) return std::nullopt;
  std::string name = pc::normalize_food_name(line.substr(0, eq));
  if (name.empty()) return std::nullopt;

  std::vector<std::string_view> fields;
  std::string_view rest = line.substr(eq + 1);
  while (true) {
    const auto comma = rest.find(',');
    fields.push_back(trim(rest.substr(0, comma)));
    if (comma == std::string_view::npos) break;
    rest = rest.substr(comma + 1);
  }
  if (fields.size() != 4) return std::nullopt;

  const auto density = parse_non_negative(fields[0]);
  const auto variance = parse_non_negative(fields[1]);
  const auto shape = pc::parse_food_shape(fields[2]);
  const auto compressibility = parse_non_negative(fields[3]);
  if (!density || !variance || !shape || !compressibility) return std::nullopt;

  pc::FoodDensityEntry entry;
  entry.density = *density;
  entry.density_variance = *variance;
  entry.shape_prior = *shape;
  entry.compressibility = std::min(*compressibility, 1.0);
  return std::make_pair(std::move(name), entry);
}

std::expected<DensityTable, pc::EstimationError> load_density_table(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    pc::logging::logger()->error("density table: cannot open '{}'", path);
    return std::unexpected(pc::EstimationError::InvalidConfig);
  }

  DensityTable table;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    auto parsed = parse_density_line(line);
    if (parsed) {
      table.push_back(std::move(*parsed));
      continue;
    }
    const auto body = trim(line);
    if (!body.empty() && body.front() != '#') {
      pc::logging::logger()->warn("density table {}:{}: malformed line skipped", path, line_no);
    }
  }
  pc::logging::logger()->info("density table: {} entries from '{}'", table.size(), path);
  return table;
}

std::expected<void, pc::EstimationError> save_density_table(const std::string& path,
                                                            DensityTable entries) {
  std::sort(entries.begin(), entries.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });
  std::ofstream f(path, std::ios::trunc);
  if (!f) {
    pc::logging::logger()->error("density table: cannot write '{}'", path);
    return std::unexpected(pc::EstimationError::InvalidConfig);
  }
  f << "# name = density, variance, shape, compressibility\n";
  for (const auto& [name, e] : entries) {
    f << name << " = " << e.density << ", " << e.density_variance << ", "
      << pc::to_string(e.shape_prior) << ", " << e.compressibility << '\n';
  }
  if (!f) return std::unexpected(pc::EstimationError::InvalidConfig);
  return {};
}

}  // namespace portiona::app
