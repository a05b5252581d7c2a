#include <portiona/app/config.hpp>
#include <portiona/core/logging.hpp>
#include <portiona/vision/reference_catalog.hpp>
#include <fstream>
#include <sstream>

namespace portiona::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

std::vector<std::string> split_list(const std::string& value) {
  std::vector<std::string> out;
  std::stringstream ss(value);
  std::string item;
  while (std::getline(ss, item, ',')) {
    trim(item);
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

void set_backend(BackendType& target, const std::string& key, const std::string& value) {
  if (auto parsed = parse_backend_type(value)) {
    target = *parsed;
  } else {
    portiona::core::logging::logger()->warn("config: unknown {} '{}' ignored", key, value);
  }
}

}  // namespace

std::optional<BackendType> parse_backend_type(std::string_view text) {
  if (text == "none") return BackendType::None;
  if (text == "mock") return BackendType::Mock;
  if (text == "onnx") return BackendType::Onnx;
  return std::nullopt;
}

EstimatorConfig default_config() {
  EstimatorConfig c;
  for (const auto& entry : portiona::vision::reference_catalog()) {
    c.reference_labels.emplace_back(entry.label);
  }
  return c;
}

EstimatorConfig load_config(const std::string& path) {
  EstimatorConfig c = default_config();
  std::ifstream f(path);
  if (!f) {
    portiona::core::logging::logger()->warn("config: cannot open '{}', using defaults", path);
    return c;
  }

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "detector_backend") set_backend(c.detector_backend, key, value);
    else if (key == "detector_model_path") c.detector_model_path = value;
    else if (key == "detector_input_width") c.detector_input_width = static_cast<std::uint32_t>(std::stoul(value));
    else if (key == "detector_input_height") c.detector_input_height = static_cast<std::uint32_t>(std::stoul(value));
    else if (key == "detector_confidence_threshold") c.detector_confidence_threshold = std::stof(value);
    else if (key == "reference_labels") c.reference_labels = split_list(value);
    else if (key == "depth_backend") set_backend(c.depth_backend, key, value);
    else if (key == "depth_model_path") c.depth_model_path = value;
    else if (key == "depth_input_width") c.depth_input_width = static_cast<std::uint32_t>(std::stoul(value));
    else if (key == "depth_input_height") c.depth_input_height = static_cast<std::uint32_t>(std::stoul(value));
    else if (key == "depth_scale") c.depth_scale = std::stod(value);
    else if (key == "min_valid_depth_fraction") c.min_valid_depth_fraction = std::stod(value);
    else if (key == "normalize_mean") c.normalize_mean = std::stof(value);
    else if (key == "normalize_scale") c.normalize_scale = std::stof(value);
    else if (key == "min_reference_confidence") c.min_reference_confidence = std::stod(value);
    else if (key == "density_table_path") c.density_table_path = value;
    else if (key == "log_level") c.log_level = value;
  }
  return c;
}

}  // namespace portiona::app
