#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace portiona::app {

/// Backend behind a model-driven evidence source.
enum class BackendType {
  None,  // source disabled
  Mock,  // synthetic output (demo / tests)
  Onnx,  // ONNX Runtime model
};

[[nodiscard]] std::optional<BackendType> parse_backend_type(std::string_view text);

/// Estimator configuration: backends, model input preparation, thresholds.
struct EstimatorConfig {
  BackendType detector_backend{BackendType::None};
  std::string detector_model_path;
  std::uint32_t detector_input_width{640};
  std::uint32_t detector_input_height{640};
  float detector_confidence_threshold{0.5f};
  std::vector<std::string> reference_labels;  // class id -> catalog label

  BackendType depth_backend{BackendType::None};
  std::string depth_model_path;
  std::uint32_t depth_input_width{256};
  std::uint32_t depth_input_height{256};
  double depth_scale{1.0};  // cm per model unit
  double min_valid_depth_fraction{0.5};

  float normalize_mean{0.f};
  float normalize_scale{1.f / 255.f};

  double min_reference_confidence{0.0};
  std::string density_table_path;  // optional, loaded over the seed table
  std::string log_level{"info"};
};

/// Load config from a key=value file (one per line, '#' comments). Missing
/// file -> defaults; unknown keys and unparsable backend names are ignored.
/// Malformed numbers throw std::invalid_argument / std::out_of_range.
EstimatorConfig load_config(const std::string& path);

/// Defaults: no detector, no depth model, heuristic path only.
EstimatorConfig default_config();

}  // namespace portiona::app
