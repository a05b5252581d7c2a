/**
 * portiona-cli: estimate the volume and weight of one food region in an image.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/portiona_cli --food apple [--input photo.jpg] [--bbox x,y,w,h]
 * Without --input a synthetic 320x240 frame is used; without --bbox the whole frame.
 */

#include <portiona/app/calibration.hpp>
#include <portiona/app/config.hpp>
#include <portiona/app/estimator_builder.hpp>
#include <portiona/app/volume_estimator.hpp>
#include <portiona/core/estimation_result.hpp>
#include <portiona/core/food.hpp>
#include <portiona/core/frame.hpp>
#include <portiona/core/logging.hpp>
#include <portiona/core/nutrition.hpp>
#include <portiona/vision/load_image.hpp>

#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

std::vector<double> parse_numbers(const std::string& text) {
  std::vector<double> out;
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, ',')) {
    out.push_back(std::stod(item));
  }
  return out;
}

portiona::core::Frame make_dummy_frame(std::uint32_t w, std::uint32_t h) {
  const std::size_t bytes = static_cast<std::size_t>(w) * h * 3;
  std::vector<std::byte> buffer(bytes, std::byte{128});
  return portiona::core::Frame(w, h, portiona::core::PixelFormat::RGB8, std::move(buffer));
}

bool apply_backend(const std::string& value, portiona::app::BackendType& target, const char* flag) {
  auto parsed = portiona::app::parse_backend_type(value);
  if (!parsed) {
    std::cerr << "Unknown " << flag << " " << value << " (use none, mock, or onnx)\n";
    return false;
  }
  target = *parsed;
  return true;
}

void print_result(std::ostream& out, const portiona::core::VolumeEstimationResult& r) {
  const auto& dims = r.shape_analysis.dimensions;
  out << "method=" << portiona::core::to_string(r.method())
      << " volume=" << r.estimated_volume << "ml"
      << " weight=" << r.estimated_weight << "g"
      << " density=" << r.density
      << " confidence=" << r.confidence << "\n"
      << "  shape=" << portiona::core::to_string(r.shape_analysis.shape)
      << " dims=(" << dims.length << "," << dims.width << "," << dims.height << ")"
      << " surface_area=" << r.shape_analysis.surface_area << "\n";
  if (const auto* ref = r.reference_object()) {
    out << "  reference=" << ref->name << " confidence=" << ref->confidence << "\n";
  }
  if (const auto* depth = r.depth_estimation()) {
    out << "  depth mean=" << depth->average_depth << " variance=" << depth->depth_variance
        << "\n";
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string input_path;
  std::string food_name;
  std::string category_text = "other";
  std::string bbox_text;
  std::string detector_override;
  std::string depth_override;
  std::string detector_model;
  std::string depth_model;
  std::string actual_weight_text;
  std::string actual_volume_text;
  std::string nutrition_text;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      input_path = argv[++i];
    } else if (arg == "--food" && i + 1 < argc) {
      food_name = argv[++i];
    } else if (arg == "--category" && i + 1 < argc) {
      category_text = argv[++i];
    } else if (arg == "--bbox" && i + 1 < argc) {
      bbox_text = argv[++i];
    } else if (arg == "--detector" && i + 1 < argc) {
      detector_override = argv[++i];
    } else if (arg == "--depth" && i + 1 < argc) {
      depth_override = argv[++i];
    } else if (arg == "--model-detector" && i + 1 < argc) {
      detector_model = argv[++i];
    } else if (arg == "--model-depth" && i + 1 < argc) {
      depth_model = argv[++i];
    } else if (arg == "--actual-weight" && i + 1 < argc) {
      actual_weight_text = argv[++i];
    } else if (arg == "--actual-volume" && i + 1 < argc) {
      actual_volume_text = argv[++i];
    } else if (arg == "--nutrition" && i + 1 < argc) {
      nutrition_text = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: portiona_cli --food <name> [options]\n"
                << "  --config <path>          Estimator config (key=value file)\n"
                << "  --input <path>           Image path (default: synthetic frame)\n"
                << "  --category <c>           Food category (fruits, grains, ...; default other)\n"
                << "  --bbox x,y,w,h           Food region in pixels (default: whole frame)\n"
                << "  --detector <type>        Reference detector: none | mock | onnx\n"
                << "  --depth <type>           Depth model: none | mock | onnx\n"
                << "  --model-detector <path>  Detector ONNX model\n"
                << "  --model-depth <path>     Depth ONNX model\n"
                << "  --actual-weight <g>      Measured weight, runs calibration\n"
                << "  --actual-volume <ml>     Measured volume, updates the density\n"
                << "  --nutrition kcal,protein,carbs,fat,fiber,sugar,sodium   per 100 g\n";
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << " (see --help)\n";
      return 1;
    }
  }

  if (food_name.empty()) {
    std::cerr << "--food is required\n";
    return 1;
  }
  const auto category = portiona::core::parse_food_category(category_text);
  if (!category) {
    std::cerr << "Unknown --category " << category_text << "\n";
    return 1;
  }

  try {
    portiona::app::EstimatorConfig cfg = config_path.empty() ? portiona::app::default_config()
                                                             : portiona::app::load_config(config_path);
    portiona::core::logging::set_log_level(cfg.log_level);
    if (!detector_override.empty() &&
        !apply_backend(detector_override, cfg.detector_backend, "--detector")) {
      return 1;
    }
    if (!depth_override.empty() && !apply_backend(depth_override, cfg.depth_backend, "--depth")) {
      return 1;
    }
    if (!detector_model.empty()) cfg.detector_model_path = detector_model;
    if (!depth_model.empty()) cfg.depth_model_path = depth_model;

    portiona::core::Frame frame;
    if (!input_path.empty()) {
      auto loaded = portiona::vision::load_frame_from_image(input_path);
      if (!loaded) {
        std::cerr << "Failed to load image: " << input_path << "\n";
        return 1;
      }
      frame = std::move(*loaded);
    } else {
      frame = make_dummy_frame(320, 240);
    }

    portiona::core::BoundingBox box{0.0, 0.0, static_cast<double>(frame.width()),
                                    static_cast<double>(frame.height())};
    if (!bbox_text.empty()) {
      const auto v = parse_numbers(bbox_text);
      if (v.size() != 4) {
        std::cerr << "--bbox expects x,y,w,h\n";
        return 1;
      }
      box = {v[0], v[1], v[2], v[3]};
    }

    auto densities = portiona::app::make_density_repository(cfg);
    auto estimator = portiona::app::build_estimator(cfg, densities);
    auto result = estimator->estimate(frame, food_name, *category, box);
    if (!result) {
      std::cerr << "Estimation error: " << portiona::core::to_string(result.error()) << "\n";
      return 1;
    }
    print_result(std::cout, *result);

    if (!nutrition_text.empty()) {
      const auto v = parse_numbers(nutrition_text);
      if (v.size() != 7) {
        std::cerr << "--nutrition expects kcal,protein,carbs,fat,fiber,sugar,sodium\n";
        return 1;
      }
      const portiona::core::NutritionInfo per_100g{v[0], v[1], v[2], v[3], v[4], v[5], v[6]};
      const auto n = portiona::core::nutrition_for_portion(
          per_100g, static_cast<double>(result->estimated_weight));
      std::cout << "nutrition calories=" << n.calories << " protein=" << n.protein
                << " carbs=" << n.carbs << " fat=" << n.fat << " fiber=" << n.fiber
                << " sugar=" << n.sugar << " sodium=" << n.sodium << "\n";
    }

    if (!actual_weight_text.empty()) {
      std::optional<double> actual_volume;
      if (!actual_volume_text.empty()) actual_volume = std::stod(actual_volume_text);
      portiona::app::CalibrationFeedbackLoop calibration(densities);
      auto outcome =
          calibration.calibrate(food_name, *result, std::stod(actual_weight_text), actual_volume);
      if (!outcome) {
        std::cerr << "Calibration error: " << portiona::core::to_string(outcome.error()) << "\n";
        return 1;
      }
      std::cout << "calibration updated=" << (outcome->density_updated ? "yes" : "no")
                << " weight_error=" << outcome->weight_error << "g"
                << " density " << outcome->previous_density << " -> " << outcome->new_density
                << "\n";
      if (outcome->density_updated) {
        auto saved = portiona::app::save_density_repository(cfg, *densities);
        if (!saved) {
          std::cerr << "Failed to save density table " << cfg.density_table_path << ": "
                    << portiona::core::to_string(saved.error()) << "\n";
          return 1;
        }
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
