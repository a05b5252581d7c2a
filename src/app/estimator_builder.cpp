#include <portiona/app/estimator_builder.hpp>
#include <portiona/app/density_table_io.hpp>
#include <portiona/core/logging.hpp>
#include <portiona/vision/mock_depth_backend.hpp>
#include <portiona/vision/mock_detection_backend.hpp>
#include <portiona/vision/onnx_depth_backend.hpp>
#include <portiona/vision/onnx_detection_backend.hpp>
#include <portiona/vision/reference_decoder.hpp>
#include <algorithm>
#include <stdexcept>

namespace portiona::app {

namespace pc = portiona::core;
namespace pv = portiona::vision;

namespace {

std::vector<pv::MockDetection> demo_detections(const EstimatorConfig& config) {
  const auto& labels = config.reference_labels;
  const auto it = std::find(labels.begin(), labels.end(), "credit_card");
  if (it == labels.end()) {
    pc::logging::logger()->warn("mock detector: 'credit_card' missing from reference_labels");
    return {};
  }
  const auto class_id = static_cast<std::int64_t>(it - labels.begin());
  return {{class_id, 40.f, 40.f, 80.f, 50.f, kMockReferenceScore}};
}

}  // namespace

std::unique_ptr<pv::IReferenceObjectDetector> make_reference_detector(const EstimatorConfig& config) {
  pv::ReferenceObjectDetector::BackendFactory factory;
  switch (config.detector_backend) {
    case BackendType::None:
      return nullptr;
    case BackendType::Mock:
      factory = [detections = demo_detections(config)]() -> std::unique_ptr<pv::IDetectionBackend> {
        auto mock = std::make_unique<pv::MockDetectionBackend>();
        mock->set_detections(detections);
        return mock;
      };
      break;
    case BackendType::Onnx:
      if (config.detector_model_path.empty()) {
        throw std::invalid_argument("detector_backend=onnx requires detector_model_path");
      }
      factory = [path = config.detector_model_path, w = config.detector_input_width,
                 h = config.detector_input_height]() -> std::unique_ptr<pv::IDetectionBackend> {
        return std::make_unique<pv::OnnxDetectionBackend>(path, w, h);
      };
      break;
  }

  pv::ReferenceDecoder decoder(config.detector_confidence_threshold, config.reference_labels);
  pv::ModelInputOptions input{{config.detector_input_width, config.detector_input_height},
                              config.normalize_mean,
                              config.normalize_scale};
  return std::make_unique<pv::ReferenceObjectDetector>(std::move(factory), std::move(decoder),
                                                       input);
}

std::unique_ptr<pv::IDepthEstimator> make_depth_estimator(const EstimatorConfig& config) {
  pv::DepthEstimator::BackendFactory factory;
  switch (config.depth_backend) {
    case BackendType::None:
      return nullptr;
    case BackendType::Mock:
      factory = []() -> std::unique_ptr<pv::IDepthBackend> {
        auto mock = std::make_unique<pv::MockDepthBackend>();
        mock->set_uniform_depth(kMockDepthValue);
        return mock;
      };
      break;
    case BackendType::Onnx:
      if (config.depth_model_path.empty()) {
        throw std::invalid_argument("depth_backend=onnx requires depth_model_path");
      }
      factory = [path = config.depth_model_path, w = config.depth_input_width,
                 h = config.depth_input_height]() -> std::unique_ptr<pv::IDepthBackend> {
        return std::make_unique<pv::OnnxDepthBackend>(path, w, h);
      };
      break;
  }

  pv::DepthEstimatorOptions options;
  options.input = {{config.depth_input_width, config.depth_input_height},
                   config.normalize_mean,
                   config.normalize_scale};
  options.depth_scale = config.depth_scale;
  options.min_valid_fraction = config.min_valid_depth_fraction;
  return std::make_unique<pv::DepthEstimator>(std::move(factory), options);
}

std::shared_ptr<pc::IFoodDensityRepository> make_density_repository(const EstimatorConfig& config) {
  auto repo = std::make_shared<pc::InMemoryFoodDensityRepository>(
      pc::InMemoryFoodDensityRepository::with_seed_table());
  if (config.density_table_path.empty()) {
    return repo;
  }
  auto table = load_density_table(config.density_table_path);
  if (!table) {
    pc::logging::logger()->warn("density table '{}' not loaded ({}), using built-in table",
                                config.density_table_path, pc::to_string(table.error()));
    return repo;
  }
  for (const auto& [name, entry] : *table) {
    repo->upsert(name, entry);
  }
  return repo;
}

std::expected<void, pc::EstimationError> save_density_repository(
    const EstimatorConfig& config, const pc::IFoodDensityRepository& densities) {
  if (config.density_table_path.empty()) {
    return {};
  }
  auto saved = save_density_table(config.density_table_path, densities.snapshot());
  if (saved) {
    pc::logging::logger()->info("density table saved to '{}'", config.density_table_path);
  }
  return saved;
}

std::unique_ptr<VolumeEstimator> build_estimator(
    const EstimatorConfig& config,
    std::shared_ptr<pc::IFoodDensityRepository> densities) {
  if (!densities) {
    densities = make_density_repository(config);
  }
  EstimatorOptions options;
  options.min_reference_confidence = config.min_reference_confidence;
  return std::make_unique<VolumeEstimator>(std::move(densities), make_reference_detector(config),
                                           make_depth_estimator(config), options);
}

}  // namespace portiona::app
