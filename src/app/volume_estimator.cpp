#include <portiona/app/volume_estimator.hpp>
#include <portiona/core/logging.hpp>
#include <portiona/core/volume_calculator.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <future>
#include <limits>
#include <optional>
#include <stdexcept>
#include <vector>

namespace portiona::app {

namespace pc = portiona::core;

namespace {

/// Rounds to whole units, saturating to [0, INT64_MAX]; NaN maps to 0.
std::int64_t rounded_count(double value) noexcept {
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  if (!(value > 0.0)) return 0;
  if (value >= static_cast<double>(kMax)) return kMax;
  return std::llround(value);
}

/// Rounds at the result boundary; weight uses the unrounded volume.
pc::VolumeEstimationResult make_result(const pc::BoundingBox& box,
                                       pc::ShapeAnalysis shape,
                                       double volume_ml,
                                       double density,
                                       double confidence,
                                       pc::Evidence evidence) {
  const double volume = std::max(volume_ml, 0.0);
  const double used_density = std::max(density, 0.0);

  pc::VolumeEstimationResult r;
  r.estimated_volume = rounded_count(volume);
  r.estimated_weight = rounded_count(volume * used_density);
  r.confidence = std::clamp(confidence, 0.0, 1.0);
  r.density = used_density;
  r.bounding_box = box;
  r.shape_analysis = std::move(shape);
  r.evidence = std::move(evidence);
  return r;
}

pc::ShapeAnalysis with_dimensions(pc::ShapeAnalysis shape, const pc::Dimensions& d) {
  shape.dimensions = d;
  shape.surface_area = pc::surface_area_for(shape.shape, d);
  return shape;
}

const pc::ReferenceObject* first_usable_reference(
    const std::vector<pc::ReferenceObject>& references,
    double min_confidence) {
  for (const auto& ref : references) {
    if (ref.confidence > min_confidence && ref.has_usable_scale()) {
      return &ref;
    }
  }
  return nullptr;
}

}  // namespace

double heuristic_volume_multiplier(pc::FoodShape shape) noexcept {
  switch (shape) {
    case pc::FoodShape::Spherical:
      return 0.5;
    case pc::FoodShape::Cylindrical:
      return 0.6;
    case pc::FoodShape::Rectangular:
      return 0.8;
    case pc::FoodShape::Irregular:
    default:
      return 0.4;
  }
}

pc::VolumeEstimationResult estimate_from_reference(const pc::BoundingBox& box,
                                                   const pc::ShapeAnalysis& shape,
                                                   const pc::ReferenceObject& reference,
                                                   double density) {
  const double scale_x = reference.real_world_size.width / reference.pixel_size.width;
  const double scale_y = reference.real_world_size.height / reference.pixel_size.height;
  const double cm_per_pixel = (scale_x + scale_y) / 2.0;

  const double real_width = box.width * cm_per_pixel;
  const double real_height = box.height * cm_per_pixel;
  const pc::Dimensions dims{real_width, real_height,
                            std::min(real_width, real_height) * kReferenceHeightRatio};

  const double volume = pc::volume_for(shape.shape, dims);
  return make_result(box, with_dimensions(shape, dims), volume, density,
                     reference.confidence * kReferenceConfidenceFactor,
                     pc::ReferenceObjectEvidence{reference, cm_per_pixel});
}

pc::VolumeEstimationResult estimate_from_depth(const pc::BoundingBox& box,
                                               const pc::ShapeAnalysis& shape,
                                               const pc::DepthEstimate& depth,
                                               double density) {
  const double real_width = box.width * kDepthPathCmPerPixel;
  const double real_height = box.height * kDepthPathCmPerPixel;
  const double measured = std::max(depth.average_depth, 0.0);

  pc::Dimensions dims{real_width, real_height, measured};
  std::optional<double> axial;
  if (shape.shape == pc::FoodShape::Spherical) {
    // The sphere cannot be deeper than what the depth model saw.
    dims.length = std::min(real_width, measured);
    dims.width = std::min(real_height, measured);
  } else if (shape.shape == pc::FoodShape::Cylindrical) {
    axial = measured;
  }

  const double volume = pc::volume_for(shape.shape, dims, axial);
  return make_result(box, with_dimensions(shape, dims), volume, density, kDepthConfidence,
                     pc::DepthEvidence{depth, kDepthPathCmPerPixel});
}

pc::VolumeEstimationResult estimate_from_heuristic(const pc::BoundingBox& box,
                                                   const pc::ShapeAnalysis& shape,
                                                   double density) {
  const double multiplier = heuristic_volume_multiplier(shape.shape);
  const double volume = std::sqrt(box.area()) * multiplier * kHeuristicAreaToVolume;
  return make_result(box, shape, volume, density, kHeuristicConfidence,
                     pc::HeuristicEvidence{multiplier});
}

VolumeEstimator::VolumeEstimator(std::shared_ptr<pc::IFoodDensityRepository> densities,
                                 std::unique_ptr<portiona::vision::IReferenceObjectDetector> detector,
                                 std::unique_ptr<portiona::vision::IDepthEstimator> depth,
                                 EstimatorOptions options)
    : densities_(std::move(densities)),
      detector_(std::move(detector)),
      depth_(std::move(depth)),
      options_(options) {
  if (!densities_) {
    throw std::invalid_argument("VolumeEstimator: density repository is required");
  }
}

std::expected<pc::VolumeEstimationResult, pc::EstimationError> VolumeEstimator::estimate(
    const pc::Frame& image,
    std::string_view food_name,
    pc::FoodCategory category,
    const pc::BoundingBox& box) const {
  if (!box.is_valid()) {
    return std::unexpected(pc::EstimationError::InvalidBoundingBox);
  }
  if (pc::normalize_food_name(food_name).empty()) {
    return std::unexpected(pc::EstimationError::MissingFoodName);
  }

  // Detection and depth are independent reads of the same frame.
  std::future<std::vector<pc::ReferenceObject>> references_task;
  if (detector_) {
    references_task = std::async(std::launch::async,
                                 [this, &image]() { return detector_->detect(image); });
  }
  const pc::DepthEstimate depth =
      depth_ ? depth_->estimate(image, box) : pc::DepthEstimate::none();
  const std::vector<pc::ReferenceObject> references =
      references_task.valid() ? references_task.get() : std::vector<pc::ReferenceObject>{};

  const auto entry = densities_->find(food_name);
  const double density = entry ? entry->density : pc::default_density_entry().density;
  const pc::FoodShape prior = portiona::vision::resolve_shape_prior(food_name, entry);
  const pc::ShapeAnalysis shape = shape_analyzer_.analyze(box, prior);

  pc::VolumeEstimationResult result;
  if (const auto* reference = first_usable_reference(references, options_.min_reference_confidence)) {
    result = estimate_from_reference(box, shape, *reference, density);
  } else if (depth.has_depth_data) {
    result = estimate_from_depth(box, shape, depth, density);
  } else {
    result = estimate_from_heuristic(box, shape, density);
  }

  pc::logging::logger()->debug(
      "estimate '{}' ({}{}): method={} shape={} volume={}ml weight={}g confidence={:.2f}",
      food_name, pc::to_string(category), entry ? "" : ", default density",
      pc::to_string(result.method()), pc::to_string(result.shape_analysis.shape),
      result.estimated_volume, result.estimated_weight, result.confidence);
  return result;
}

}  // namespace portiona::app
