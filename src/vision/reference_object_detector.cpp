#include <portiona/vision/reference_object_detector.hpp>
#include <portiona/core/logging.hpp>
#include <portiona/vision/reference_catalog.hpp>
#include <algorithm>
#include <utility>

namespace portiona::vision {

namespace pc = portiona::core;

namespace {

pc::ReferenceObject to_reference_object(const CatalogEntry& entry,
                                        const LabeledDetection& d,
                                        double sx,
                                        double sy) {
  pc::ReferenceObject obj;
  obj.name = std::string(entry.display_name);
  obj.pixel_size = {d.width * sx, d.height * sy};
  obj.real_world_size = {entry.width, entry.height, entry.depth};
  obj.confidence = std::clamp(static_cast<double>(d.score), 0.0, 1.0);

  const bool box_landscape = obj.pixel_size.width >= obj.pixel_size.height;
  const bool real_landscape = entry.width >= entry.height;
  if (entry.width != entry.height && box_landscape != real_landscape) {
    std::swap(obj.real_world_size.width, obj.real_world_size.height);
  }
  return obj;
}

}  // namespace

ReferenceObjectDetector::ReferenceObjectDetector(BackendFactory factory,
                                                 ReferenceDecoder decoder,
                                                 ModelInputOptions input_options)
    : model_("reference-detector", std::move(factory)),
      decoder_(std::move(decoder)),
      input_options_(input_options) {}

bool ReferenceObjectDetector::reinitialize() {
  std::lock_guard lock(inference_mutex_);
  return model_.reinitialize();
}

std::vector<pc::ReferenceObject> ReferenceObjectDetector::detect(const pc::Frame& image) {
  std::vector<pc::ReferenceObject> out;
  if (!image.is_consistent()) {
    return out;
  }

  std::lock_guard lock(inference_mutex_);
  IDetectionBackend* backend = model_.get();
  if (!backend) {
    return out;
  }

  ModelInputOptions options = input_options_;
  if (auto size = backend->input_size()) {
    options.size = *size;
  }
  auto pipeline = make_model_input_pipeline(options);
  auto prepared = pipeline.run(image);
  if (!prepared) {
    pc::logging::logger()->warn("reference detection: preprocessing failed: {}",
                                pc::to_string(prepared.error()));
    return out;
  }

  auto raw = backend->infer(*prepared);
  if (!raw) {
    pc::logging::logger()->warn("reference detection: inference failed: {}",
                                pc::to_string(raw.error()));
    return out;
  }

  const double sx = static_cast<double>(image.width()) / options.size.width;
  const double sy = static_cast<double>(image.height()) / options.size.height;
  for (const auto& d : decoder_.decode(*raw)) {
    const auto entry = find_reference(d.label);
    if (!entry) {
      pc::logging::logger()->debug("reference detection: label '{}' not in catalog", d.label);
      continue;
    }
    out.push_back(to_reference_object(*entry, d, sx, sy));
  }

  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.confidence > b.confidence;
  });
  pc::logging::logger()->debug("reference detection: {} object(s)", out.size());
  return out;
}

}  // namespace portiona::vision
