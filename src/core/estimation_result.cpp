#include <portiona/core/estimation_result.hpp>

namespace portiona::core {

std::string_view to_string(EstimationMethod method) noexcept {
  switch (method) {
    case EstimationMethod::ReferenceObject:
      return "reference_object";
    case EstimationMethod::DepthAnalysis:
      return "3d_analysis";
    case EstimationMethod::MlEstimation:
      return "ml_estimation";
  }
  return "ml_estimation";
}

EstimationMethod VolumeEstimationResult::method() const noexcept {
  if (std::holds_alternative<ReferenceObjectEvidence>(evidence)) {
    return EstimationMethod::ReferenceObject;
  }
  if (std::holds_alternative<DepthEvidence>(evidence)) {
    return EstimationMethod::DepthAnalysis;
  }
  return EstimationMethod::MlEstimation;
}

const DepthEstimate* VolumeEstimationResult::depth_estimation() const noexcept {
  if (const auto* arm = std::get_if<DepthEvidence>(&evidence)) {
    return &arm->depth;
  }
  return nullptr;
}

const ReferenceObject* VolumeEstimationResult::reference_object() const noexcept {
  if (const auto* arm = std::get_if<ReferenceObjectEvidence>(&evidence)) {
    return &arm->reference;
  }
  return nullptr;
}

}  // namespace portiona::core
