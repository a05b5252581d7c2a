#include <portiona/vision/model_input.hpp>
#include <portiona/vision/color_convert_stage.hpp>
#include <portiona/vision/normalize_stage.hpp>
#include <portiona/vision/resize_stage.hpp>
#include <memory>

namespace portiona::vision {

portiona::core::FramePipeline make_model_input_pipeline(const ModelInputOptions& options) {
  portiona::core::FramePipeline pipeline;
  pipeline.add_stage(std::make_unique<ColorConvertStage>(portiona::core::PixelFormat::RGB8));
  pipeline.add_stage(std::make_unique<ResizeStage>(options.size.width, options.size.height));
  pipeline.add_stage(std::make_unique<NormalizeStage>(options.mean, options.scale));
  return pipeline;
}

}  // namespace portiona::vision
