#include <portiona/core/frame.hpp>
#include <portiona/vision/color_convert_stage.hpp>
#include <portiona/vision/model_input.hpp>
#include <portiona/vision/normalize_stage.hpp>
#include <portiona/vision/resize_stage.hpp>
#include <gtest/gtest.h>
#include <cstring>
#include <vector>

namespace pc = portiona::core;
namespace pv = portiona::vision;

namespace {

/// w x h frame where every pixel is (b0, b1, b2).
pc::Frame solid_frame(std::uint32_t w, std::uint32_t h, pc::PixelFormat format,
                      unsigned char b0, unsigned char b1, unsigned char b2) {
  std::vector<std::byte> buf(static_cast<std::size_t>(w) * h * 3);
  for (std::size_t i = 0; i < buf.size(); i += 3) {
    buf[i] = std::byte{b0};
    buf[i + 1] = std::byte{b1};
    buf[i + 2] = std::byte{b2};
  }
  return pc::Frame(w, h, format, std::move(buf));
}

float float_at(const pc::Frame& f, std::size_t index) {
  float v = 0.f;
  std::memcpy(&v, f.data().data() + index * sizeof(float), sizeof(float));
  return v;
}

}  // namespace

TEST(ResizeStage, ResizesToTarget) {
  pv::ResizeStage stage(16, 8);
  auto out = stage.process(solid_frame(64, 32, pc::PixelFormat::RGB8, 10, 20, 30));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->width(), 16u);
  EXPECT_EQ(out->height(), 8u);
  EXPECT_EQ(out->format(), pc::PixelFormat::RGB8);
  EXPECT_EQ(out->data()[1], std::byte{20});
}

TEST(ResizeStage, RejectsEmptyFrameAndZeroTarget) {
  pv::ResizeStage stage(16, 8);
  auto empty = stage.process(pc::Frame{});
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error(), pc::EstimationError::InvalidFrame);

  pv::ResizeStage zero(0, 8);
  auto bad = zero.process(solid_frame(4, 4, pc::PixelFormat::RGB8, 0, 0, 0));
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error(), pc::EstimationError::InvalidConfig);
}

TEST(ColorConvertStage, SwapsBgrToRgb) {
  pv::ColorConvertStage stage(pc::PixelFormat::RGB8);
  auto out = stage.process(solid_frame(4, 4, pc::PixelFormat::BGR8, 1, 2, 3));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->format(), pc::PixelFormat::RGB8);
  EXPECT_EQ(out->data()[0], std::byte{3});
  EXPECT_EQ(out->data()[2], std::byte{1});
}

TEST(ColorConvertStage, TrailingBytesDoNotSkewRows) {
  // 3x2 BGR8; row 0 is (1,2,3), row 1 is (4,5,6), then 5 bytes of padding.
  std::vector<std::byte> buf;
  for (int i = 0; i < 3; ++i) buf.insert(buf.end(), {std::byte{1}, std::byte{2}, std::byte{3}});
  for (int i = 0; i < 3; ++i) buf.insert(buf.end(), {std::byte{4}, std::byte{5}, std::byte{6}});
  buf.resize(buf.size() + 5, std::byte{99});

  pv::ColorConvertStage stage(pc::PixelFormat::RGB8);
  auto out = stage.process(pc::Frame(3, 2, pc::PixelFormat::BGR8, std::move(buf)));
  ASSERT_TRUE(out.has_value());
  ASSERT_EQ(out->size_bytes(), pc::Frame::min_bytes(3, 2, pc::PixelFormat::RGB8));
  EXPECT_EQ(out->data()[9], std::byte{6});
  EXPECT_EQ(out->data()[17], std::byte{4});
}

TEST(ColorConvertStage, UnsupportedConversionFails) {
  pv::ColorConvertStage stage(pc::PixelFormat::Float32RGB);
  auto out = stage.process(solid_frame(4, 4, pc::PixelFormat::RGB8, 1, 2, 3));
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), pc::EstimationError::InvalidFrame);
}

TEST(NormalizeStage, ProducesFloatRgb) {
  pv::NormalizeStage stage(0.f, 1.f / 255.f);
  auto out = stage.process(solid_frame(2, 2, pc::PixelFormat::RGB8, 255, 0, 51));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->format(), pc::PixelFormat::Float32RGB);
  EXPECT_EQ(out->size_bytes(), pc::Frame::min_bytes(2, 2, pc::PixelFormat::Float32RGB));
  EXPECT_NEAR(float_at(*out, 0), 1.f, 1e-6f);
  EXPECT_NEAR(float_at(*out, 1), 0.f, 1e-6f);
  EXPECT_NEAR(float_at(*out, 2), 0.2f, 1e-6f);
}

TEST(NormalizeStage, RejectsGrayscale) {
  pv::NormalizeStage stage(0.f, 1.f);
  pc::Frame gray(2, 2, pc::PixelFormat::Grayscale8, std::vector<std::byte>(4));
  EXPECT_FALSE(stage.process(gray).has_value());
}

TEST(ModelInput, PipelineConvertsCameraFrameToModelInput) {
  auto pipeline = pv::make_model_input_pipeline({{32, 24}, 0.f, 1.f / 255.f});
  EXPECT_EQ(pipeline.stage_count(), 3u);
  auto out = pipeline.run(solid_frame(64, 48, pc::PixelFormat::BGR8, 0, 0, 255));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->format(), pc::PixelFormat::Float32RGB);
  EXPECT_EQ(out->width(), 32u);
  EXPECT_EQ(out->height(), 24u);
  // Red ends up in the first channel after BGR -> RGB.
  EXPECT_NEAR(float_at(*out, 0), 1.f, 1e-6f);
  EXPECT_NEAR(float_at(*out, 2), 0.f, 1e-6f);
}
