#include <portiona/core/frame.hpp>
#include <portiona/vision/depth_estimator.hpp>
#include <portiona/vision/mock_depth_backend.hpp>
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <memory>
#include <vector>

namespace pc = portiona::core;
namespace pv = portiona::vision;

namespace {

pc::Frame bgr_frame(std::uint32_t w, std::uint32_t h) {
  std::vector<std::byte> buf(static_cast<std::size_t>(w) * h * 3, std::byte{60});
  return pc::Frame(w, h, pc::PixelFormat::BGR8, std::move(buf));
}

pv::DepthEstimatorOptions small_input() {
  pv::DepthEstimatorOptions options;
  options.input.size = {32, 32};
  return options;
}

}  // namespace

TEST(SummarizeDepth, UniformMap) {
  pv::DepthMap map{2, 2, {6.f, 6.f, 6.f, 6.f}};
  const auto d = pv::summarize_depth(map, 1.0, 0.5);
  EXPECT_TRUE(d.has_depth_data);
  EXPECT_DOUBLE_EQ(d.average_depth, 6.0);
  EXPECT_DOUBLE_EQ(d.depth_variance, 0.0);
}

TEST(SummarizeDepth, MeanAndPopulationVarianceScaled) {
  pv::DepthMap map{2, 2, {1.f, 2.f, 3.f, 4.f}};
  const auto d = pv::summarize_depth(map, 2.0, 0.5);
  EXPECT_TRUE(d.has_depth_data);
  EXPECT_NEAR(d.average_depth, 5.0, 1e-12);
  EXPECT_NEAR(d.depth_variance, 1.25 * 4.0, 1e-12);
}

TEST(SummarizeDepth, InvalidSamplesAreIgnored) {
  const float nan = std::numeric_limits<float>::quiet_NaN();
  pv::DepthMap map{2, 2, {4.f, nan, -1.f, 4.f}};
  const auto d = pv::summarize_depth(map, 1.0, 0.5);
  EXPECT_TRUE(d.has_depth_data);
  EXPECT_DOUBLE_EQ(d.average_depth, 4.0);
}

TEST(SummarizeDepth, TooFewValidSamplesIsNoData) {
  pv::DepthMap map{2, 2, {4.f, 0.f, 0.f, 0.f}};
  const auto d = pv::summarize_depth(map, 1.0, 0.5);
  EXPECT_FALSE(d.has_depth_data);
  EXPECT_DOUBLE_EQ(d.average_depth, 0.0);
  EXPECT_DOUBLE_EQ(d.depth_variance, 0.0);
  EXPECT_FALSE(pv::summarize_depth(pv::DepthMap{}, 1.0, 0.0).has_depth_data);
}

TEST(DepthEstimator, UsesBackendForCroppedRegion) {
  pv::MockDepthBackend* raw = nullptr;
  pv::DepthEstimator estimator(
      [&raw]() -> std::unique_ptr<pv::IDepthBackend> {
        auto mock = std::make_unique<pv::MockDepthBackend>();
        mock->set_uniform_depth(6.f);
        raw = mock.get();
        return mock;
      },
      small_input());
  const auto d = estimator.estimate(bgr_frame(64, 64), {8.0, 8.0, 32.0, 24.0});
  EXPECT_TRUE(d.has_depth_data);
  EXPECT_DOUBLE_EQ(d.average_depth, 6.0);
  EXPECT_EQ(estimator.model_state(), pc::ModelState::Ready);
  ASSERT_NE(raw, nullptr);
  EXPECT_EQ(raw->infer_count(), 1u);
}

TEST(DepthEstimator, BoxOutsideFrameIsNoData) {
  pv::MockDepthBackend* raw = nullptr;
  pv::DepthEstimator estimator(
      [&raw]() -> std::unique_ptr<pv::IDepthBackend> {
        auto mock = std::make_unique<pv::MockDepthBackend>();
        mock->set_uniform_depth(6.f);
        raw = mock.get();
        return mock;
      },
      small_input());
  const auto d = estimator.estimate(bgr_frame(64, 64), {200.0, 200.0, 10.0, 10.0});
  EXPECT_FALSE(d.has_depth_data);
  ASSERT_NE(raw, nullptr);
  EXPECT_EQ(raw->infer_count(), 0u);
}

TEST(DepthEstimator, InferenceFailureIsNoData) {
  pv::DepthEstimator estimator(
      []() -> std::unique_ptr<pv::IDepthBackend> {
        auto mock = std::make_unique<pv::MockDepthBackend>();
        mock->set_uniform_depth(6.f);
        mock->set_failure(true);
        return mock;
      },
      small_input());
  EXPECT_FALSE(estimator.estimate(bgr_frame(64, 64), {0.0, 0.0, 32.0, 32.0}).has_depth_data);
}

TEST(DepthEstimator, MissingBackendIsNoData) {
  pv::DepthEstimator estimator(nullptr);
  EXPECT_FALSE(estimator.estimate(bgr_frame(64, 64), {0.0, 0.0, 32.0, 32.0}).has_depth_data);
  EXPECT_EQ(estimator.model_state(), pc::ModelState::Unavailable);
}

TEST(DepthEstimator, ScaleAppliesToModelUnits) {
  pv::DepthEstimatorOptions options = small_input();
  options.depth_scale = 0.5;
  pv::DepthEstimator estimator(
      []() -> std::unique_ptr<pv::IDepthBackend> {
        auto mock = std::make_unique<pv::MockDepthBackend>();
        mock->set_uniform_depth(10.f);
        return mock;
      },
      options);
  const auto d = estimator.estimate(bgr_frame(64, 64), {0.0, 0.0, 64.0, 64.0});
  EXPECT_TRUE(d.has_depth_data);
  EXPECT_DOUBLE_EQ(d.average_depth, 5.0);
}

namespace {

pv::DepthEstimator uniform_depth_estimator(float depth) {
  return pv::DepthEstimator(
      [depth]() -> std::unique_ptr<pv::IDepthBackend> {
        auto mock = std::make_unique<pv::MockDepthBackend>();
        mock->set_uniform_depth(depth);
        return mock;
      },
      small_input());
}

}  // namespace

TEST(DepthEstimator, PaddedFloatFrameDoesNotThrow) {
  // 10x10 Float32RGB needs 1200 bytes; 10 surplus bytes is not a whole float per row.
  std::vector<std::byte> buf(pc::Frame::min_bytes(10, 10, pc::PixelFormat::Float32RGB) + 10);
  const pc::Frame frame(10, 10, pc::PixelFormat::Float32RGB, std::move(buf));
  ASSERT_TRUE(frame.is_consistent());

  auto estimator = uniform_depth_estimator(6.f);
  EXPECT_NO_THROW((void)estimator.estimate(frame, {0.0, 0.0, 10.0, 10.0}));
}

TEST(DepthEstimator, PaddedByteFrameIsEstimated) {
  std::vector<std::byte> buf(pc::Frame::min_bytes(10, 10, pc::PixelFormat::BGR8) + 7,
                             std::byte{60});
  const pc::Frame frame(10, 10, pc::PixelFormat::BGR8, std::move(buf));

  auto estimator = uniform_depth_estimator(6.f);
  const auto d = estimator.estimate(frame, {2.0, 2.0, 6.0, 6.0});
  EXPECT_TRUE(d.has_depth_data);
  EXPECT_DOUBLE_EQ(d.average_depth, 6.0);
}
