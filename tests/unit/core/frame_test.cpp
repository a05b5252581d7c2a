#include <portiona/core/frame.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace pc = portiona::core;

TEST(Frame, DefaultIsEmptyAndInconsistent) {
  pc::Frame f;
  EXPECT_EQ(f.width(), 0u);
  EXPECT_EQ(f.height(), 0u);
  EXPECT_TRUE(f.empty());
  EXPECT_FALSE(f.is_consistent());
}

TEST(Frame, ConstructFromBuffer) {
  std::vector<std::byte> buf(100 * 80 * 3);
  pc::Frame f(100, 80, pc::PixelFormat::BGR8, std::move(buf));
  EXPECT_EQ(f.width(), 100u);
  EXPECT_EQ(f.height(), 80u);
  EXPECT_EQ(f.format(), pc::PixelFormat::BGR8);
  EXPECT_EQ(f.size_bytes(), 100u * 80 * 3);
  EXPECT_TRUE(f.is_consistent());
}

TEST(Frame, ShortBufferIsInconsistent) {
  std::vector<std::byte> buf(10);
  pc::Frame f(10, 10, pc::PixelFormat::RGB8, std::move(buf));
  EXPECT_FALSE(f.empty());
  EXPECT_FALSE(f.is_consistent());
}

TEST(Frame, MinBytes) {
  EXPECT_EQ(pc::Frame::min_bytes(10, 10, pc::PixelFormat::Grayscale8), 100u);
  EXPECT_EQ(pc::Frame::min_bytes(10, 10, pc::PixelFormat::RGB8), 300u);
  EXPECT_EQ(pc::Frame::min_bytes(10, 10, pc::PixelFormat::BGRA8), 400u);
  EXPECT_EQ(pc::Frame::min_bytes(10, 10, pc::PixelFormat::Float32RGB), 10u * 10 * 3 * 4);
  EXPECT_EQ(pc::Frame::min_bytes(10, 10, pc::PixelFormat::Unknown), 0u);
}
