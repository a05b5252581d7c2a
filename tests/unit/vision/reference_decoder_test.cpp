#include <portiona/vision/detection_backend.hpp>
#include <portiona/vision/reference_catalog.hpp>
#include <portiona/vision/reference_decoder.hpp>
#include <gtest/gtest.h>

namespace pv = portiona::vision;

namespace {

pv::RawDetections make_raw() {
  pv::RawDetections raw;
  raw.num_detections = 4;
  raw.boxes = {10.f, 20.f, 90.f, 70.f,     // credit_card
               0.f, 0.f, 24.f, 24.f,       // coin, low score
               5.f, 5.f, 15.f, 15.f,       // class 7, unmapped
               30.f, 30.f, 30.f, 40.f};    // zero width
  raw.scores = {0.9f, 0.3f, 0.95f, 0.99f};
  raw.class_ids = {0, 1, 7, 0};
  return raw;
}

}  // namespace

TEST(ReferenceDecoder, DecodesAboveThreshold) {
  pv::ReferenceDecoder decoder(0.5f, {"credit_card", "coin"});
  const auto out = decoder.decode(make_raw());
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].label, "credit_card");
  EXPECT_FLOAT_EQ(out[0].x, 10.f);
  EXPECT_FLOAT_EQ(out[0].y, 20.f);
  EXPECT_FLOAT_EQ(out[0].width, 80.f);
  EXPECT_FLOAT_EQ(out[0].height, 50.f);
  EXPECT_FLOAT_EQ(out[0].score, 0.9f);
}

TEST(ReferenceDecoder, LowerThresholdKeepsMore) {
  pv::ReferenceDecoder decoder(0.5f, {"credit_card", "coin"});
  decoder.set_confidence_threshold(0.2f);
  EXPECT_FLOAT_EQ(decoder.confidence_threshold(), 0.2f);
  const auto out = decoder.decode(make_raw());
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[1].label, "coin");
}

TEST(ReferenceDecoder, TruncatedBuffersStopDecoding) {
  pv::RawDetections raw = make_raw();
  raw.scores.resize(1);
  pv::ReferenceDecoder decoder(0.1f, {"credit_card", "coin"});
  EXPECT_EQ(decoder.decode(raw).size(), 1u);
}

TEST(ReferenceCatalog, HasSevenObjects) {
  EXPECT_EQ(pv::reference_catalog().size(), 7u);
}

TEST(ReferenceCatalog, CreditCardDimensions) {
  const auto card = pv::find_reference("credit_card");
  ASSERT_TRUE(card.has_value());
  EXPECT_DOUBLE_EQ(card->width, 8.56);
  EXPECT_DOUBLE_EQ(card->height, 5.398);
  ASSERT_TRUE(card->depth.has_value());
  EXPECT_DOUBLE_EQ(*card->depth, 0.076);
}

TEST(ReferenceCatalog, LookupIsCaseInsensitive) {
  EXPECT_TRUE(pv::find_reference("COIN").has_value());
  EXPECT_TRUE(pv::find_reference("Credit Card").has_value());
  const auto fork = pv::find_reference("fork");
  ASSERT_TRUE(fork.has_value());
  EXPECT_FALSE(fork->depth.has_value());
  EXPECT_FALSE(pv::find_reference("banana").has_value());
}
