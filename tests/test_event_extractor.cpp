// Event extraction tests

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>

#include "soundscan/event_extractor.hpp"

namespace soundscan {
namespace {

/// Single-class matrix with the given per-frame scores
ScoreMatrix column_of(const std::vector<float> &scores) {
  return ScoreMatrix(scores.size(), 1, scores);
}

TEST(EventExtractorTest, MaxPoolKeepsShortTail) {
  auto pooled = max_pool({0.1f, 0.5f, 0.2f, 0.3f, 0.9f, 0.0f, 0.4f}, 3);
  ASSERT_EQ(pooled.size(), 3u);
  EXPECT_FLOAT_EQ(pooled[0], 0.5f);
  EXPECT_FLOAT_EQ(pooled[1], 0.9f);
  EXPECT_FLOAT_EQ(pooled[2], 0.4f);
}

// -----------------------------------------------------------------------------
// Pool of two frames, 50% threshold
// -----------------------------------------------------------------------------
TEST(EventExtractorTest, PooledWindowsAboveThreshold) {
  auto scores = column_of({0.05f, 0.95f, 0.10f, 0.80f, 0.0f});

  auto events = extract_events(scores, 0, 2, 0.0, 50);
  ASSERT_EQ(events.size(), 2u);
  EXPECT_DOUBLE_EQ(events[0].timestamp_seconds, 0.0);
  EXPECT_EQ(events[0].confidence_percent, 95);
  EXPECT_DOUBLE_EQ(events[1].timestamp_seconds, 0.02);
  EXPECT_EQ(events[1].confidence_percent, 80);
}

TEST(EventExtractorTest, HigherThresholdNeverAddsEvents) {
  auto scores = column_of({0.2f, 0.45f, 0.7f, 0.99f, 0.3f, 0.55f});
  std::size_t previous = SIZE_MAX;
  for (double t : {0.0, 20.0, 45.0, 55.0, 70.0, 99.0, 100.0}) {
    std::size_t n = extract_events(scores, 0, 1, 0.0, t).size();
    EXPECT_LE(n, previous) << "threshold " << t;
    previous = n;
  }
  EXPECT_EQ(extract_events(scores, 0, 1, 0.0, 0.0).size(), 6u);
  EXPECT_EQ(extract_events(scores, 0, 1, 0.0, 100.0).size(), 0u);
}

TEST(EventExtractorTest, TimestampsIncludeFrameOffset) {
  std::vector<float> frames(250, 0.0f);
  frames[0] = 0.9f;
  frames[150] = 0.6f;
  frames[249] = 0.3f;
  auto scores = column_of(frames);

  auto events = extract_events(scores, 0, 100, 30.0, 25);
  ASSERT_EQ(events.size(), 3u);
  EXPECT_DOUBLE_EQ(events[0].timestamp_seconds, 30.0);
  EXPECT_DOUBLE_EQ(events[1].timestamp_seconds, 31.0);
  EXPECT_DOUBLE_EQ(events[2].timestamp_seconds, 32.0);
  EXPECT_EQ(events[2].confidence_percent, 30);
}

TEST(EventExtractorTest, PicksRequestedClassColumn) {
  // 2 frames x 3 classes, row-major
  ScoreMatrix scores(2, 3, {0.1f, 0.9f, 0.2f, 0.1f, 0.1f, 0.8f});

  auto c1 = extract_events(scores, 1, 1, 0.0, 50);
  ASSERT_EQ(c1.size(), 1u);
  EXPECT_DOUBLE_EQ(c1[0].timestamp_seconds, 0.0);

  auto c2 = extract_events(scores, 2, 1, 0.0, 50);
  ASSERT_EQ(c2.size(), 1u);
  EXPECT_DOUBLE_EQ(c2[0].timestamp_seconds, 0.01);
}

TEST(EventExtractorTest, UnknownClassThrows) {
  auto scores = column_of({0.5f});
  EXPECT_THROW(extract_events(scores, 3, 1, 0.0, 20), std::out_of_range);
}

TEST(EventExtractorTest, FormatDetection) {
  EXPECT_EQ(format_detection({3725.0, 87}), "01:02:05 87%");
  EXPECT_EQ(format_detection({0.02, 95}), "00:00:00 95%");
}

} // namespace
} // namespace soundscan
