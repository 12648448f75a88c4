#include <gtest/gtest.h>

#include "almanac/common/saturating.hpp"
#include "almanac/mapping/segment.hpp"

namespace almanac::mapping {
namespace {

using common::kMaxId;

TEST(SegmentTest, SourceEndIsStartPlusLength) {
  Segment segment{.source_start = 50, .destination_start = 200, .length = 10};
  EXPECT_EQ(segment.SourceEnd(), 60);
}

TEST(SegmentTest, CoversIsHalfOpen) {
  Segment segment{.source_start = 50, .destination_start = 200, .length = 10};
  EXPECT_FALSE(segment.Covers(49));
  EXPECT_TRUE(segment.Covers(50));
  EXPECT_TRUE(segment.Covers(59));
  EXPECT_FALSE(segment.Covers(60));
}

TEST(SegmentTest, TranslateAppliesOffset) {
  Segment segment{.source_start = 50, .destination_start = 200, .length = 10};
  EXPECT_EQ(segment.Translate(50), 200);
  EXPECT_EQ(segment.Translate(55), 205);
  EXPECT_EQ(segment.Translate(59), 209);
}

TEST(SegmentTest, TranslateDownwards) {
  Segment segment{.source_start = 98, .destination_start = 50, .length = 2};
  EXPECT_EQ(segment.Translate(98), 50);
  EXPECT_EQ(segment.Translate(99), 51);
}

// Segments at the top of the domain must not wrap around.
TEST(SegmentTest, SourceEndSaturates) {
  Segment segment{
      .source_start = kMaxId - 10, .destination_start = 0, .length = 100};
  EXPECT_EQ(segment.SourceEnd(), kMaxId);
  EXPECT_TRUE(segment.Covers(kMaxId - 1));
  EXPECT_FALSE(segment.Covers(kMaxId));
  EXPECT_FALSE(segment.Covers(0));
}

TEST(SegmentTest, TranslateSaturates) {
  Segment segment{
      .source_start = 10, .destination_start = kMaxId - 5, .length = 100};
  EXPECT_EQ(segment.Translate(10), kMaxId - 5);
  EXPECT_EQ(segment.Translate(15), kMaxId);
  EXPECT_EQ(segment.Translate(50), kMaxId);
}

}  // namespace
}  // namespace almanac::mapping
