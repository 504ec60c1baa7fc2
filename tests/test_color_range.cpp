#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <vector>

#include "hand_gesture_perception/segmentation/color_range.hpp"

using namespace hgp::segmentation;

TEST(MakeRangeTest, BuildsValidRange)
{
  const HsvRange r = makeRange({100, 120, 70}, {130, 255, 255}, "blue");

  EXPECT_EQ(r.lower, (std::array<int, 3>{100, 120, 70}));
  EXPECT_EQ(r.upper, (std::array<int, 3>{130, 255, 255}));
}

TEST(MakeRangeTest, OversizedValueDoesNotWrap)
{
  // 2^32 + 10 narrows to 10 as int
  const int64_t huge = 4294967306LL;

  EXPECT_THROW(
    makeRange({huge, 120, 70}, {130, 255, 255}, "blue"),
    std::invalid_argument);
  EXPECT_THROW(
    makeRange({100, 120, 70}, {130, huge, 255}, "blue"),
    std::invalid_argument);
}

TEST(MakeRangeTest, OutOfDomainThrows)
{
  EXPECT_THROW(makeRange({-1, 120, 70}, {130, 255, 255}, "blue"), std::invalid_argument);
  EXPECT_THROW(makeRange({100, 120, 70}, {181, 255, 255}, "blue"), std::invalid_argument);
  EXPECT_THROW(makeRange({100, 120, 70}, {130, 256, 255}, "blue"), std::invalid_argument);
}

TEST(MakeRangeTest, WrongChannelCountThrows)
{
  EXPECT_THROW(makeRange({100, 120}, {130, 255, 255}, "blue"), std::invalid_argument);
  EXPECT_THROW(makeRange({100, 120, 70}, {130, 255, 255, 0}, "blue"), std::invalid_argument);
}

TEST(MakeRangeTest, InvertedBoundsThrow)
{
  EXPECT_THROW(makeRange({130, 120, 70}, {100, 255, 255}, "blue"), std::invalid_argument);
}

TEST(TrackedColorTest, ValidationRequiresNameAndRanges)
{
  TrackedColor c;
  c.ranges.push_back(HsvRange{{100, 120, 70}, {130, 255, 255}});
  EXPECT_THROW(validateTrackedColor(c), std::invalid_argument);

  c.name = "blue";
  EXPECT_NO_THROW(validateTrackedColor(c));

  c.ranges.clear();
  EXPECT_THROW(validateTrackedColor(c), std::invalid_argument);
}
