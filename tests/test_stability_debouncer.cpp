#include <gtest/gtest.h>

#include <stdexcept>

#include "hand_gesture_perception/consensus/stability_debouncer.hpp"

using hgp::consensus::StabilityDebouncer;

TEST(StabilityDebouncerTest, RejectsNonPositiveRequirement)
{
  EXPECT_THROW(StabilityDebouncer<int>(0), std::invalid_argument);
  EXPECT_THROW(StabilityDebouncer<int>(-3), std::invalid_argument);
}

TEST(StabilityDebouncerTest, BecomesStableAfterRequiredRepeats)
{
  StabilityDebouncer<int> d(3);

  EXPECT_EQ(d.update(7), 1);
  EXPECT_FALSE(d.isStable());
  EXPECT_EQ(d.update(7), 2);
  EXPECT_FALSE(d.isStable());
  EXPECT_EQ(d.update(7), 3);
  EXPECT_TRUE(d.isStable());

  // Stays stable while the value holds
  EXPECT_EQ(d.update(7), 4);
  EXPECT_TRUE(d.isStable());
}

TEST(StabilityDebouncerTest, DifferentValueRestartsAtOne)
{
  StabilityDebouncer<int> d(2);

  d.update(1);
  d.update(1);
  ASSERT_TRUE(d.isStable());

  EXPECT_EQ(d.update(2), 1);
  EXPECT_FALSE(d.isStable());
  ASSERT_TRUE(d.lastValue().has_value());
  EXPECT_EQ(*d.lastValue(), 2);
}

TEST(StabilityDebouncerTest, AbsentValueClearsStreak)
{
  StabilityDebouncer<int> d(2);

  d.update(5);
  EXPECT_EQ(d.update(std::nullopt), 0);
  EXPECT_FALSE(d.lastValue().has_value());

  // Gap breaks the run: 5, none, 5 is not two in a row
  EXPECT_EQ(d.update(5), 1);
  EXPECT_FALSE(d.isStable());
}

TEST(StabilityDebouncerTest, ResetForgetsEverything)
{
  StabilityDebouncer<int> d(1);
  d.update(4);
  ASSERT_TRUE(d.isStable());

  d.reset();
  EXPECT_EQ(d.streak(), 0);
  EXPECT_FALSE(d.isStable());
  EXPECT_FALSE(d.lastValue().has_value());
  EXPECT_EQ(d.required(), 1);
}

TEST(StabilityDebouncerTest, UsesCustomEquality)
{
  // Treat values with the same parity as equal
  const auto same_parity = [](int a, int b) {return (a % 2) == (b % 2);};
  StabilityDebouncer<int, decltype(same_parity)> d(3, same_parity);

  d.update(2);
  d.update(4);
  d.update(6);
  EXPECT_TRUE(d.isStable());

  EXPECT_EQ(d.update(7), 1);
}
