#include <gtest/gtest.h>

#include <stdexcept>

#include "hand_gesture_perception/gesture/gesture_smoother.hpp"

using hgp::Gesture;
using hgp::gesture::GestureSmoother;

TEST(GestureSmootherTest, ZeroWindowThrows)
{
  EXPECT_THROW(GestureSmoother(0), std::invalid_argument);
}

TEST(GestureSmootherTest, EmptyHasNoCurrent)
{
  GestureSmoother s(5);
  EXPECT_FALSE(s.current().has_value());
  EXPECT_EQ(s.size(), 0u);
}

TEST(GestureSmootherTest, ReturnsMajorityOfWindow)
{
  GestureSmoother s(5);

  s.update(Gesture::PAPER);
  s.update(Gesture::ROCK);
  s.update(Gesture::PAPER);
  EXPECT_EQ(s.update(Gesture::SCISSORS), Gesture::PAPER);
  EXPECT_EQ(s.update(Gesture::PAPER), Gesture::PAPER);
}

TEST(GestureSmootherTest, SingleOutlierDoesNotFlip)
{
  GestureSmoother s(10);
  for (int i = 0; i < 9; ++i) {
    s.update(Gesture::ROCK);
  }
  EXPECT_EQ(s.update(Gesture::SCISSORS), Gesture::ROCK);
}

TEST(GestureSmootherTest, OldestEntriesAreEvicted)
{
  GestureSmoother s(3);

  s.update(Gesture::ROCK);
  s.update(Gesture::ROCK);
  s.update(Gesture::ROCK);
  s.update(Gesture::PAPER);
  EXPECT_EQ(s.size(), 3u);

  // ROCK, PAPER, PAPER after this push
  EXPECT_EQ(s.update(Gesture::PAPER), Gesture::PAPER);
}

TEST(GestureSmootherTest, TieGoesToFirstSeenLabel)
{
  GestureSmoother s(4);

  s.update(Gesture::SCISSORS);
  s.update(Gesture::ROCK);
  s.update(Gesture::ROCK);
  EXPECT_EQ(s.update(Gesture::SCISSORS), Gesture::SCISSORS);
}

TEST(GestureSmootherTest, ClearEmptiesWindow)
{
  GestureSmoother s(3);
  s.update(Gesture::ROCK);
  s.clear();

  EXPECT_FALSE(s.current().has_value());
  EXPECT_EQ(s.update(Gesture::PAPER), Gesture::PAPER);
}
