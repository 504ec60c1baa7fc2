#include <gtest/gtest.h>

#include "hand_gesture_perception/tracking/constant_velocity_kalman_filter.hpp"

using hgp::tracking::ConstantVelocityKalmanFilter;

class KalmanFilterTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    Q = ConstantVelocityKalmanFilter::StateMatrix::Identity() * 1e-2;
    R = ConstantVelocityKalmanFilter::MeasMatrix::Identity() * 1e-1;
  }

  ConstantVelocityKalmanFilter kf;
  ConstantVelocityKalmanFilter::StateMatrix Q;
  ConstantVelocityKalmanFilter::MeasMatrix R;
};

TEST_F(KalmanFilterTest, StartsUninitialized)
{
  EXPECT_FALSE(kf.initialized());
  EXPECT_TRUE(kf.x().isZero());
}

TEST_F(KalmanFilterTest, FirstUpdateSeedsPosition)
{
  kf.predict(1.0, Q);
  kf.update(Eigen::Vector2d(120.0, 80.0), R);

  ASSERT_TRUE(kf.initialized());
  EXPECT_DOUBLE_EQ(kf.position().x(), 120.0);
  EXPECT_DOUBLE_EQ(kf.position().y(), 80.0);
  EXPECT_TRUE(kf.velocity().isZero());
  EXPECT_TRUE(kf.P().isIdentity());
}

TEST_F(KalmanFilterTest, PredictHoldsPositionWithoutVelocity)
{
  kf.initialize(Eigen::Vector2d(10.0, 20.0));
  kf.predict(1.0, Q);

  EXPECT_DOUBLE_EQ(kf.position().x(), 10.0);
  EXPECT_DOUBLE_EQ(kf.position().y(), 20.0);

  // Uncertainty grows
  EXPECT_GT(kf.P()(0, 0), 1.0);
}

TEST_F(KalmanFilterTest, LearnsConstantVelocity)
{
  kf.initialize(Eigen::Vector2d(0.0, 0.0));

  for (int k = 1; k <= 60; ++k) {
    kf.predict(1.0, Q);
    kf.update(Eigen::Vector2d(5.0 * k, -2.0 * k), R);
  }

  EXPECT_NEAR(kf.velocity().x(), 5.0, 0.25);
  EXPECT_NEAR(kf.velocity().y(), -2.0, 0.25);

  // Coasting continues along the learned motion
  const double x_before = kf.position().x();
  kf.predict(1.0, Q);
  EXPECT_NEAR(kf.position().x() - x_before, kf.velocity().x(), 1e-9);
}

TEST_F(KalmanFilterTest, UpdatePullsTowardMeasurement)
{
  kf.initialize(Eigen::Vector2d(0.0, 0.0));
  kf.predict(1.0, Q);
  kf.update(Eigen::Vector2d(10.0, 0.0), R);

  EXPECT_GT(kf.position().x(), 5.0);
  EXPECT_LT(kf.position().x(), 10.0);
}

TEST_F(KalmanFilterTest, ResetReturnsToUninitialized)
{
  kf.initialize(Eigen::Vector2d(3.0, 4.0));
  kf.reset();

  EXPECT_FALSE(kf.initialized());
  EXPECT_TRUE(kf.x().isZero());
}
