#include "hand_gesture_perception/tracking/constant_velocity_kalman_filter.hpp"

namespace hgp::tracking
{

ConstantVelocityKalmanFilter::ConstantVelocityKalmanFilter()
{
  x_.setZero();
  P_.setIdentity();
  F_.setIdentity();

  buildMeasurementModel();
}

void ConstantVelocityKalmanFilter::initialize(const MeasVector & z)
{
  x_.setZero();
  x_.head<2>() = z;

  P_.setIdentity();

  initialized_ = true;
}

void ConstantVelocityKalmanFilter::reset()
{
  x_.setZero();
  P_.setIdentity();
  initialized_ = false;
}

void ConstantVelocityKalmanFilter::buildMotionModel(double dt)
{
  F_.setIdentity();

  // Position integration
  F_(0, 2) = dt;
  F_(1, 3) = dt;
}

void ConstantVelocityKalmanFilter::buildMeasurementModel()
{
  H_.setZero();
  H_.block<2, 2>(0, 0).setIdentity();
}

void ConstantVelocityKalmanFilter::predict(double dt, const StateMatrix & Q)
{
  buildMotionModel(dt);

  x_ = F_ * x_;
  P_ = F_ * P_ * F_.transpose() + Q;
}

void ConstantVelocityKalmanFilter::update(
  const MeasVector & z,
  const MeasMatrix & R)
{
  if (!initialized_) {
    initialize(z);
    return;
  }

  const Eigen::Vector2d y = z - H_ * x_;
  const Eigen::Matrix2d S = H_ * P_ * H_.transpose() + R;
  const Eigen::Matrix<double, kStateDim, kMeasDim> K =
    P_ * H_.transpose() * S.inverse();

  x_ = x_ + K * y;
  P_ = (StateMatrix::Identity() - K * H_) * P_;
}

}  // namespace hgp::tracking
