#pragma once

#include <Eigen/Dense>

namespace hgp::tracking
{

// Image-plane constant-velocity filter: x = [px py vx vy], z = [px py]
class ConstantVelocityKalmanFilter
{
public:
  static constexpr int kStateDim = 4;
  static constexpr int kMeasDim = 2;

  using StateVector = Eigen::Matrix<double, kStateDim, 1>;
  using StateMatrix = Eigen::Matrix<double, kStateDim, kStateDim>;
  using MeasVector = Eigen::Vector2d;
  using MeasMatrix = Eigen::Matrix2d;

  ConstantVelocityKalmanFilter();

  // Seed position from an observation, zero velocity, identity covariance
  void initialize(const MeasVector & z);

  // Always runs, initialized or not; the state is only meaningful once
  // initialized() is true
  void predict(double dt, const StateMatrix & Q);

  // Seeds the filter instead of correcting when not yet initialized
  void update(const MeasVector & z, const MeasMatrix & R);

  // Back to the uninitialized state
  void reset();

  bool initialized() const {return initialized_;}

  Eigen::Vector2d position() const {return x_.head<2>();}
  Eigen::Vector2d velocity() const {return x_.tail<2>();}

  // Accessors
  const StateVector & x() const {return x_;}
  const StateMatrix & P() const {return P_;}

private:
  void buildMotionModel(double dt);
  void buildMeasurementModel();

private:
  bool initialized_{false};

  StateVector x_;
  StateMatrix P_;

  StateMatrix F_;
  Eigen::Matrix<double, kMeasDim, kStateDim> H_;
};

}  // namespace hgp::tracking
