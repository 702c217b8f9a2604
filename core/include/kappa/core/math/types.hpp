#pragma once
#include <Eigen/Core>
#include <Eigen/Geometry>

namespace kappa::core {

// Fundamental math types and conventions used across the library.
// - The reference frame is right-handed with Z up; heading (yaw) is the rotation about +Z,
//   measured counter-clockwise from +X.
// - Units are seconds, meters and radians.
using Vec2 = Eigen::Vector2d;
using Vec3 = Eigen::Vector3d;
using Mat3 = Eigen::Matrix3d;
using Quat = Eigen::Quaterniond;

}  // namespace kappa::core
