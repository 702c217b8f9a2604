// Heading helpers on unit quaternions.
// - `yawFromQuat` is the Z-Y-X (yaw-pitch-roll) yaw, equivalent to atan2(R(1,0), R(0,0)) of the
//   rotation matrix but evaluated without forming it.
// - `wrapToPi` keeps +pi and sends -pi to +pi so the range is half-open on the left.
#include "kappa/core/math/so3.hpp"

#include <cmath>
#include <limits>

namespace kappa::core {

double yawFromQuat(const Quat& q) {
  const double siny_cosp = 2.0 * (q.w() * q.z() + q.x() * q.y());
  const double cosy_cosp = 1.0 - 2.0 * (q.y() * q.y() + q.z() * q.z());
  return std::atan2(siny_cosp, cosy_cosp);
}

Quat quatFromYaw(double yaw) {
  return Quat(Eigen::AngleAxisd(yaw, Vec3::UnitZ()));
}

double quatNormDeviation(const Quat& q) {
  if (!q.coeffs().allFinite()) {
    return std::numeric_limits<double>::infinity();
  }
  return std::abs(q.norm() - 1.0);
}

bool normalizeQuat(const Quat& q, Quat* out, double zero_norm) {
  if (!out) return false;
  if (!q.coeffs().allFinite()) return false;
  const double n = q.norm();
  if (!(n > zero_norm)) return false;
  *out = Quat(q.coeffs() / n);
  return true;
}

double wrapToPi(double angle) {
  double a = std::fmod(angle + M_PI, 2.0 * M_PI);
  if (a <= 0.0) a += 2.0 * M_PI;
  return a - M_PI;
}

}  // namespace kappa::core
