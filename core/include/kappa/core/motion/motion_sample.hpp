#pragma once
#include "kappa/core/common/status.hpp"
#include "kappa/core/math/types.hpp"

#include <cstddef>
#include <vector>

namespace kappa::core {

// One row of an ego-motion log.
struct MotionSample {
  double timestamp{0.0};              // s, arbitrary epoch
  Quat orientation{Quat::Identity()};  // base->world attitude, expected unit norm
  Vec3 velocity{Vec3::Zero()};         // m/s, fixed reference frame

  MotionSample() = default;
  MotionSample(double t, const Quat& q, const Vec3& v) : timestamp(t), orientation(q), velocity(v) {}

  // 2D velocity; z is zero.
  static MotionSample planar(double t, const Quat& q, const Vec2& v) {
    return MotionSample(t, q, Vec3(v.x(), v.y(), 0.0));
  }

  double speed() const { return velocity.norm(); }
};

// Column-oriented ego-motion log, as produced by tabular readers.
struct MotionLog {
  std::vector<double> timestamps;
  std::vector<Quat> orientations;
  std::vector<Vec3> velocities;

  bool consistent() const {
    return orientations.size() == timestamps.size() && velocities.size() == timestamps.size();
  }
  std::size_t size() const { return timestamps.size(); }

  void reserve(std::size_t n);
  void push_back(const MotionSample& s);
};

// Zips the parallel columns into samples. Fails with ShapeMismatch when lengths differ.
Status toSamples(const MotionLog& log, std::vector<MotionSample>* samples);

}  // namespace kappa::core
