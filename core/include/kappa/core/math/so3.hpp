#pragma once
#include "kappa/core/math/types.hpp"

namespace kappa::core {

// Heading of `q` about +Z: atan2(2(wz + xy), 1 - 2(y^2 + z^2)), in (-pi, pi].
// `q` is assumed unit norm; the projection is undefined otherwise.
double yawFromQuat(const Quat& q);

// Pure rotation about +Z.
Quat quatFromYaw(double yaw);

// | ||q|| - 1 |, or +inf when any coefficient is not finite.
double quatNormDeviation(const Quat& q);

// Writes q / ||q|| to `out`. Returns false (and leaves `out` untouched) when `q` has a
// non-finite coefficient or a norm at or below `zero_norm`.
bool normalizeQuat(const Quat& q, Quat* out, double zero_norm = 1e-12);

// Maps an angle to (-pi, pi].
double wrapToPi(double angle);

}  // namespace kappa::core
