#pragma once

namespace kappa::core {

// Numerical thresholds for curvature extraction, grouped so callers can tune them together.
struct Thresholds {
  // Below this speed the vehicle is treated as stationary and curvature is undefined.
  double stationary_speed = 1.0e-2;      // m/s
  // Time deltas <= this are degenerate and never divided by.
  double min_time_delta = 0.0;           // s
  // Allowed | ||q|| - 1 | before the normalization policy kicks in.
  double quat_norm_tolerance = 1.0e-6;

  // general numerical
  double quat_zero_norm = 1.0e-12;
};

inline constexpr Thresholds kDefaultThresholds{};

}  // namespace kappa::core
