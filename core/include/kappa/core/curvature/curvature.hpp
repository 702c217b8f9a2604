#pragma once
#include "kappa/core/export.hpp"
#include "kappa/core/common/constants.hpp"
#include "kappa/core/common/status.hpp"
#include "kappa/core/math/differentiate.hpp"
#include "kappa/core/motion/motion_sample.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace kappa::core {

// Path curvature from yaw rate: kappa = s * (dpsi/dt) / |v|.
//
// Pipeline per call:
// - heading psi from each orientation (projection onto the ground plane),
// - causal unwrap of psi,
// - d(psi)/dt by finite differences on the (possibly non-uniform) time grid,
// - division by speed, with stationary / zero-dt samples marked undefined.
//
// Output has one entry per input sample, in timestamp order.

// Which turn direction gets negative curvature. Heading grows counter-clockwise about +Z,
// so a left turn has dpsi/dt > 0.
enum class SignConvention : std::uint8_t {
  LeftNegative = 0,  // kappa = -(dpsi/dt) / v
  LeftPositive = 1   // kappa =  (dpsi/dt) / v
};

enum class NormalizationPolicy : std::uint8_t {
  Normalize = 0,  // warn, count and continue with q / ||q||
  Reject = 1      // fail with Status::UnnormalizedOrientation
};

enum class CurvatureValidity : std::uint8_t {
  Valid = 0,
  Stationary = 1,    // speed below Thresholds::stationary_speed
  ZeroTimeDelta = 2  // no neighbour with a usable time delta
};

const char* signConventionToString(SignConvention s);
const char* curvatureValidityToString(CurvatureValidity v);

struct CurvatureSample {
  double timestamp{0.0};
  double curvature{std::numeric_limits<double>::quiet_NaN()};  // 1/m, NaN unless Valid
  CurvatureValidity validity{CurvatureValidity::Valid};

  bool isDefined() const { return validity == CurvatureValidity::Valid; }
};

struct CurvatureOptions {
  DifferenceScheme scheme{DifferenceScheme::Central};
  SignConvention sign{SignConvention::LeftNegative};
  NormalizationPolicy normalization{NormalizationPolicy::Normalize};

  // Stable-sort the input by timestamp instead of failing on out-of-order rows.
  bool sort_by_timestamp{false};

  Thresholds thr = kDefaultThresholds;
};

// Per-call diagnostics. Counts refer to output samples.
struct CurvatureReport {
  std::size_t normalized_count{0};
  double max_norm_deviation{0.0};
  std::size_t stationary_count{0};
  std::size_t zero_time_delta_count{0};
  bool reordered{false};
};

struct CurvatureResult {
  // On failure `samples` is empty.
  Status status{Status::Failure};
  std::vector<CurvatureSample> samples;
  CurvatureReport report;

  std::size_t definedCount() const;
};

KAPPA_CORE_API Status validateCurvatureOptions(const CurvatureOptions& opt);

KAPPA_CORE_API CurvatureResult extractCurvature(const std::vector<MotionSample>& samples,
                                                const CurvatureOptions& opt = {});

// Same as above for column-oriented input; mismatched column lengths fail with ShapeMismatch.
KAPPA_CORE_API CurvatureResult extractCurvature(const MotionLog& log,
                                                const CurvatureOptions& opt = {});

}  // namespace kappa::core
