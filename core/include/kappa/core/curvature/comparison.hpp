#pragma once
#include "kappa/core/export.hpp"
#include "kappa/core/common/status.hpp"
#include "kappa/core/curvature/curvature.hpp"

#include <cstddef>
#include <limits>
#include <vector>

namespace kappa::core {

struct ComparisonOptions {
  // Samples pair up when their timestamps differ by at most this much.
  double time_tolerance = 1e-9;  // s
};

// Error of computed curvature against a reference track, over paired samples where both
// values are defined. error = computed - reference.
struct ComparisonStats {
  std::size_t matched_count{0};
  std::size_t skipped_undefined{0};  // paired by time, but one side undefined

  double mean_error{0.0};
  double mean_abs_error{0.0};
  double rmse{0.0};
  double max_abs_error{0.0};
  double max_abs_error_timestamp{0.0};

  // Pearson correlation; NaN with fewer than 2 pairs or a constant side.
  double correlation{std::numeric_limits<double>::quiet_NaN()};
};

// Neither input needs to be sorted. A reference sample counts as defined when its
// curvature is finite and its validity is Valid. Fails with Status::Failure when no pair
// of defined samples exists.
KAPPA_CORE_API Status compareCurvature(const std::vector<CurvatureSample>& computed,
                                       const std::vector<CurvatureSample>& reference,
                                       const ComparisonOptions& opt,
                                       ComparisonStats* stats);

}  // namespace kappa::core
