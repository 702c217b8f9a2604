#pragma once
#include "kappa/core/curvature/curvature.hpp"

#include <cstddef>

namespace kappa::core::detail {

// One input sample after heading extraction; `heading` is already unwrapped when fed to
// `curvatureAt`.
struct HeadingNode {
  double t{0.0};
  double heading{0.0};
  double speed{0.0};
};

// Checks a single sample (finite time / velocity, orientation per policy) and extracts its
// raw heading in (-pi, pi] and speed. `who` prefixes log messages.
Status prepareSample(const MotionSample& s,
                     std::size_t index,
                     const CurvatureOptions& opt,
                     const char* who,
                     HeadingNode* node,
                     CurvatureReport* report);

// Curvature at `cur` given its neighbours (either may be null). Updates the degenerate-sample
// counters in `report`.
CurvatureSample curvatureAt(const HeadingNode* prev,
                            const HeadingNode& cur,
                            const HeadingNode* next,
                            const CurvatureOptions& opt,
                            CurvatureReport* report);

}  // namespace kappa::core::detail
