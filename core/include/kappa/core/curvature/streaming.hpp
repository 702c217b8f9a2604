#pragma once
#include "kappa/core/export.hpp"
#include "kappa/core/curvature/curvature.hpp"
#include "kappa/core/math/unwrap.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace kappa::core {

// Incremental form of `extractCurvature` with O(1) state.
//
// Each sample's estimate needs its successor, so output lags input by one sample:
// `push()` appends the estimate for the previous sample (none for the first push) and
// `finish()` appends the last one. For the same options and input the concatenated output
// equals `extractCurvature(...).samples`.
//
// Input must already be in timestamp order (`sort_by_timestamp` is ignored). After a
// failing call the extractor stays failed until `reset()`.
class KAPPA_CORE_API StreamingCurvatureExtractor {
public:
  explicit StreamingCurvatureExtractor(CurvatureOptions opt = {});

  const CurvatureOptions& options() const { return opt_; }
  const CurvatureReport& report() const { return report_; }
  std::size_t pushed() const { return pushed_; }

  Status push(const MotionSample& sample, std::vector<CurvatureSample>* out);
  Status finish(std::vector<CurvatureSample>* out);

  void reset();

private:
  struct Node {
    double t{0.0};
    double heading{0.0};
    double speed{0.0};
  };

  Status fail(Status st);

  CurvatureOptions opt_;
  CurvatureReport report_{};
  std::size_t pushed_{0};
  bool failed_{false};
  bool finished_{false};

  AngleUnwrapper unwrapper_;

  std::optional<Node> prev_;
  std::optional<Node> cur_;
};

}  // namespace kappa::core
