// Pairs computed and reference curvature by timestamp with a two-pointer merge over
// timestamp-sorted copies, then accumulates error moments in one pass.
#include "kappa/core/curvature/comparison.hpp"

#include "kappa/core/common/logger.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace kappa::core {

static std::vector<CurvatureSample> sortedByTime(const std::vector<CurvatureSample>& in) {
  std::vector<CurvatureSample> out = in;
  std::stable_sort(out.begin(), out.end(), [](const CurvatureSample& a, const CurvatureSample& b) {
    return a.timestamp < b.timestamp;
  });
  return out;
}

static bool usable(const CurvatureSample& s) {
  return s.isDefined() && std::isfinite(s.curvature);
}

Status compareCurvature(const std::vector<CurvatureSample>& computed,
                        const std::vector<CurvatureSample>& reference,
                        const ComparisonOptions& opt,
                        ComparisonStats* stats) {
  if (!stats) {
    log(LogLevel::Error, "compareCurvature: output is null");
    return Status::InvalidParameter;
  }
  if (!(opt.time_tolerance >= 0.0) || !std::isfinite(opt.time_tolerance)) {
    log(LogLevel::Error, "compareCurvature: time_tolerance must be finite and >= 0");
    return Status::InvalidParameter;
  }
  *stats = ComparisonStats{};

  const std::vector<CurvatureSample> a = sortedByTime(computed);
  const std::vector<CurvatureSample> b = sortedByTime(reference);

  double sum_e = 0.0, sum_abs_e = 0.0, sum_e2 = 0.0;
  double sum_x = 0.0, sum_y = 0.0, sum_xx = 0.0, sum_yy = 0.0, sum_xy = 0.0;

  std::size_t i = 0, j = 0;
  while (i < a.size() && j < b.size()) {
    const double dt = a[i].timestamp - b[j].timestamp;
    if (std::abs(dt) > opt.time_tolerance || !std::isfinite(dt)) {
      if (a[i].timestamp < b[j].timestamp) ++i; else ++j;
      continue;
    }

    if (!usable(a[i]) || !usable(b[j])) {
      ++stats->skipped_undefined;
      ++i;
      ++j;
      continue;
    }

    const double x = a[i].curvature;
    const double y = b[j].curvature;
    const double e = x - y;
    sum_e += e;
    sum_abs_e += std::abs(e);
    sum_e2 += e * e;
    sum_x += x;
    sum_y += y;
    sum_xx += x * x;
    sum_yy += y * y;
    sum_xy += x * y;
    if (std::abs(e) > stats->max_abs_error || stats->matched_count == 0) {
      stats->max_abs_error = std::abs(e);
      stats->max_abs_error_timestamp = a[i].timestamp;
    }
    ++stats->matched_count;
    ++i;
    ++j;
  }

  if (stats->matched_count == 0) {
    log(LogLevel::Error, "compareCurvature: no defined samples share a timestamp");
    return Status::Failure;
  }

  const double n = static_cast<double>(stats->matched_count);
  stats->mean_error = sum_e / n;
  stats->mean_abs_error = sum_abs_e / n;
  stats->rmse = std::sqrt(sum_e2 / n);

  if (stats->matched_count >= 2) {
    const double cov = sum_xy - sum_x * sum_y / n;
    const double var_x = sum_xx - sum_x * sum_x / n;
    const double var_y = sum_yy - sum_y * sum_y / n;
    if (var_x > 0.0 && var_y > 0.0) {
      stats->correlation = cov / std::sqrt(var_x * var_y);
    }
  }

  if (shouldLog(LogLevel::Info)) {
    std::ostringstream oss;
    oss << "compareCurvature: " << stats->matched_count << " pairs, rmse=" << stats->rmse
        << ", max |err|=" << stats->max_abs_error;
    log(LogLevel::Info, oss.str());
  }
  return Status::Success;
}

}  // namespace kappa::core
