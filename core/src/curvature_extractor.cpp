#include "kappa/core/curvature/curvature.hpp"

#include "curvature_internal.hpp"
#include "kappa/core/common/logger.hpp"
#include "kappa/core/math/so3.hpp"
#include "kappa/core/math/unwrap.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <sstream>

namespace kappa::core {

const char* signConventionToString(SignConvention s) {
  switch (s) {
    case SignConvention::LeftNegative: return "left-negative";
    case SignConvention::LeftPositive: return "left-positive";
  }
  return "unknown";
}

const char* curvatureValidityToString(CurvatureValidity v) {
  switch (v) {
    case CurvatureValidity::Valid: return "valid";
    case CurvatureValidity::Stationary: return "stationary";
    case CurvatureValidity::ZeroTimeDelta: return "zero_dt";
  }
  return "unknown";
}

std::size_t CurvatureResult::definedCount() const {
  return static_cast<std::size_t>(
      std::count_if(samples.begin(), samples.end(),
                    [](const CurvatureSample& s) { return s.isDefined(); }));
}

Status validateCurvatureOptions(const CurvatureOptions& opt) {
  const Thresholds& thr = opt.thr;
  if (!(thr.stationary_speed >= 0.0) || !std::isfinite(thr.stationary_speed)) {
    log(LogLevel::Error, "validateCurvatureOptions: stationary_speed must be finite and >= 0");
    return Status::InvalidParameter;
  }
  if (!(thr.min_time_delta >= 0.0) || !std::isfinite(thr.min_time_delta)) {
    log(LogLevel::Error, "validateCurvatureOptions: min_time_delta must be finite and >= 0");
    return Status::InvalidParameter;
  }
  if (!(thr.quat_norm_tolerance >= 0.0) || !std::isfinite(thr.quat_norm_tolerance)) {
    log(LogLevel::Error, "validateCurvatureOptions: quat_norm_tolerance must be finite and >= 0");
    return Status::InvalidParameter;
  }
  if (!(thr.quat_zero_norm > 0.0)) {
    log(LogLevel::Error, "validateCurvatureOptions: quat_zero_norm must be > 0");
    return Status::InvalidParameter;
  }
  return Status::Success;
}

namespace detail {

Status prepareSample(const MotionSample& s,
                     std::size_t index,
                     const CurvatureOptions& opt,
                     const char* who,
                     HeadingNode* node,
                     CurvatureReport* report) {
  if (!std::isfinite(s.timestamp)) {
    std::ostringstream oss;
    oss << who << ": non-finite timestamp at sample " << index;
    log(LogLevel::Error, oss.str());
    return Status::InvalidParameter;
  }
  if (!s.velocity.allFinite()) {
    std::ostringstream oss;
    oss << who << ": non-finite velocity at sample " << index;
    log(LogLevel::Error, oss.str());
    return Status::InvalidParameter;
  }

  Quat q;
  if (!normalizeQuat(s.orientation, &q, opt.thr.quat_zero_norm)) {
    std::ostringstream oss;
    oss << who << ": orientation at sample " << index << " is zero or not finite";
    log(LogLevel::Error, oss.str());
    return Status::InvalidOrientation;
  }

  const double deviation = quatNormDeviation(s.orientation);
  if (deviation > opt.thr.quat_norm_tolerance) {
    if (opt.normalization == NormalizationPolicy::Reject) {
      std::ostringstream oss;
      oss << who << ": orientation at sample " << index << " deviates from unit norm by "
          << deviation;
      log(LogLevel::Error, oss.str());
      return Status::UnnormalizedOrientation;
    }
    if (report) {
      ++report->normalized_count;
      report->max_norm_deviation = std::max(report->max_norm_deviation, deviation);
    }
    if (shouldLog(LogLevel::Debug)) {
      std::ostringstream oss;
      oss << who << ": normalized orientation at sample " << index << " (deviation "
          << deviation << ")";
      log(LogLevel::Debug, oss.str());
    }
  }

  node->t = s.timestamp;
  node->heading = yawFromQuat(q);
  node->speed = s.speed();
  return Status::Success;
}

CurvatureSample curvatureAt(const HeadingNode* prev,
                            const HeadingNode& cur,
                            const HeadingNode* next,
                            const CurvatureOptions& opt,
                            CurvatureReport* report) {
  DifferenceWindow w;
  w.t = cur.t;
  w.y = cur.heading;
  if (prev) {
    w.has_prev = true;
    w.t_prev = prev->t;
    w.y_prev = prev->heading;
  }
  if (next) {
    w.has_next = true;
    w.t_next = next->t;
    w.y_next = next->heading;
  }

  CurvatureSample out;
  out.timestamp = cur.t;

  const double yaw_rate = differenceAt(w, opt.scheme, opt.thr.min_time_delta);
  if (std::isnan(yaw_rate)) {
    out.validity = CurvatureValidity::ZeroTimeDelta;
    if (report) ++report->zero_time_delta_count;
    return out;
  }
  if (cur.speed < opt.thr.stationary_speed || !(cur.speed > 0.0)) {
    out.validity = CurvatureValidity::Stationary;
    if (report) ++report->stationary_count;
    return out;
  }

  const double sign = (opt.sign == SignConvention::LeftNegative) ? -1.0 : 1.0;
  out.curvature = sign * yaw_rate / cur.speed;
  if (out.curvature == 0.0) out.curvature = 0.0;  // no -0 in reports
  out.validity = CurvatureValidity::Valid;
  return out;
}

}  // namespace detail

CurvatureResult extractCurvature(const std::vector<MotionSample>& samples,
                                 const CurvatureOptions& opt) {
  CurvatureResult res;

  res.status = validateCurvatureOptions(opt);
  if (!ok(res.status)) return res;

  const std::size_t n = samples.size();
  if (n < 2) {
    std::ostringstream oss;
    oss << "extractCurvature: need at least 2 samples, got " << n;
    log(LogLevel::Error, oss.str());
    res.status = Status::InsufficientSamples;
    return res;
  }

  // Timestamps are checked before ordering; NaN would break the sort.
  bool sorted = true;
  for (std::size_t i = 0; i < n; ++i) {
    if (!std::isfinite(samples[i].timestamp)) {
      std::ostringstream oss;
      oss << "extractCurvature: non-finite timestamp at sample " << i;
      log(LogLevel::Error, oss.str());
      res.status = Status::InvalidParameter;
      return res;
    }
    if (i > 0 && samples[i].timestamp < samples[i - 1].timestamp) sorted = false;
  }

  std::vector<std::size_t> order(n);
  std::iota(order.begin(), order.end(), std::size_t{0});
  if (!sorted) {
    if (!opt.sort_by_timestamp) {
      log(LogLevel::Error, "extractCurvature: timestamps are not non-decreasing "
                           "(enable sort_by_timestamp to reorder)");
      res.status = Status::UnorderedTimestamps;
      return res;
    }
    std::stable_sort(order.begin(), order.end(), [&samples](std::size_t a, std::size_t b) {
      return samples[a].timestamp < samples[b].timestamp;
    });
    res.report.reordered = true;
    log(LogLevel::Info, "extractCurvature: input reordered by timestamp");
  }

  std::vector<detail::HeadingNode> nodes(n);
  for (std::size_t k = 0; k < n; ++k) {
    const Status st = detail::prepareSample(samples[order[k]], order[k], opt, "extractCurvature",
                                            &nodes[k], &res.report);
    if (!ok(st)) {
      res.status = st;
      res.report = CurvatureReport{};
      return res;
    }
  }

  AngleUnwrapper unwrapper;
  for (auto& node : nodes) node.heading = unwrapper.next(node.heading);

  res.samples.reserve(n);
  for (std::size_t k = 0; k < n; ++k) {
    const detail::HeadingNode* prev = (k > 0) ? &nodes[k - 1] : nullptr;
    const detail::HeadingNode* next = (k + 1 < n) ? &nodes[k + 1] : nullptr;
    res.samples.push_back(detail::curvatureAt(prev, nodes[k], next, opt, &res.report));
  }

  if (res.report.normalized_count > 0) {
    std::ostringstream oss;
    oss << "extractCurvature: normalized " << res.report.normalized_count
        << " orientation(s), max deviation " << res.report.max_norm_deviation;
    log(LogLevel::Warn, oss.str());
  }
  if (shouldLog(LogLevel::Info)) {
    std::ostringstream oss;
    oss << "extractCurvature: " << n << " samples, " << res.definedCount() << " defined, "
        << res.report.stationary_count << " stationary, "
        << res.report.zero_time_delta_count << " zero-dt (scheme="
        << differenceSchemeToString(opt.scheme) << ", sign="
        << signConventionToString(opt.sign) << ")";
    log(LogLevel::Info, oss.str());
  }

  res.status = Status::Success;
  return res;
}

CurvatureResult extractCurvature(const MotionLog& log, const CurvatureOptions& opt) {
  std::vector<MotionSample> samples;
  const Status st = toSamples(log, &samples);
  if (!ok(st)) {
    CurvatureResult res;
    res.status = st;
    return res;
  }
  return extractCurvature(samples, opt);
}

}  // namespace kappa::core
