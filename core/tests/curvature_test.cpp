#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "kappa/core/common/logger.hpp"
#include "kappa/core/common/status.hpp"
#include "kappa/core/curvature/comparison.hpp"
#include "kappa/core/curvature/curvature.hpp"
#include "kappa/core/curvature/streaming.hpp"
#include "kappa/core/math/so3.hpp"
#include "kappa/core/motion/motion_sample.hpp"

using kappa::core::ComparisonOptions;
using kappa::core::ComparisonStats;
using kappa::core::CurvatureOptions;
using kappa::core::CurvatureResult;
using kappa::core::CurvatureSample;
using kappa::core::CurvatureValidity;
using kappa::core::DifferenceScheme;
using kappa::core::LogLevel;
using kappa::core::MotionLog;
using kappa::core::MotionSample;
using kappa::core::NormalizationPolicy;
using kappa::core::Quat;
using kappa::core::SignConvention;
using kappa::core::Status;
using kappa::core::StreamingCurvatureExtractor;
using kappa::core::Vec2;
using kappa::core::Vec3;
using kappa::core::compareCurvature;
using kappa::core::extractCurvature;
using kappa::core::ok;
using kappa::core::quatFromYaw;

static bool near(double a, double b, double tol) {
  return std::abs(a - b) <= tol;
}

static std::vector<std::string> g_log_lines;

static void captureSink(LogLevel level, const std::string& msg) {
  g_log_lines.push_back(std::string(kappa::core::logLevelToString(level)) + " " + msg);
}

static bool logged(const std::string& needle) {
  for (const auto& line : g_log_lines) {
    if (line.find(needle) != std::string::npos) return true;
  }
  return false;
}

// Vehicle moving along its heading at `speed`.
static MotionSample sampleAt(double t, double heading, double speed) {
  return MotionSample(t, quatFromYaw(heading),
                      Vec3(speed * std::cos(heading), speed * std::sin(heading), 0.0));
}

// Constant yaw rate `omega` and speed `v`; non-uniform spacing when `jitter` is set.
static std::vector<MotionSample> constantTurn(double heading0, double omega, double v, int n,
                                              bool jitter = false) {
  std::vector<MotionSample> out;
  double t = 0.0;
  for (int i = 0; i < n; ++i) {
    out.push_back(sampleAt(t, heading0 + omega * t, v));
    t += jitter ? (0.1 + 0.03 * (i % 3)) : 0.1;
  }
  return out;
}

static void test_straight_line() {
  const auto samples = constantTurn(0.3, 0.0, 5.0, 20);
  const CurvatureResult res = extractCurvature(samples);
  assert(ok(res.status));
  assert(res.samples.size() == samples.size());
  for (std::size_t i = 0; i < samples.size(); ++i) {
    assert(res.samples[i].isDefined());
    assert(res.samples[i].timestamp == samples[i].timestamp);
    assert(near(res.samples[i].curvature, 0.0, 1e-12));
  }
  assert(res.definedCount() == samples.size());

  // Exactly constant heading: every yaw rate is 0, reported as +0.
  const CurvatureResult north = extractCurvature(constantTurn(0.0, 0.0, 5.0, 10));
  assert(ok(north.status));
  for (const auto& s : north.samples) {
    assert(s.curvature == 0.0);
    assert(!std::signbit(s.curvature));
  }
}

static void test_constant_turn_and_sign() {
  const double omega = 0.2;
  const double v = 4.0;

  for (bool jitter : {false, true}) {
    // Left turn: negative under the default convention.
    const CurvatureResult left = extractCurvature(constantTurn(0.1, omega, v, 40, jitter));
    assert(ok(left.status));
    for (const auto& s : left.samples) {
      assert(s.isDefined());
      assert(near(s.curvature, -omega / v, 1e-9));
    }

    // Mirror right turn.
    const CurvatureResult right = extractCurvature(constantTurn(0.1, -omega, v, 40, jitter));
    assert(ok(right.status));
    for (std::size_t i = 0; i < right.samples.size(); ++i) {
      assert(near(right.samples[i].curvature, omega / v, 1e-9));
      assert(near(right.samples[i].curvature, -left.samples[i].curvature, 1e-9));
    }

    // Raw yaw-rate ratio.
    CurvatureOptions opt;
    opt.sign = SignConvention::LeftPositive;
    const CurvatureResult raw = extractCurvature(constantTurn(0.1, omega, v, 40, jitter), opt);
    for (const auto& s : raw.samples) assert(near(s.curvature, omega / v, 1e-9));
  }
}

static void test_turn_across_pi() {
  // Heading runs from 2.8 through +pi into the negative half.
  const double omega = 1.0;
  const double v = 10.0;
  const auto samples = constantTurn(2.8, omega, v, 15);
  const CurvatureResult res = extractCurvature(samples);
  assert(ok(res.status));
  for (const auto& s : res.samples) {
    assert(s.isDefined());
    assert(near(s.curvature, -omega / v, 1e-9));
  }
}

static void test_boundary_sizes() {
  const CurvatureResult empty = extractCurvature(std::vector<MotionSample>{});
  assert(empty.status == Status::InsufficientSamples);
  assert(empty.samples.empty());

  const CurvatureResult one = extractCurvature(std::vector<MotionSample>{sampleAt(0.0, 0.0, 1.0)});
  assert(one.status == Status::InsufficientSamples);
  assert(one.samples.empty());

  // N=2: the single one-sided estimate is reported at both indices.
  const std::vector<MotionSample> two = {sampleAt(0.0, 0.0, 2.0), sampleAt(0.5, 0.1, 2.0)};
  const CurvatureResult res = extractCurvature(two);
  assert(ok(res.status));
  assert(res.samples.size() == 2);
  assert(near(res.samples[0].curvature, -0.1, 1e-9));
  assert(near(res.samples[1].curvature, res.samples[0].curvature, 1e-12));
}

static void test_difference_schemes() {
  // Headings 0, 0, -0.05, -0.10 at 10 Hz, speed 2 m/s.
  const std::vector<double> t = {0.0, 0.1, 0.2, 0.3};
  const std::vector<double> psi = {0.0, 0.0, -0.05, -0.10};
  std::vector<MotionSample> samples;
  for (std::size_t i = 0; i < t.size(); ++i) samples.push_back(sampleAt(t[i], psi[i], 2.0));

  CurvatureOptions opt;
  opt.sign = SignConvention::LeftPositive;

  const CurvatureResult central = extractCurvature(samples, opt);
  assert(ok(central.status));
  assert(near(central.samples[0].curvature, 0.0, 1e-9));
  assert(near(central.samples[1].curvature, -0.125, 1e-9));
  assert(near(central.samples[2].curvature, -0.25, 1e-9));
  assert(near(central.samples[3].curvature, -0.25, 1e-9));

  opt.scheme = DifferenceScheme::Backward;
  const CurvatureResult backward = extractCurvature(samples, opt);
  assert(near(backward.samples[0].curvature, 0.0, 1e-9));
  assert(near(backward.samples[1].curvature, 0.0, 1e-9));
  assert(near(backward.samples[2].curvature, -0.25, 1e-9));
  assert(near(backward.samples[3].curvature, -0.25, 1e-9));

  opt.scheme = DifferenceScheme::Forward;
  const CurvatureResult forward = extractCurvature(samples, opt);
  assert(near(forward.samples[0].curvature, 0.0, 1e-9));
  assert(near(forward.samples[1].curvature, -0.25, 1e-9));
  assert(near(forward.samples[2].curvature, -0.25, 1e-9));
  assert(near(forward.samples[3].curvature, -0.25, 1e-9));
}

static void test_zero_speed() {
  auto samples = constantTurn(0.0, 0.2, 4.0, 7);
  samples[3].velocity = Vec3::Zero();

  const CurvatureResult res = extractCurvature(samples);
  assert(ok(res.status));
  assert(res.samples.size() == samples.size());
  assert(!res.samples[3].isDefined());
  assert(res.samples[3].validity == CurvatureValidity::Stationary);
  assert(std::isnan(res.samples[3].curvature));
  assert(res.report.stationary_count == 1);
  for (std::size_t i = 0; i < samples.size(); ++i) {
    if (i == 3) continue;
    assert(res.samples[i].isDefined());
    assert(near(res.samples[i].curvature, -0.05, 1e-9));
  }

  // Creeping below the threshold is also undefined; a custom threshold can admit it.
  samples[3].velocity = Vec3(0.005, 0.0, 0.0);
  assert(extractCurvature(samples).samples[3].validity == CurvatureValidity::Stationary);
  CurvatureOptions opt;
  opt.thr.stationary_speed = 0.001;
  assert(extractCurvature(samples, opt).samples[3].isDefined());

  // Zero threshold still never divides by zero.
  opt.thr.stationary_speed = 0.0;
  samples[3].velocity = Vec3::Zero();
  const CurvatureResult zero_thr = extractCurvature(samples, opt);
  assert(zero_thr.samples[3].validity == CurvatureValidity::Stationary);
}

static void test_zero_time_delta() {
  // Both samples share a timestamp: nothing to differentiate over.
  const std::vector<MotionSample> same = {sampleAt(1.0, 0.0, 1.0), sampleAt(1.0, 0.1, 1.0)};
  const CurvatureResult res = extractCurvature(same);
  assert(ok(res.status));
  assert(res.samples.size() == 2);
  for (const auto& s : res.samples) {
    assert(s.validity == CurvatureValidity::ZeroTimeDelta);
    assert(std::isnan(s.curvature));
  }
  assert(res.report.zero_time_delta_count == 2);

  // Interior duplicates use their other neighbour; a trailing duplicate is undefined.
  const std::vector<MotionSample> dup = {sampleAt(0.0, 0.00, 1.0), sampleAt(0.1, 0.01, 1.0),
                                         sampleAt(0.1, 0.01, 1.0), sampleAt(0.2, 0.02, 1.0),
                                         sampleAt(0.2, 0.02, 1.0)};
  const CurvatureResult r2 = extractCurvature(dup);
  assert(ok(r2.status));
  for (std::size_t i = 0; i < 4; ++i) {
    assert(r2.samples[i].isDefined());
    assert(near(r2.samples[i].curvature, -0.1, 1e-9));
  }
  assert(r2.samples[4].validity == CurvatureValidity::ZeroTimeDelta);

  // Stationary and degenerate in time: the time delta wins.
  std::vector<MotionSample> both = same;
  both[0].velocity = Vec3::Zero();
  assert(extractCurvature(both).samples[0].validity == CurvatureValidity::ZeroTimeDelta);

  // min_time_delta treats near-duplicates as degenerate too.
  CurvatureOptions opt;
  opt.thr.min_time_delta = 0.01;
  const std::vector<MotionSample> close = {sampleAt(0.0, 0.0, 1.0), sampleAt(0.005, 0.0, 1.0)};
  assert(extractCurvature(close, opt).samples[1].validity == CurvatureValidity::ZeroTimeDelta);
}

static void test_normalization_policy() {
  auto samples = constantTurn(0.4, 0.2, 4.0, 6);
  const CurvatureResult reference = extractCurvature(samples);

  samples[2].orientation = Quat(samples[2].orientation.coeffs() * 1.1);

  g_log_lines.clear();
  const CurvatureResult res = extractCurvature(samples);
  assert(ok(res.status));
  assert(res.report.normalized_count == 1);
  assert(near(res.report.max_norm_deviation, 0.1, 1e-9));
  assert(logged("WARN extractCurvature: normalized 1 orientation(s)"));
  for (std::size_t i = 0; i < samples.size(); ++i) {
    assert(near(res.samples[i].curvature, reference.samples[i].curvature, 1e-12));
  }

  CurvatureOptions reject;
  reject.normalization = NormalizationPolicy::Reject;
  const CurvatureResult rejected = extractCurvature(samples, reject);
  assert(rejected.status == Status::UnnormalizedOrientation);
  assert(rejected.samples.empty());
  assert(rejected.report.normalized_count == 0);

  // Deviation inside the tolerance is accepted silently under both policies.
  samples[2].orientation = Quat(1.0 + 1e-9, 0.0, 0.0, 0.0);
  assert(ok(extractCurvature(samples, reject).status));
  assert(extractCurvature(samples).report.normalized_count == 0);

  samples[2].orientation = Quat(0.0, 0.0, 0.0, 0.0);
  assert(extractCurvature(samples).status == Status::InvalidOrientation);
}

static void test_invalid_input() {
  auto samples = constantTurn(0.0, 0.1, 3.0, 5);
  samples[1].velocity.x() = std::nan("");
  assert(extractCurvature(samples).status == Status::InvalidParameter);

  samples = constantTurn(0.0, 0.1, 3.0, 5);
  samples[4].timestamp = std::numeric_limits<double>::infinity();
  assert(extractCurvature(samples).status == Status::InvalidParameter);

  CurvatureOptions opt;
  opt.thr.stationary_speed = -1.0;
  assert(extractCurvature(constantTurn(0.0, 0.1, 3.0, 5), opt).status == Status::InvalidParameter);

  MotionLog motion_log;
  for (const auto& s : constantTurn(0.0, 0.1, 3.0, 5)) motion_log.push_back(s);
  assert(ok(extractCurvature(motion_log).status));
  motion_log.velocities.pop_back();
  const CurvatureResult mismatch = extractCurvature(motion_log);
  assert(mismatch.status == Status::ShapeMismatch);
  assert(mismatch.samples.empty());
}

static void test_ordering() {
  const auto sorted = constantTurn(0.0, 0.3, 2.0, 8, true);
  auto shuffled = sorted;
  std::swap(shuffled[2], shuffled[5]);
  std::swap(shuffled[0], shuffled[7]);

  const CurvatureResult strict = extractCurvature(shuffled);
  assert(strict.status == Status::UnorderedTimestamps);
  assert(strict.samples.empty());

  CurvatureOptions opt;
  opt.sort_by_timestamp = true;
  const CurvatureResult res = extractCurvature(shuffled, opt);
  const CurvatureResult expected = extractCurvature(sorted, opt);
  assert(ok(res.status));
  assert(res.report.reordered);
  assert(!expected.report.reordered);
  for (std::size_t i = 0; i < sorted.size(); ++i) {
    assert(res.samples[i].timestamp == sorted[i].timestamp);
    assert(res.samples[i].curvature == expected.samples[i].curvature);
  }
}

static void test_planar_velocity() {
  std::vector<MotionSample> samples;
  for (int i = 0; i < 5; ++i) {
    const double t = 0.2 * i;
    const double psi = -0.5 * t;
    samples.push_back(MotionSample::planar(t, quatFromYaw(psi), Vec2(3.0 * std::cos(psi), 3.0 * std::sin(psi))));
  }
  const CurvatureResult res = extractCurvature(samples);
  assert(ok(res.status));
  for (const auto& s : res.samples) assert(near(s.curvature, 0.5 / 3.0, 1e-9));
}

static std::vector<MotionSample> noisyDrive(int n) {
  std::mt19937 gen(42);
  std::uniform_real_distribution<> yaw_rate(-0.8, 0.8);
  std::uniform_real_distribution<> dt(0.05, 0.15);
  std::uniform_real_distribution<> speed(0.0, 15.0);

  std::vector<MotionSample> out;
  double t = 0.0;
  double psi = 3.0;
  for (int i = 0; i < n; ++i) {
    out.push_back(sampleAt(t, psi, speed(gen)));
    const double h = dt(gen);
    t += h;
    psi += yaw_rate(gen) * h;
  }
  out[17].velocity = Vec3::Zero();
  out[40].timestamp = out[39].timestamp;
  out[60].orientation = Quat(out[60].orientation.coeffs() * 0.9);
  return out;
}

static void test_streaming_matches_batch() {
  const auto samples = noisyDrive(200);
  for (DifferenceScheme scheme :
       {DifferenceScheme::Central, DifferenceScheme::Forward, DifferenceScheme::Backward}) {
    CurvatureOptions opt;
    opt.scheme = scheme;
    const CurvatureResult batch = extractCurvature(samples, opt);
    assert(ok(batch.status));

    StreamingCurvatureExtractor stream(opt);
    std::vector<CurvatureSample> out;
    for (std::size_t i = 0; i < samples.size(); ++i) {
      assert(ok(stream.push(samples[i], &out)));
      assert(out.size() == i);
    }
    assert(ok(stream.finish(&out)));
    assert(out.size() == batch.samples.size());

    for (std::size_t i = 0; i < out.size(); ++i) {
      assert(out[i].timestamp == batch.samples[i].timestamp);
      assert(out[i].validity == batch.samples[i].validity);
      if (out[i].isDefined()) {
        assert(out[i].curvature == batch.samples[i].curvature);
      } else {
        assert(std::isnan(out[i].curvature));
      }
    }
    assert(stream.report().stationary_count == batch.report.stationary_count);
    assert(stream.report().zero_time_delta_count == batch.report.zero_time_delta_count);
    assert(stream.report().normalized_count == batch.report.normalized_count);
    assert(batch.report.stationary_count >= 1);
    assert(batch.report.normalized_count == 1);
  }
}

static void test_streaming_errors() {
  StreamingCurvatureExtractor stream;
  std::vector<CurvatureSample> out;
  assert(ok(stream.push(sampleAt(0.0, 0.0, 1.0), &out)));
  assert(stream.finish(&out) == Status::InsufficientSamples);
  assert(stream.push(sampleAt(0.1, 0.0, 1.0), &out) == Status::Failure);

  stream.reset();
  assert(stream.pushed() == 0);
  assert(ok(stream.push(sampleAt(1.0, 0.0, 1.0), &out)));
  assert(stream.push(sampleAt(0.5, 0.0, 1.0), &out) == Status::UnorderedTimestamps);
  assert(out.empty());

  stream.reset();
  assert(ok(stream.push(sampleAt(0.0, 0.0, 2.0), &out)));
  assert(ok(stream.push(sampleAt(0.5, 0.1, 2.0), &out)));
  assert(ok(stream.finish(&out)));
  assert(out.size() == 2);
  assert(near(out[0].curvature, -0.1, 1e-9));
  assert(stream.push(sampleAt(1.0, 0.2, 2.0), &out) == Status::Failure);

  CurvatureOptions reject;
  reject.normalization = NormalizationPolicy::Reject;
  StreamingCurvatureExtractor strict(reject);
  MotionSample bad = sampleAt(0.0, 0.0, 1.0);
  bad.orientation = Quat(2.0, 0.0, 0.0, 0.0);
  assert(strict.push(bad, &out) == Status::UnnormalizedOrientation);

  // A failed stream drops the diagnostics gathered before the failure.
  StreamingCurvatureExtractor lenient;
  MotionSample scaled = sampleAt(0.0, 0.0, 1.0);
  scaled.orientation = Quat(1.5, 0.0, 0.0, 0.0);
  assert(ok(lenient.push(scaled, &out)));
  assert(lenient.report().normalized_count == 1);
  assert(lenient.push(sampleAt(-1.0, 0.0, 1.0), &out) == Status::UnorderedTimestamps);
  assert(lenient.report().normalized_count == 0);
  assert(lenient.report().max_norm_deviation == 0.0);
}

static CurvatureSample curv(double t, double k) {
  CurvatureSample s;
  s.timestamp = t;
  s.curvature = k;
  return s;
}

static void test_comparison() {
  std::vector<CurvatureSample> computed = {curv(2.0, 3.0), curv(0.0, 1.0), curv(1.0, 2.0),
                                           curv(3.0, 0.5), curv(9.0, 0.0)};
  std::vector<CurvatureSample> reference = {curv(0.0, 1.5), curv(1.0, 2.0), curv(2.0, 2.0),
                                            curv(3.0, std::nan(""))};
  reference[3].validity = CurvatureValidity::Stationary;

  ComparisonStats stats;
  assert(ok(compareCurvature(computed, reference, ComparisonOptions{}, &stats)));
  assert(stats.matched_count == 3);
  assert(stats.skipped_undefined == 1);
  assert(near(stats.mean_error, 0.5 / 3.0, 1e-12));
  assert(near(stats.mean_abs_error, 0.5, 1e-12));
  assert(near(stats.rmse, std::sqrt(1.25 / 3.0), 1e-12));
  assert(near(stats.max_abs_error, 1.0, 1e-12));
  assert(stats.max_abs_error_timestamp == 2.0);
  assert(near(stats.correlation, std::sqrt(3.0) / 2.0, 1e-9));

  // Time tolerance lets slightly offset clocks pair up.
  std::vector<CurvatureSample> shifted = {curv(0.0 + 1e-4, 1.0), curv(1.0 + 1e-4, 2.0)};
  assert(compareCurvature(shifted, reference, ComparisonOptions{}, &stats) == Status::Failure);
  ComparisonOptions loose;
  loose.time_tolerance = 1e-3;
  assert(ok(compareCurvature(shifted, reference, loose, &stats)));
  assert(stats.matched_count == 2);

  // A single pair has no correlation.
  assert(ok(compareCurvature({curv(0.0, 1.0)}, {curv(0.0, 1.0)}, ComparisonOptions{}, &stats)));
  assert(stats.matched_count == 1);
  assert(stats.rmse == 0.0);
  assert(std::isnan(stats.correlation));

  assert(compareCurvature(computed, reference, ComparisonOptions{}, nullptr) ==
         Status::InvalidParameter);
}

int main() {
  kappa::core::setLogSink(&captureSink);
  test_straight_line();
  test_constant_turn_and_sign();
  test_turn_across_pi();
  test_boundary_sizes();
  test_difference_schemes();
  test_zero_speed();
  test_zero_time_delta();
  test_normalization_policy();
  test_invalid_input();
  test_ordering();
  test_planar_velocity();
  test_streaming_matches_batch();
  test_streaming_errors();
  test_comparison();
  kappa::core::setLogSink(nullptr);
  std::cout << "kappa_core_curvature_test: PASS\n";
  return 0;
}
