#include "kappa/io/extract_app.hpp"

#include "kappa/core/common/logger.hpp"
#include "kappa/core/common/status.hpp"
#include "kappa/core/curvature/comparison.hpp"
#include "kappa/io/curvature_csv.hpp"
#include "kappa/io/motion_log_csv.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <numeric>
#include <utility>

namespace kappa::io {

using kappa::core::ComparisonOptions;
using kappa::core::ComparisonStats;
using kappa::core::CurvatureOptions;
using kappa::core::CurvatureResult;
using kappa::core::CurvatureSample;
using kappa::core::DifferenceScheme;
using kappa::core::LogLevel;
using kappa::core::MotionLog;
using kappa::core::NormalizationPolicy;
using kappa::core::SignConvention;
using kappa::core::ok;
using kappa::core::setLogLevel;
using kappa::core::statusToString;

namespace {

using Args = std::vector<std::string>;

bool parseFlag(const Args& args, const char* key) {
  return std::find(args.begin(), args.end(), key) != args.end();
}

std::string parseStringArg(const Args& args, const char* key, std::string def = {}) {
  const std::string prefix = std::string(key) + "=";
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == key && i + 1 < args.size()) {
      return args[i + 1];
    }
    if (args[i].compare(0, prefix.size(), prefix) == 0) {
      return args[i].substr(prefix.size());
    }
  }
  return def;
}

// Missing key keeps `def`; a present but malformed value is an error.
bool parseDoubleArg(const Args& args, const char* key, double def, double* out,
                    std::ostream& err) {
  const std::string text = parseStringArg(args, key);
  if (text.empty()) {
    *out = def;
    return true;
  }
  char* end = nullptr;
  const double v = std::strtod(text.c_str(), &end);
  if (end != text.c_str() + text.size() || !std::isfinite(v)) {
    err << "Invalid value for " << key << ": " << text << "\n";
    return false;
  }
  *out = v;
  return true;
}

void printHelp(std::ostream& out) {
  out << "Usage: kappa_extract --input <egomotion.csv> [options]\n\n";
  out << "Computes roadway curvature from an ego-motion log (timestamp, qw, qx, qy, qz,\n";
  out << "vx, vy[, vz]) and writes the input rows back with the curvature column appended.\n\n";
  out << "Options:\n";
  out << "  --output <out.csv>                Output path (default: curvature_feature.csv)\n";
  out << "  --column <name>                   Output column name (default: curvature_feature)\n";
  out << "  --column-only                     Write only timestamp, curvature and validity\n";
  out << "  --reference-column <name>         Reference curvature column (default: curvature)\n";
  out << "  --no-reference                    Skip comparison against a reference column\n";
  out << "  --timestamp-scale <s>             Seconds per raw timestamp unit (default: 1e-6)\n";
  out << "  --scheme central|forward|backward Yaw-rate difference scheme (default: central)\n";
  out << "  --sign left-negative|left-positive\n";
  out << "                                    Turn direction reported as negative (default: left-negative)\n";
  out << "  --stationary-speed <m/s>          Undefined below this speed (default: 0.01)\n";
  out << "  --min-dt <s>                      Time deltas <= this are degenerate (default: 0)\n";
  out << "  --quat-tol <tol>                  Allowed | |q| - 1 | (default: 1e-6)\n";
  out << "  --reject-unnormalized             Fail instead of normalizing orientations\n";
  out << "  --sort                            Reorder rows by timestamp instead of failing\n";
  out << "  --log-level error|warn|info|debug Log verbosity (default: warn)\n";
  out << "  --verbose                         Set log level to INFO\n";
}

bool parseScheme(const std::string& s, DifferenceScheme* out) {
  if (s == "central") { *out = DifferenceScheme::Central; return true; }
  if (s == "forward") { *out = DifferenceScheme::Forward; return true; }
  if (s == "backward") { *out = DifferenceScheme::Backward; return true; }
  return false;
}

bool parseSign(const std::string& s, SignConvention* out) {
  if (s == "left-negative") { *out = SignConvention::LeftNegative; return true; }
  if (s == "left-positive") { *out = SignConvention::LeftPositive; return true; }
  return false;
}

// Puts raw rows in the order extractCurvature emits samples after reordering.
void sortRowsByTimestamp(const std::vector<double>& timestamps, CsvTable* table) {
  std::vector<std::size_t> order(timestamps.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::stable_sort(order.begin(), order.end(), [&timestamps](std::size_t a, std::size_t b) {
    return timestamps[a] < timestamps[b];
  });
  std::vector<std::string> rows;
  rows.reserve(order.size());
  for (std::size_t i : order) rows.push_back(std::move(table->rows[i]));
  table->rows = std::move(rows);
}

}  // namespace

std::vector<CurvatureSample> referenceSamples(const MotionLog& log,
                                              const std::vector<double>& reference) {
  std::vector<CurvatureSample> out;
  const std::size_t n = std::min(log.timestamps.size(), reference.size());
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    CurvatureSample r;
    r.timestamp = log.timestamps[i];
    r.curvature = reference[i];
    out.push_back(r);
  }
  return out;
}

int runExtract(const Args& args, std::ostream& out, std::ostream& err) {
  if (!args.empty() && (args[0] == "--help" || args[0] == "-h")) {
    printHelp(out);
    return kExitOk;
  }

  if (parseFlag(args, "--verbose")) {
    setLogLevel(LogLevel::Info);
  }
  const std::string level_text = parseStringArg(args, "--log-level");
  if (!level_text.empty()) {
    LogLevel level;
    if (!kappa::core::parseLogLevel(level_text, &level)) {
      err << "Invalid --log-level: " << level_text << "\n";
      return kExitUsage;
    }
    setLogLevel(level);
  }

  const std::string input_path = parseStringArg(args, "--input");
  if (input_path.empty()) {
    err << "Missing required argument --input. Run with --help for usage.\n";
    return kExitUsage;
  }
  const std::string output_path = parseStringArg(args, "--output", "curvature_feature.csv");

  CsvReadOptions read_opt;
  read_opt.reference_column = parseFlag(args, "--no-reference")
      ? std::string()
      : parseStringArg(args, "--reference-column", "curvature");

  CurvatureOptions opt;
  if (!parseDoubleArg(args, "--timestamp-scale", read_opt.timestamp_scale,
                      &read_opt.timestamp_scale, err) ||
      !parseDoubleArg(args, "--stationary-speed", opt.thr.stationary_speed,
                      &opt.thr.stationary_speed, err) ||
      !parseDoubleArg(args, "--min-dt", opt.thr.min_time_delta, &opt.thr.min_time_delta, err) ||
      !parseDoubleArg(args, "--quat-tol", opt.thr.quat_norm_tolerance,
                      &opt.thr.quat_norm_tolerance, err)) {
    return kExitUsage;
  }
  if (!parseScheme(parseStringArg(args, "--scheme", "central"), &opt.scheme)) {
    err << "Invalid --scheme. Run with --help for usage.\n";
    return kExitUsage;
  }
  if (!parseSign(parseStringArg(args, "--sign", "left-negative"), &opt.sign)) {
    err << "Invalid --sign. Run with --help for usage.\n";
    return kExitUsage;
  }
  if (parseFlag(args, "--reject-unnormalized")) {
    opt.normalization = NormalizationPolicy::Reject;
  }
  opt.sort_by_timestamp = parseFlag(args, "--sort");

  CsvWriteOptions write_opt;
  write_opt.column_name = parseStringArg(args, "--column", "curvature_feature");
  const bool column_only = parseFlag(args, "--column-only");

  MotionLog motion_log;
  std::vector<double> reference;
  CsvTable table;
  Status st = readMotionLogCsv(input_path, read_opt, &motion_log, &reference, &table);
  if (!ok(st)) {
    err << "Failed to read ego-motion log: " << input_path << " (" << statusToString(st) << ")\n";
    return kExitFailure;
  }

  const CurvatureResult res = kappa::core::extractCurvature(motion_log, opt);
  if (!ok(res.status)) {
    err << "Curvature extraction failed: " << statusToString(res.status) << "\n";
    return kExitFailure;
  }
  if (res.report.reordered) sortRowsByTimestamp(motion_log.timestamps, &table);

  out << "Samples: " << res.samples.size() << " (" << res.definedCount() << " defined, "
      << res.report.stationary_count << " stationary, "
      << res.report.zero_time_delta_count << " zero-dt)\n";
  if (res.report.normalized_count > 0) {
    out << "Normalized orientations: " << res.report.normalized_count
        << " (max deviation " << res.report.max_norm_deviation << ")\n";
  }

  if (!reference.empty()) {
    ComparisonStats stats;
    st = kappa::core::compareCurvature(res.samples, referenceSamples(motion_log, reference),
                                       ComparisonOptions{}, &stats);
    if (ok(st)) {
      out << "Reference '" << read_opt.reference_column << "': " << stats.matched_count
          << " pairs, " << stats.skipped_undefined << " skipped, mean err " << stats.mean_error
          << ", MAE " << stats.mean_abs_error << ", RMSE " << stats.rmse << ", max |err| "
          << stats.max_abs_error << " at t=" << stats.max_abs_error_timestamp
          << ", correlation " << stats.correlation << "\n";
    } else {
      out << "Reference '" << read_opt.reference_column << "': no comparable samples\n";
    }
  }

  st = column_only ? writeCurvatureCsv(res.samples, output_path, write_opt)
                   : writeAugmentedCsv(table, res.samples, output_path, write_opt);
  if (!ok(st)) {
    err << "Failed to write curvature CSV: " << output_path << " (" << statusToString(st)
        << ")\n";
    return kExitFailure;
  }

  out << "Wrote: " << output_path << "\n";
  return kExitOk;
}

}  // namespace kappa::io
