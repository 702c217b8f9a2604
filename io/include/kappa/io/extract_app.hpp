#pragma once

#include "kappa/core/curvature/curvature.hpp"
#include "kappa/core/motion/motion_sample.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace kappa::io {

// Exit codes of the kappa_extract command line.
constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;  // unreadable input, failed extraction, unwritable output
constexpr int kExitUsage = 2;    // missing or malformed arguments

// Wraps a reference curvature column as samples stamped with the log's timestamps. Empty
// reference cells stay NaN and are skipped by compareCurvature as undefined.
std::vector<kappa::core::CurvatureSample> referenceSamples(const kappa::core::MotionLog& log,
                                                           const std::vector<double>& reference);

// Runs kappa_extract with `args` (program name excluded). The summary goes to `out`, usage
// and failure messages to `err`.
int runExtract(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

}  // namespace kappa::io
