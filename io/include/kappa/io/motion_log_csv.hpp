#pragma once

#include "kappa/core/common/status.hpp"
#include "kappa/core/motion/motion_sample.hpp"

#include <istream>
#include <string>
#include <vector>

namespace kappa::io {

using kappa::core::Status;

// Column layout of an ego-motion CSV. Columns are matched by header name, so order and
// extra columns do not matter.
struct CsvReadOptions {
  std::string timestamp_column = "timestamp";
  std::string qw_column = "qw";
  std::string qx_column = "qx";
  std::string qy_column = "qy";
  std::string qz_column = "qz";
  std::string vx_column = "vx";
  std::string vy_column = "vy";
  std::string vz_column = "vz";  // optional; 0 when absent

  // Optional ground-truth column; empty disables it.
  std::string reference_column = "curvature";

  // Multiplies raw timestamps into seconds (ego-motion logs store microseconds).
  double timestamp_scale = 1e-6;

  char delimiter = ',';
};

// Raw text of the input rows, kept so derived columns can be appended next to them.
// `rows` holds one entry per parsed sample (blank lines dropped, line endings stripped).
struct CsvTable {
  std::string header;
  std::vector<std::string> rows;
  char delimiter = ',';
};

// Reads a header row plus one sample per data row. Blank lines are skipped.
//
// `reference` (optional) receives the reference column parallel to `log`, with NaN for empty
// or non-numeric cells; it is cleared when the column is absent. `table` (optional) receives
// the raw rows parallel to `log`. Cells may be wrapped in double quotes. Missing required
// columns and malformed numeric cells fail with Status::ParseError.
Status parseMotionLogCsv(std::istream& in,
                         const CsvReadOptions& opt,
                         kappa::core::MotionLog* log,
                         std::vector<double>* reference = nullptr,
                         CsvTable* table = nullptr);

Status readMotionLogCsv(const std::string& csv_path,
                        const CsvReadOptions& opt,
                        kappa::core::MotionLog* log,
                        std::vector<double>* reference = nullptr,
                        CsvTable* table = nullptr);

}  // namespace kappa::io
