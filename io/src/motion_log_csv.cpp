#include "kappa/io/motion_log_csv.hpp"

#include "kappa/core/common/logger.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace kappa::io {

using kappa::core::LogLevel;
using kappa::core::Quat;
using kappa::core::Vec3;
using kappa::core::log;

static std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

static std::vector<std::string> splitRow(const std::string& line, char delim) {
  std::vector<std::string> cells;
  std::size_t start = 0;
  while (true) {
    const std::size_t pos = line.find(delim, start);
    std::string_view cell = trim(std::string_view(line).substr(
        start, pos == std::string::npos ? std::string::npos : pos - start));
    if (cell.size() >= 2 && cell.front() == '"' && cell.back() == '"') {
      cell = trim(cell.substr(1, cell.size() - 2));
    }
    cells.emplace_back(cell);
    if (pos == std::string::npos) break;
    start = pos + 1;
  }
  return cells;
}

static bool parseDouble(const std::string& cell, double* out) {
  if (cell.empty()) return false;
  char* end = nullptr;
  const double v = std::strtod(cell.c_str(), &end);
  if (end != cell.c_str() + cell.size()) return false;
  *out = v;
  return true;
}

static bool isBlank(const std::string& line) {
  return trim(line).empty();
}

static void stripLineEnding(std::string* line) {
  if (!line->empty() && line->back() == '\r') line->pop_back();
}

Status parseMotionLogCsv(std::istream& in,
                         const CsvReadOptions& opt,
                         kappa::core::MotionLog* log_out,
                         std::vector<double>* reference,
                         CsvTable* table) {
  if (!log_out) {
    log(LogLevel::Error, "parseMotionLogCsv: output is null");
    return Status::InvalidParameter;
  }
  if (!(opt.timestamp_scale > 0.0) || !std::isfinite(opt.timestamp_scale)) {
    log(LogLevel::Error, "parseMotionLogCsv: timestamp_scale must be finite and > 0");
    return Status::InvalidParameter;
  }

  std::string line;
  std::size_t line_no = 0;
  bool have_header = false;
  while (std::getline(in, line)) {
    ++line_no;
    if (!isBlank(line)) {
      have_header = true;
      break;
    }
  }
  if (!have_header) {
    log(LogLevel::Error, "parseMotionLogCsv: missing header row");
    return Status::ParseError;
  }
  if (line.rfind("\xEF\xBB\xBF", 0) == 0) line.erase(0, 3);
  stripLineEnding(&line);

  CsvTable raw;
  raw.header = line;
  raw.delimiter = opt.delimiter;

  std::unordered_map<std::string, std::size_t> column_index;
  const std::vector<std::string> header = splitRow(line, opt.delimiter);
  for (std::size_t i = 0; i < header.size(); ++i) {
    column_index.emplace(header[i], i);
  }

  auto find = [&column_index](const std::string& name) -> long {
    if (name.empty()) return -1;
    const auto it = column_index.find(name);
    return it == column_index.end() ? -1 : static_cast<long>(it->second);
  };

  const std::string required[] = {opt.timestamp_column, opt.qw_column, opt.qx_column,
                                  opt.qy_column, opt.qz_column, opt.vx_column, opt.vy_column};
  long idx[7];
  for (int k = 0; k < 7; ++k) {
    idx[k] = find(required[k]);
    if (idx[k] < 0) {
      log(LogLevel::Error, "parseMotionLogCsv: missing required column '" + required[k] + "'");
      return Status::ParseError;
    }
  }
  const long idx_vz = find(opt.vz_column);
  const long idx_ref = find(opt.reference_column);

  kappa::core::MotionLog parsed;
  std::vector<double> ref;

  while (std::getline(in, line)) {
    ++line_no;
    if (isBlank(line)) continue;
    stripLineEnding(&line);
    const std::vector<std::string> cells = splitRow(line, opt.delimiter);

    auto cellValue = [&](long col, const std::string& name, double* out) -> bool {
      if (col >= static_cast<long>(cells.size()) || !parseDouble(cells[col], out)) {
        std::ostringstream oss;
        oss << "parseMotionLogCsv: line " << line_no << ": bad value for column '" << name << "'";
        log(LogLevel::Error, oss.str());
        return false;
      }
      return true;
    };

    double v[7];
    for (int k = 0; k < 7; ++k) {
      if (!cellValue(idx[k], required[k], &v[k])) return Status::ParseError;
    }
    double vz = 0.0;
    if (idx_vz >= 0 && !cellValue(idx_vz, opt.vz_column, &vz)) return Status::ParseError;

    parsed.timestamps.push_back(v[0] * opt.timestamp_scale);
    parsed.orientations.emplace_back(v[1], v[2], v[3], v[4]);  // Eigen order: w, x, y, z
    parsed.velocities.emplace_back(v[5], v[6], vz);

    if (idx_ref >= 0) {
      double r = std::numeric_limits<double>::quiet_NaN();
      if (idx_ref < static_cast<long>(cells.size()) && !parseDouble(cells[idx_ref], &r)) {
        r = std::numeric_limits<double>::quiet_NaN();
      }
      ref.push_back(r);
    }
    if (table) raw.rows.push_back(line);
  }

  if (in.bad()) {
    log(LogLevel::Error, "parseMotionLogCsv: stream read failure");
    return Status::Failure;
  }

  if (kappa::core::shouldLog(LogLevel::Info)) {
    std::ostringstream oss;
    oss << "parseMotionLogCsv: " << parsed.size() << " rows"
        << (idx_vz >= 0 ? "" : " (no vz column, planar velocity)")
        << (idx_ref >= 0 ? ", reference column present" : "");
    log(LogLevel::Info, oss.str());
  }

  *log_out = std::move(parsed);
  if (reference) *reference = std::move(ref);
  if (table) *table = std::move(raw);
  return Status::Success;
}

Status readMotionLogCsv(const std::string& csv_path,
                        const CsvReadOptions& opt,
                        kappa::core::MotionLog* log_out,
                        std::vector<double>* reference,
                        CsvTable* table) {
  std::ifstream in(csv_path);
  if (!in) {
    log(LogLevel::Error, "readMotionLogCsv: failed to open " + csv_path);
    return Status::Failure;
  }
  return parseMotionLogCsv(in, opt, log_out, reference, table);
}

}  // namespace kappa::io
