#include "kappa/io/curvature_csv.hpp"

#include "kappa/core/common/logger.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace kappa::io {

using kappa::core::CurvatureSample;
using kappa::core::LogLevel;
using kappa::core::curvatureValidityToString;
using kappa::core::log;

static void writeCurvatureCell(const CurvatureSample& s, std::ostream& out) {
  if (s.isDefined() && std::isfinite(s.curvature)) {
    out << s.curvature;
  } else {
    out << "nan";
  }
}

Status writeCurvatureCsv(const std::vector<CurvatureSample>& samples,
                         std::ostream& out,
                         const CsvWriteOptions& opt) {
  if (opt.column_name.empty() || opt.column_name.find(',') != std::string::npos) {
    log(LogLevel::Error, "writeCurvatureCsv: column name must be non-empty and contain no commas");
    return Status::InvalidParameter;
  }
  for (const auto& s : samples) {
    if (!std::isfinite(s.timestamp)) {
      log(LogLevel::Error, "writeCurvatureCsv: NaN/Inf timestamp in samples");
      return Status::InvalidParameter;
    }
  }

  out << std::setprecision(17);
  out << "timestamp," << opt.column_name;
  if (opt.include_validity) out << ",validity";
  out << "\n";

  for (const auto& s : samples) {
    out << s.timestamp << ",";
    writeCurvatureCell(s, out);
    if (opt.include_validity) out << "," << curvatureValidityToString(s.validity);
    out << "\n";
  }

  if (!out) {
    log(LogLevel::Error, "writeCurvatureCsv: write failed");
    return Status::Failure;
  }
  return Status::Success;
}

Status writeCurvatureCsv(const std::vector<CurvatureSample>& samples,
                         const std::string& csv_path,
                         const CsvWriteOptions& opt) {
  std::ofstream out(csv_path);
  if (!out) {
    log(LogLevel::Error, "writeCurvatureCsv: failed to open output file " + csv_path);
    return Status::Failure;
  }
  return writeCurvatureCsv(samples, out, opt);
}

Status writeAugmentedCsv(const CsvTable& table,
                         const std::vector<CurvatureSample>& samples,
                         std::ostream& out,
                         const CsvWriteOptions& opt) {
  if (opt.column_name.empty() || opt.column_name.find(table.delimiter) != std::string::npos) {
    log(LogLevel::Error, "writeAugmentedCsv: column name must be non-empty and free of the delimiter");
    return Status::InvalidParameter;
  }
  if (samples.size() != table.rows.size()) {
    std::ostringstream oss;
    oss << "writeAugmentedCsv: " << samples.size() << " samples for " << table.rows.size()
        << " rows";
    log(LogLevel::Error, oss.str());
    return Status::ShapeMismatch;
  }

  const char d = table.delimiter;
  out << std::setprecision(17);
  out << table.header << d << opt.column_name;
  if (opt.include_validity) out << d << "validity";
  out << "\n";

  for (std::size_t i = 0; i < samples.size(); ++i) {
    out << table.rows[i] << d;
    writeCurvatureCell(samples[i], out);
    if (opt.include_validity) out << d << curvatureValidityToString(samples[i].validity);
    out << "\n";
  }

  if (!out) {
    log(LogLevel::Error, "writeAugmentedCsv: write failed");
    return Status::Failure;
  }
  return Status::Success;
}

Status writeAugmentedCsv(const CsvTable& table,
                         const std::vector<CurvatureSample>& samples,
                         const std::string& csv_path,
                         const CsvWriteOptions& opt) {
  std::ofstream out(csv_path);
  if (!out) {
    log(LogLevel::Error, "writeAugmentedCsv: failed to open output file " + csv_path);
    return Status::Failure;
  }
  return writeAugmentedCsv(table, samples, out, opt);
}

}  // namespace kappa::io
