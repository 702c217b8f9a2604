#pragma once

#include "kappa/core/common/status.hpp"
#include "kappa/core/curvature/curvature.hpp"
#include "kappa/io/motion_log_csv.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace kappa::io {

using kappa::core::Status;

struct CsvWriteOptions {
  std::string column_name = "curvature_feature";
  bool include_validity = true;
};

// Writes header `timestamp,<column_name>[,validity]` and one row per sample. Undefined
// curvature is written as `nan` so the column stays numeric for downstream readers.
Status writeCurvatureCsv(const std::vector<kappa::core::CurvatureSample>& samples,
                         std::ostream& out,
                         const CsvWriteOptions& opt = {});

Status writeCurvatureCsv(const std::vector<kappa::core::CurvatureSample>& samples,
                         const std::string& csv_path,
                         const CsvWriteOptions& opt = {});

// Copies `table` unchanged and appends `<column_name>[,validity]` to the header and to each
// row, using the table's delimiter. `samples` must be parallel to `table.rows`.
Status writeAugmentedCsv(const CsvTable& table,
                         const std::vector<kappa::core::CurvatureSample>& samples,
                         std::ostream& out,
                         const CsvWriteOptions& opt = {});

Status writeAugmentedCsv(const CsvTable& table,
                         const std::vector<kappa::core::CurvatureSample>& samples,
                         const std::string& csv_path,
                         const CsvWriteOptions& opt = {});

}  // namespace kappa::io
