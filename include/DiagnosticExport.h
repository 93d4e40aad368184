#pragma once
#include "DiagnosticReport.h"

#include <string>

namespace DiagnosticExport {
std::string jsonEscape(const std::string& value);

/**
 * @brief Serializes a report as a JSON object; non-finite numbers become null.
 */
std::string toJson(const DiagnosticReport& report);

/**
 * @brief Per-sample CSV (Z_proxy/Sigma_proxy headers, so the file reloads in proxy mode).
 * A manual-only report yields a single z,sigma,G,zone row. When a report carries both a series and a
 * manual reading, only the series is written; the manual reading is kept in the JSON export.
 * Non-finite values are written as empty cells.
 */
std::string toCsv(const DiagnosticReport& report);

/**
 * @brief Writes toJson or toCsv depending on the file extension (.json / .csv).
 * `.parquet` writes the per-sample table through Arrow when built with SANDY_USE_NATIVE_PARQUET.
 * Tabular formats log a warning when the report's manual reading has to be left out.
 * @throws Sandy::ConfigurationException for any other extension, or parquet without native support.
 * @throws Sandy::IOException if the file cannot be written.
 */
void writeFile(const std::string& path, const DiagnosticReport& report);
}
