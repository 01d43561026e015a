// =============================================================================
// genome-cleaner - Report Writers
// =============================================================================
// JSON and CSV serialization of a Report.
//
// JSON layout:
//   { "metadata": {...}, "summary": {...}, "error_histogram": {...},
//     "top_longest": [...], "records": [...] }
//
// CSV layout: a per-record table, a blank line, a SUMMARY key/value block and
// a TOP LONGEST block. Fields are quoted per RFC 4180 when needed.
// =============================================================================

#ifndef GCL_REPORT_REPORT_WRITER_H
#define GCL_REPORT_REPORT_WRITER_H

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>

#include "gcl/common/error.h"
#include "gcl/report/report_model.h"

namespace gcl::report {

/// @brief Report serialization formats.
enum class ReportFormat : std::uint8_t {
    kJson = 0,
    kCsv = 1
};

/// @brief Lowercase format name ("json" or "csv").
[[nodiscard]] std::string_view reportFormatToString(ReportFormat format) noexcept;

/// @brief Parse a format name (case-insensitive).
/// @return The format, or a usage error for unknown names.
[[nodiscard]] Result<ReportFormat> parseReportFormat(std::string_view name);

/// @brief Write the report as a JSON document.
void writeJsonReport(const Report& report, std::ostream& out);

/// @brief Write the report as CSV.
void writeCsvReport(const Report& report, std::ostream& out);

/// @brief Write a human-readable summary (console output of `check`).
void writeTextSummary(const algo::DatasetSummary& summary, std::ostream& out);

/// @brief Write the report in the given format.
void writeReport(const Report& report, ReportFormat format, std::ostream& out);

/// @brief Write the report to a file ("-" writes to stdout).
/// @throws IOError if the file cannot be created or written.
void writeReportFile(const Report& report, ReportFormat format, const std::filesystem::path& path);

/// @brief Escape a string for inclusion inside JSON double quotes.
[[nodiscard]] std::string escapeJson(std::string_view text);

/// @brief Quote a CSV field when it contains a comma, quote or line break.
[[nodiscard]] std::string quoteCsvField(std::string_view field);

}  // namespace gcl::report

#endif  // GCL_REPORT_REPORT_WRITER_H
