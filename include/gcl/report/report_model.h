// =============================================================================
// genome-cleaner - Report Model
// =============================================================================
// Assembles a dataset summary and the per-record table into one report
// object for export.
// =============================================================================

#ifndef GCL_REPORT_REPORT_MODEL_H
#define GCL_REPORT_REPORT_MODEL_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gcl/algo/stats_aggregator.h"
#include "gcl/common/types.h"

namespace gcl::report {

/// @brief Provenance information attached to a report.
struct ReportMetadata {
    /// @brief ISO-8601 UTC timestamp (empty when not supplied).
    std::string generatedAt;

    std::string toolVersion;

    /// @brief Input path, or "-" for stdin.
    std::string sourceName;

    std::optional<SequenceFormat> sourceFormat;

    /// @brief XXH64 of the decoded input text.
    std::optional<std::uint64_t> inputChecksum;

    std::size_t minLength = kDefaultMinLength;
    bool sanitize = false;
};

/// @brief Summary plus per-record table.
struct Report {
    ReportMetadata metadata;
    algo::DatasetSummary summary;
    std::vector<ValidatedRecord> records;
};

/// @brief Combine a summary and its records into a report.
[[nodiscard]] Report buildReport(algo::DatasetSummary summary,
                                 std::vector<ValidatedRecord> records,
                                 ReportMetadata metadata = {});

/// @brief XXH64 checksum of an input text (seed 0).
[[nodiscard]] std::uint64_t computeInputChecksum(std::string_view text) noexcept;

/// @brief Current UTC time as "YYYY-MM-DDTHH:MM:SSZ".
[[nodiscard]] std::string currentTimestamp();

}  // namespace gcl::report

#endif  // GCL_REPORT_REPORT_MODEL_H
