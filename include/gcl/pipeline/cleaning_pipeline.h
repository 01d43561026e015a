// =============================================================================
// genome-cleaner - Cleaning Pipeline
// =============================================================================
// End-to-end run shared by all subcommands:
// 1. Load   - read (and decompress) the input into memory, checksum it
// 2. Parse  - SequenceParser -> RawRecords
// 3. Check  - ValidationEngine -> ValidatedRecords
// 4. Stats  - StatsAggregator -> DatasetSummary
//
// Exporting (FASTA, reports) is left to the caller.
// =============================================================================

#ifndef GCL_PIPELINE_CLEANING_PIPELINE_H
#define GCL_PIPELINE_CLEANING_PIPELINE_H

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "gcl/algo/stats_aggregator.h"
#include "gcl/algo/validation_engine.h"
#include "gcl/common/types.h"
#include "gcl/io/sequence_parser.h"
#include "gcl/report/report_model.h"

namespace gcl::pipeline {

// =============================================================================
// Pipeline Statistics
// =============================================================================

/// @brief Statistics collected during a pipeline run.
struct PipelineStats {
    /// @brief Decoded input size in bytes.
    std::uint64_t inputBytes = 0;

    /// @brief XXH64 of the decoded input.
    std::uint64_t inputChecksum = 0;

    /// @brief Parser counters (format, records, dropped lines).
    io::ParserStats parser;

    /// @brief Wall time per stage (milliseconds).
    std::uint64_t loadTimeMs = 0;
    std::uint64_t parseTimeMs = 0;
    std::uint64_t validateTimeMs = 0;
    std::uint64_t summarizeTimeMs = 0;

    [[nodiscard]] std::uint64_t totalTimeMs() const noexcept {
        return loadTimeMs + parseTimeMs + validateTimeMs + summarizeTimeMs;
    }

    /// @brief Get throughput (MB/s)
    [[nodiscard]] double throughputMBps() const noexcept {
        const std::uint64_t totalMs = totalTimeMs();
        if (totalMs == 0) return 0.0;
        return (static_cast<double>(inputBytes) / (1024.0 * 1024.0)) /
               (static_cast<double>(totalMs) / 1000.0);
    }
};

/// @brief Output of a pipeline run.
struct PipelineResult {
    std::string sourceName;
    std::vector<ValidatedRecord> records;
    algo::DatasetSummary summary;
    PipelineStats stats;
};

// =============================================================================
// CleaningPipeline Class
// =============================================================================

/// @brief Runs load, parse, validate and summarize for one input.
class CleaningPipeline {
public:
    /// @throws UsageError if the validation configuration is invalid.
    explicit CleaningPipeline(algo::ValidationConfig config);

    /// @brief Run on a file ("-" for stdin), decompressing as needed.
    /// @throws IOError, FormatError
    [[nodiscard]] PipelineResult run(const std::filesystem::path& inputPath) const;

    /// @brief Run on in-memory text.
    /// @throws FormatError
    [[nodiscard]] PipelineResult runOnText(std::string_view text,
                                           std::string sourceName = "<memory>") const;

    [[nodiscard]] const algo::ValidationConfig& config() const noexcept {
        return engine_.config();
    }

private:
    algo::ValidationEngine engine_;
};

/// @brief Build report metadata describing a pipeline run.
[[nodiscard]] report::ReportMetadata makeReportMetadata(const PipelineResult& result,
                                                        const algo::ValidationConfig& config);

}  // namespace gcl::pipeline

#endif  // GCL_PIPELINE_CLEANING_PIPELINE_H
