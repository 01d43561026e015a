// =============================================================================
// genome-cleaner - Check Command
// =============================================================================
// Command handler for the full validation run.
//
// This module provides:
// - CheckCommand: parse, validate and summarize one input
// - Console summary on stdout
// - Optional cleaned FASTA and JSON/CSV report outputs
// =============================================================================

#ifndef GCL_COMMANDS_CHECK_COMMAND_H
#define GCL_COMMANDS_CHECK_COMMAND_H

#include <filesystem>
#include <memory>
#include <optional>

#include "gcl/algo/validation_engine.h"
#include "gcl/common/error.h"
#include "gcl/io/fasta_writer.h"
#include "gcl/report/report_writer.h"

namespace gcl::commands {

// =============================================================================
// Check Options
// =============================================================================

/// @brief Configuration options for check command.
struct CheckOptions {
    /// @brief Input FASTA/FASTQ path ("-" for stdin).
    std::filesystem::path inputPath;

    /// @brief Rule configuration (sanitize, min length, thresholds, threads).
    algo::ValidationConfig validation;

    /// @brief Cleaned FASTA output, if requested.
    std::optional<std::filesystem::path> cleanOutputPath;

    io::FastaWriterOptions fastaOptions;

    /// @brief Report output, if requested.
    std::optional<std::filesystem::path> reportPath;

    report::ReportFormat reportFormat = report::ReportFormat::kJson;

    /// @brief Suppress the console summary.
    bool quiet = false;
};

// =============================================================================
// CheckCommand Class
// =============================================================================

/// @brief Command handler for validating an input file.
class CheckCommand {
public:
    explicit CheckCommand(CheckOptions options);

    ~CheckCommand();

    // Non-copyable, movable
    CheckCommand(const CheckCommand&) = delete;
    CheckCommand& operator=(const CheckCommand&) = delete;
    CheckCommand(CheckCommand&&) noexcept;
    CheckCommand& operator=(CheckCommand&&) noexcept;

    /// @brief Execute the check command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const CheckOptions& options() const noexcept { return options_; }

private:
    /// @brief Validate option combinations.
    void validateOptions() const;

    CheckOptions options_;
};

}  // namespace gcl::commands

#endif  // GCL_COMMANDS_CHECK_COMMAND_H
