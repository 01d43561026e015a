// =============================================================================
// genome-cleaner - Report Command
// =============================================================================
// Command handler that validates an input and emits only the JSON/CSV report.
// =============================================================================

#ifndef GCL_COMMANDS_REPORT_COMMAND_H
#define GCL_COMMANDS_REPORT_COMMAND_H

#include <filesystem>

#include "gcl/algo/validation_engine.h"
#include "gcl/common/error.h"
#include "gcl/report/report_writer.h"

namespace gcl::commands {

// =============================================================================
// Report Options
// =============================================================================

/// @brief Configuration options for report command.
struct ReportOptions {
    /// @brief Input FASTA/FASTQ path ("-" for stdin).
    std::filesystem::path inputPath;

    /// @brief Report destination ("-" for stdout).
    std::filesystem::path outputPath = "-";

    report::ReportFormat format = report::ReportFormat::kJson;

    algo::ValidationConfig validation;
};

// =============================================================================
// ReportCommand Class
// =============================================================================

/// @brief Command handler for report-only runs.
class ReportCommand {
public:
    explicit ReportCommand(ReportOptions options);

    ~ReportCommand();

    // Non-copyable, movable
    ReportCommand(const ReportCommand&) = delete;
    ReportCommand& operator=(const ReportCommand&) = delete;
    ReportCommand(ReportCommand&&) noexcept;
    ReportCommand& operator=(ReportCommand&&) noexcept;

    /// @brief Execute the report command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const ReportOptions& options() const noexcept { return options_; }

private:
    ReportOptions options_;
};

}  // namespace gcl::commands

#endif  // GCL_COMMANDS_REPORT_COMMAND_H
