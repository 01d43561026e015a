// =============================================================================
// genome-cleaner - Clean Command
// =============================================================================
// Command handler that sanitizes an input and writes the cleaned sequences
// as FASTA.
// =============================================================================

#ifndef GCL_COMMANDS_CLEAN_COMMAND_H
#define GCL_COMMANDS_CLEAN_COMMAND_H

#include <cstddef>
#include <filesystem>

#include "gcl/algo/validation_engine.h"
#include "gcl/common/error.h"
#include "gcl/io/fasta_writer.h"

namespace gcl::commands {

// =============================================================================
// Clean Options
// =============================================================================

/// @brief Configuration options for clean command.
struct CleanOptions {
    /// @brief Input FASTA/FASTQ path ("-" for stdin).
    std::filesystem::path inputPath;

    /// @brief Output FASTA path ("-" for stdout).
    std::filesystem::path outputPath;

    /// @brief Rule configuration; sanitize is always forced on.
    algo::ValidationConfig validation;

    io::FastaWriterOptions fastaOptions;

    /// @brief Overwrite an existing output file.
    bool forceOverwrite = false;
};

// =============================================================================
// CleanCommand Class
// =============================================================================

/// @brief Command handler for producing cleaned FASTA.
class CleanCommand {
public:
    explicit CleanCommand(CleanOptions options);

    ~CleanCommand();

    // Non-copyable, movable
    CleanCommand(const CleanCommand&) = delete;
    CleanCommand& operator=(const CleanCommand&) = delete;
    CleanCommand(CleanCommand&&) noexcept;
    CleanCommand& operator=(CleanCommand&&) noexcept;

    /// @brief Execute the clean command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const CleanOptions& options() const noexcept { return options_; }

private:
    void validateOptions() const;

    CleanOptions options_;
};

}  // namespace gcl::commands

#endif  // GCL_COMMANDS_CLEAN_COMMAND_H
