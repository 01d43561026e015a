// =============================================================================
// genome-cleaner - FASTA Writer
// =============================================================================
// Exports validated records as FASTA, using each record's final sequence.
// =============================================================================

#ifndef GCL_IO_FASTA_WRITER_H
#define GCL_IO_FASTA_WRITER_H

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <span>

#include "gcl/common/types.h"

namespace gcl::io {

/// @brief FASTA export options.
struct FastaWriterOptions {
    /// @brief Bases per sequence line (0 = single line).
    std::size_t lineWidth = 0;

    /// @brief Only emit records changed by sanitization.
    bool sanitizedOnly = false;

    /// @brief Only emit records without errors.
    bool validOnly = false;
};

/// @brief Write records as FASTA.
/// @return Number of records written.
/// @throws IOError on stream failure.
std::size_t writeFasta(std::span<const ValidatedRecord> records, std::ostream& out,
                       const FastaWriterOptions& options = {});

/// @brief Write records as FASTA to a file ("-" writes to stdout).
/// @return Number of records written.
/// @throws IOError if the file cannot be created or written.
std::size_t writeFastaFile(std::span<const ValidatedRecord> records,
                           const std::filesystem::path& path,
                           const FastaWriterOptions& options = {});

}  // namespace gcl::io

#endif  // GCL_IO_FASTA_WRITER_H
