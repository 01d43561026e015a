// =============================================================================
// genome-cleaner - FASTA Writer Implementation
// =============================================================================

#include "gcl/io/fasta_writer.h"

#include <fstream>
#include <iostream>
#include <string_view>

#include "gcl/common/error.h"
#include "gcl/common/logger.h"

namespace gcl::io {

std::size_t writeFasta(std::span<const ValidatedRecord> records, std::ostream& out,
                       const FastaWriterOptions& options) {
    std::size_t written = 0;

    for (const auto& record : records) {
        if (options.validOnly && !record.isValid) {
            continue;
        }
        if (options.sanitizedOnly && !record.wasSanitized()) {
            continue;
        }

        out << kFastaMarker << record.header << '\n';

        const std::string_view sequence = record.finalSequence;
        if (options.lineWidth == 0 || sequence.size() <= options.lineWidth) {
            out << sequence << '\n';
        } else {
            for (std::size_t pos = 0; pos < sequence.size(); pos += options.lineWidth) {
                out << sequence.substr(pos, options.lineWidth) << '\n';
            }
        }
        ++written;
    }

    if (!out) {
        throw IOError("Failed to write FASTA output");
    }
    return written;
}

std::size_t writeFastaFile(std::span<const ValidatedRecord> records,
                           const std::filesystem::path& path,
                           const FastaWriterOptions& options) {
    if (path == "-") {
        return writeFasta(records, std::cout, options);
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw IOError("Failed to create output file", ErrorContext(path.string()));
    }

    const std::size_t written = writeFasta(records, file, options);
    file.close();
    if (file.fail()) {
        throw IOError("Failed to finalize output file", ErrorContext(path.string()));
    }

    GCL_LOG_DEBUG("Wrote {} records to {}", written, path.string());
    return written;
}

}  // namespace gcl::io
