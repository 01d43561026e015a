// =============================================================================
// genome-cleaner - Sequence Parser
// =============================================================================
// Line-oriented FASTA/FASTQ parser with content-based format detection.
//
// This module provides:
// - detectSequenceFormat(): FASTA vs FASTQ from the first non-blank line
// - SequenceParser: Parses an in-memory text into ordered RawRecords
// - ParserStats: Counters collected while parsing
//
// Usage:
//   SequenceParser parser("reads.fq");
//   auto records = parser.parse(text);
//   GCL_LOG_INFO("{} records", parser.stats().totalRecords);
//
// Whitespace anywhere inside a sequence line is dropped, so "ACGT ACGT" reads
// as "ACGTACGT". Headers keep their interior whitespace.
//
// The whole input is held in memory; the caller supplies the text already
// materialized (see readInputText() in compressed_stream.h).
// =============================================================================

#ifndef GCL_IO_SEQUENCE_PARSER_H
#define GCL_IO_SEQUENCE_PARSER_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gcl/common/error.h"
#include "gcl/common/types.h"

namespace gcl::io {

// =============================================================================
// Parser Statistics
// =============================================================================

/// @brief Statistics collected during parsing.
struct ParserStats {
    /// @brief Detected format (unset for empty input).
    std::optional<SequenceFormat> format;

    /// @brief Total records produced.
    std::uint64_t totalRecords = 0;

    /// @brief Total sequence characters across all records.
    std::uint64_t totalBases = 0;

    /// @brief Physical lines consumed (blank lines included).
    std::uint64_t linesRead = 0;

    /// @brief Lines of an incomplete trailing FASTQ block that were dropped.
    std::uint64_t droppedTrailingLines = 0;

    void update(const RawRecord& record) noexcept {
        ++totalRecords;
        totalBases += record.sequence.size();
    }

    void reset() noexcept { *this = ParserStats{}; }
};

// =============================================================================
// Format Detection
// =============================================================================

/// @brief Detect the input format from its first non-blank line.
/// @param text Raw input text.
/// @return kFasta for '>', kFastq for '@', nullopt when the text has no
///         non-blank line.
/// @throws FormatError if the first non-blank line starts with anything else.
[[nodiscard]] std::optional<SequenceFormat> detectSequenceFormat(std::string_view text);

// =============================================================================
// SequenceParser Class
// =============================================================================

/// @brief FASTA/FASTQ parser producing RawRecords in file order.
///
/// Thread Safety:
/// - A parser instance is not thread-safe; parse() resets its statistics.
/// - Separate instances may be used concurrently.
class SequenceParser {
public:
    /// @brief Construct a parser.
    /// @param sourceName Name reported in error context (usually the file path).
    explicit SequenceParser(std::string sourceName = "<memory>");

    /// @brief Parse raw text into records.
    /// @return Records in file order; empty for blank input.
    /// @throws FormatError if no FASTA/FASTQ start marker is found or a FASTQ
    ///         block is malformed.
    [[nodiscard]] std::vector<RawRecord> parse(std::string_view text);

    /// @brief Statistics of the last parse() call.
    [[nodiscard]] const ParserStats& stats() const noexcept { return stats_; }

    [[nodiscard]] const std::string& sourceName() const noexcept { return sourceName_; }

private:
    [[nodiscard]] std::vector<RawRecord> parseFasta(std::string_view text);

    [[nodiscard]] std::vector<RawRecord> parseFastq(std::string_view text);

    std::string sourceName_;

    ParserStats stats_;
};

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Parse text with a default-constructed parser.
[[nodiscard]] std::vector<RawRecord> parseSequences(std::string_view text);

/// @brief Strip leading and trailing ASCII whitespace.
[[nodiscard]] std::string_view trimWhitespace(std::string_view str) noexcept;

}  // namespace gcl::io

#endif  // GCL_IO_SEQUENCE_PARSER_H
