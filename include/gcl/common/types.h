// =============================================================================
// genome-cleaner - Common Type Definitions
// =============================================================================
// Core type definitions for the genome-cleaner library.
//
// This module defines:
// - SequenceFormat: Detected input format (FASTA / FASTQ)
// - RecordError: Closed set of per-record validation findings
// - RawRecord: One parsed entry, as read from the input
// - ValidatedRecord: A RawRecord after rule evaluation
// - Alphabet helpers shared by the parser, sanitizer and validator
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef GCL_COMMON_TYPES_H
#define GCL_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gcl {

// =============================================================================
// Constants
// =============================================================================

/// @brief Tool version reported by --version and in report metadata.
inline constexpr std::string_view kToolVersion = "0.1.0";

/// @brief Allowed nucleotide alphabet (compared case-insensitively).
inline constexpr std::string_view kAllowedBases = "ACGTN";

/// @brief Unknown-base sentinel substituted for illegal characters.
inline constexpr char kSentinelBase = 'N';

/// @brief Default minimum sequence length.
inline constexpr std::size_t kDefaultMinLength = 20;

/// @brief Maximum number of entries in the longest-sequences ranking.
inline constexpr std::size_t kTopLongestLimit = 10;

/// @brief Record marker for FASTA headers.
inline constexpr char kFastaMarker = '>';

/// @brief Record marker for FASTQ headers.
inline constexpr char kFastqMarker = '@';

/// @brief Marker for the FASTQ separator line.
inline constexpr char kFastqSeparator = '+';

// =============================================================================
// Sequence Format Enumeration
// =============================================================================

/// @brief Input text format, detected from content (never from extension).
enum class SequenceFormat : std::uint8_t {
    kFasta = 0,
    kFastq = 1
};

[[nodiscard]] constexpr std::string_view sequenceFormatToString(SequenceFormat format) noexcept {
    switch (format) {
        case SequenceFormat::kFasta:
            return "fasta";
        case SequenceFormat::kFastq:
            return "fastq";
    }
    return "unknown";
}

// =============================================================================
// Record Error Enumeration
// =============================================================================

/// @brief Per-record validation findings.
/// @note Declaration order is rule evaluation order; it is also the order in
///       which codes appear in ValidatedRecord::errors.
enum class RecordError : std::uint8_t {
    kEmptySequence = 0,
    kInvalidCharacters = 1,
    kBelowMinLength = 2,
    kDuplicateHeader = 3,
    kLowComplexity = 4
};

/// @brief Number of RecordError values.
inline constexpr std::size_t kRecordErrorCount = 5;

/// @brief All RecordError values in rule order.
inline constexpr RecordError kAllRecordErrors[kRecordErrorCount] = {
    RecordError::kEmptySequence, RecordError::kInvalidCharacters, RecordError::kBelowMinLength,
    RecordError::kDuplicateHeader, RecordError::kLowComplexity};

/// @brief Stable name used in logs and exported reports.
[[nodiscard]] constexpr std::string_view recordErrorToString(RecordError error) noexcept {
    switch (error) {
        case RecordError::kEmptySequence:
            return "EmptySequence";
        case RecordError::kInvalidCharacters:
            return "InvalidCharacters";
        case RecordError::kBelowMinLength:
            return "BelowMinLength";
        case RecordError::kDuplicateHeader:
            return "DuplicateHeader";
        case RecordError::kLowComplexity:
            return "LowComplexity";
    }
    return "Unknown";
}

// =============================================================================
// Raw Record
// =============================================================================

/// @brief One entry as produced by the parser, in file order.
struct RawRecord {
    /// @brief Header without the leading marker, whitespace-trimmed.
    std::string header;

    /// @brief Concatenated sequence lines with all whitespace removed.
    std::string sequence;

    /// @brief FASTQ quality string (informational only, never validated).
    std::optional<std::string> quality;

    [[nodiscard]] std::size_t length() const noexcept { return sequence.size(); }
};

// =============================================================================
// Base Composition
// =============================================================================

/// @brief Per-base counts of a sequence (case-insensitive).
struct BaseComposition {
    std::size_t a = 0;
    std::size_t c = 0;
    std::size_t g = 0;
    std::size_t t = 0;
    std::size_t n = 0;

    /// @brief Count of unambiguous bases (A, C, G, T).
    [[nodiscard]] std::size_t validBases() const noexcept { return a + c + g + t; }

    bool operator==(const BaseComposition&) const = default;
};

// =============================================================================
// Validated Record
// =============================================================================

/// @brief A record after rule evaluation.
/// @note Invariants: isValid == errors.empty(); length == finalSequence.size().
struct ValidatedRecord {
    /// @brief 0-based position of the source record in the input.
    std::uint64_t index = 0;

    std::string header;

    /// @brief Input sequence with whitespace removed.
    std::string originalSequence;

    /// @brief Sanitized sequence when sanitization is enabled, else the original.
    std::string finalSequence;

    bool isValid = true;

    /// @brief Findings in rule evaluation order; empty for valid records.
    std::vector<RecordError> errors;

    std::size_t length = 0;

    /// @brief Fraction of G/C in finalSequence, in [0, 1].
    double gcContent = 0.0;

    /// @brief Characters outside the allowed alphabet in originalSequence.
    std::size_t invalidCharCount = 0;

    /// @brief A/C/G/T/N counts of finalSequence.
    BaseComposition composition;

    [[nodiscard]] bool hasError(RecordError error) const noexcept {
        for (RecordError e : errors) {
            if (e == error) {
                return true;
            }
        }
        return false;
    }

    /// @brief Whether sanitization changed the sequence.
    [[nodiscard]] bool wasSanitized() const noexcept { return finalSequence != originalSequence; }
};

// =============================================================================
// Alphabet Helpers
// =============================================================================

/// @brief ASCII whitespace without locale dependence.
[[nodiscard]] constexpr bool isAsciiWhitespace(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

/// @brief ASCII uppercase without locale dependence.
[[nodiscard]] constexpr char toUpperAscii(char c) noexcept {
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

/// @brief Check whether a character belongs to {A,C,G,T,N}, case-insensitively.
[[nodiscard]] constexpr bool isAllowedBase(char c) noexcept {
    switch (toUpperAscii(c)) {
        case 'A':
        case 'C':
        case 'G':
        case 'T':
        case 'N':
            return true;
        default:
            return false;
    }
}

/// @brief Check whether a character is G or C, case-insensitively.
[[nodiscard]] constexpr bool isGcBase(char c) noexcept {
    const char upper = toUpperAscii(c);
    return upper == 'G' || upper == 'C';
}

}  // namespace gcl

#endif  // GCL_COMMON_TYPES_H
