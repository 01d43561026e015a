// =============================================================================
// genome-cleaner - Sequence Parser Implementation
// =============================================================================

#include "gcl/io/sequence_parser.h"

#include <string>
#include <utility>

#include "gcl/common/logger.h"

namespace gcl::io {

namespace {

/// @brief Sequential reader over the lines of an in-memory text.
/// @note A trailing newline does not produce an extra empty line.
class LineCursor {
public:
    explicit LineCursor(std::string_view text) noexcept : text_(text) {}

    /// @brief Read the next physical line (without its '\n').
    bool next(std::string_view& line) noexcept {
        if (pos_ >= text_.size()) {
            return false;
        }
        auto end = text_.find('\n', pos_);
        if (end == std::string_view::npos) {
            end = text_.size();
        }
        line = text_.substr(pos_, end - pos_);
        pos_ = end + 1;
        ++lineNumber_;
        return true;
    }

    /// @brief Read the next line that is not blank after trimming.
    bool nextNonBlank(std::string_view& line) noexcept {
        while (next(line)) {
            line = trimWhitespace(line);
            if (!line.empty()) {
                return true;
            }
        }
        return false;
    }

    /// @brief 1-based number of the line returned last.
    [[nodiscard]] std::uint64_t lineNumber() const noexcept { return lineNumber_; }

private:
    std::string_view text_;
    std::size_t pos_ = 0;
    std::uint64_t lineNumber_ = 0;
};

/// @brief Append a sequence line, dropping interior whitespace.
void appendSequenceLine(std::string& sequence, std::string_view line) {
    for (char c : line) {
        if (!isAsciiWhitespace(c)) {
            sequence.push_back(c);
        }
    }
}

}  // namespace

// =============================================================================
// Utility Functions
// =============================================================================

std::string_view trimWhitespace(std::string_view str) noexcept {
    std::size_t begin = 0;
    while (begin < str.size() && isAsciiWhitespace(str[begin])) {
        ++begin;
    }
    std::size_t end = str.size();
    while (end > begin && isAsciiWhitespace(str[end - 1])) {
        --end;
    }
    return str.substr(begin, end - begin);
}

std::optional<SequenceFormat> detectSequenceFormat(std::string_view text) {
    LineCursor cursor(text);
    std::string_view line;
    if (!cursor.nextNonBlank(line)) {
        return std::nullopt;
    }

    if (line.front() == kFastaMarker) {
        return SequenceFormat::kFasta;
    }
    if (line.front() == kFastqMarker) {
        return SequenceFormat::kFastq;
    }

    throw FormatError("Unrecognized input format: first line must start with '>' (FASTA) or "
                      "'@' (FASTQ)",
                      ErrorContext{}.withLine(cursor.lineNumber()));
}

std::vector<RawRecord> parseSequences(std::string_view text) {
    SequenceParser parser;
    return parser.parse(text);
}

// =============================================================================
// SequenceParser Implementation
// =============================================================================

SequenceParser::SequenceParser(std::string sourceName) : sourceName_(std::move(sourceName)) {}

std::vector<RawRecord> SequenceParser::parse(std::string_view text) {
    stats_.reset();

    std::optional<SequenceFormat> format;
    try {
        format = detectSequenceFormat(text);
    } catch (const FormatError& e) {
        // Re-throw with the source name attached.
        ErrorContext context = e.context().value_or(ErrorContext{});
        context.withFile(sourceName_);
        throw FormatError(e.message(), std::move(context));
    }

    if (!format.has_value()) {
        GCL_LOG_DEBUG("No records in {}: input is empty", sourceName_);
        return {};
    }

    stats_.format = format;
    GCL_LOG_DEBUG("Detected {} input in {}", sequenceFormatToString(*format), sourceName_);

    if (*format == SequenceFormat::kFasta) {
        return parseFasta(text);
    }
    return parseFastq(text);
}

std::vector<RawRecord> SequenceParser::parseFasta(std::string_view text) {
    std::vector<RawRecord> records;
    LineCursor cursor(text);
    std::string_view line;

    while (cursor.next(line)) {
        line = trimWhitespace(line);
        if (line.empty()) {
            continue;
        }

        if (line.front() == kFastaMarker) {
            RawRecord record;
            record.header = std::string(trimWhitespace(line.substr(1)));
            records.push_back(std::move(record));
            continue;
        }

        // Format detection guarantees the first non-blank line is a header.
        appendSequenceLine(records.back().sequence, line);
    }

    stats_.linesRead = cursor.lineNumber();
    for (const auto& record : records) {
        stats_.update(record);
    }
    return records;
}

std::vector<RawRecord> SequenceParser::parseFastq(std::string_view text) {
    std::vector<RawRecord> records;
    LineCursor cursor(text);
    std::string_view headerLine;

    while (cursor.nextNonBlank(headerLine)) {
        const std::uint64_t headerLineNumber = cursor.lineNumber();

        // Sequence, separator and quality lines, taken as they come.
        std::string_view blockLines[3];
        std::size_t linesFound = 0;
        while (linesFound < 3 && cursor.next(blockLines[linesFound])) {
            blockLines[linesFound] = trimWhitespace(blockLines[linesFound]);
            ++linesFound;
        }

        if (linesFound < 3) {
            stats_.droppedTrailingLines = 1 + linesFound;
            GCL_LOG_WARNING("Dropping incomplete trailing FASTQ block at line {} of {} ({} of 4 "
                            "lines present)",
                            headerLineNumber, sourceName_, stats_.droppedTrailingLines);
            break;
        }

        if (headerLine.front() != kFastqMarker) {
            throw FormatError("Invalid FASTQ block: expected '@' at start of header line",
                              ErrorContext(sourceName_)
                                  .withLine(headerLineNumber)
                                  .withRecord(records.size()));
        }

        const std::string_view separator = blockLines[1];
        if (separator.empty() || separator.front() != kFastqSeparator) {
            throw FormatError("Invalid FASTQ block: expected '+' at start of separator line",
                              ErrorContext(sourceName_)
                                  .withLine(headerLineNumber + 2)
                                  .withRecord(records.size()));
        }

        RawRecord record;
        record.header = std::string(trimWhitespace(headerLine.substr(1)));
        appendSequenceLine(record.sequence, blockLines[0]);
        record.quality = std::string(blockLines[2]);

        if (record.quality->size() != record.sequence.size()) {
            GCL_LOG_DEBUG("Quality length {} differs from sequence length {} for record {}",
                          record.quality->size(), record.sequence.size(), record.header);
        }

        stats_.update(record);
        records.push_back(std::move(record));
    }

    stats_.linesRead = cursor.lineNumber();
    return records;
}

}  // namespace gcl::io
