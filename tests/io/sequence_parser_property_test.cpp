// =============================================================================
// genome-cleaner - Sequence Parser Property Tests
// =============================================================================
// Property-based tests for FASTA/FASTQ parsing.
//
// *For any* list of well-formed records, formatting them as FASTA (with
// arbitrary line wrapping) or FASTQ and parsing the text yields the same
// headers and sequences, in the same order.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <sstream>
#include <string>
#include <tuple>
#include <vector>

#include "gcl/io/sequence_parser.h"

namespace gcl::io::test {

// =============================================================================
// Test Utilities
// =============================================================================

struct Entry {
    std::string header;
    std::string sequence;
};

/// @brief Format entries as FASTA, wrapping sequence lines at lineWidth.
[[nodiscard]] std::string formatFasta(const std::vector<Entry>& entries, std::size_t lineWidth) {
    std::ostringstream oss;
    for (const auto& entry : entries) {
        oss << '>' << entry.header << '\n';
        for (std::size_t pos = 0; pos < entry.sequence.size(); pos += lineWidth) {
            oss << entry.sequence.substr(pos, lineWidth) << '\n';
        }
    }
    return oss.str();
}

/// @brief Format entries as FASTQ with constant quality.
[[nodiscard]] std::string formatFastq(const std::vector<Entry>& entries) {
    std::ostringstream oss;
    for (const auto& entry : entries) {
        oss << '@' << entry.header << '\n'
            << entry.sequence << '\n'
            << "+\n"
            << std::string(entry.sequence.size(), 'I') << '\n';
    }
    return oss.str();
}

// =============================================================================
// RapidCheck Generators
// =============================================================================

namespace gen {

/// @brief Generate a sequence character, including lowercase and junk.
[[nodiscard]] rc::Gen<char> sequenceChar() {
    return rc::gen::element('A', 'C', 'G', 'T', 'N', 'a', 'c', 'g', 't', 'X', '-', '*');
}

[[nodiscard]] rc::Gen<std::string> sequence(std::size_t minLen, std::size_t maxLen) {
    return rc::gen::mapcat(rc::gen::inRange(minLen, maxLen + 1), [](std::size_t length) {
        return rc::gen::container<std::string>(length, sequenceChar());
    });
}

/// @brief Generate a header: printable, no leading/trailing whitespace.
[[nodiscard]] rc::Gen<std::string> header() {
    return rc::gen::mapcat(rc::gen::inRange<std::size_t>(1, 40), [](std::size_t length) {
        return rc::gen::container<std::string>(
            length, rc::gen::oneOf(rc::gen::inRange<char>('a', 'z' + 1),
                                   rc::gen::inRange<char>('A', 'Z' + 1),
                                   rc::gen::inRange<char>('0', '9' + 1),
                                   rc::gen::element('_', '|', ':', '.')));
    });
}

[[nodiscard]] rc::Gen<Entry> entry(std::size_t minLen) {
    return rc::gen::map(rc::gen::tuple(header(), sequence(minLen, 200)), [](const auto& tuple) {
        return Entry{std::get<0>(tuple), std::get<1>(tuple)};
    });
}

/// @brief Generate between minCount and maxCount entries.
[[nodiscard]] rc::Gen<std::vector<Entry>> entries(std::size_t minCount, std::size_t maxCount,
                                                  std::size_t minLen) {
    return rc::gen::mapcat(rc::gen::inRange(minCount, maxCount + 1),
                           [minLen](std::size_t count) {
                               return rc::gen::container<std::vector<Entry>>(count,
                                                                             entry(minLen));
                           });
}

}  // namespace gen

// =============================================================================
// Property Tests
// =============================================================================

/// @brief FASTA: wrapping does not change parsed sequences.
RC_GTEST_PROP(SequenceParserProperty, FastaWrappingIsTransparent, ()) {
    const auto entries = *gen::entries(1, 20, 0);
    const auto lineWidth = *rc::gen::inRange<std::size_t>(1, 120);

    const auto records = parseSequences(formatFasta(entries, lineWidth));

    RC_ASSERT(records.size() == entries.size());
    for (std::size_t i = 0; i < entries.size(); ++i) {
        RC_ASSERT(records[i].header == entries[i].header);
        RC_ASSERT(records[i].sequence == entries[i].sequence);
        RC_ASSERT(!records[i].quality.has_value());
    }
}

/// @brief FASTQ: every complete 4-line block becomes one record.
RC_GTEST_PROP(SequenceParserProperty, FastqBlocksRoundTrip, ()) {
    const auto entries = *gen::entries(1, 20, 1);

    SequenceParser parser;
    const auto records = parser.parse(formatFastq(entries));

    RC_ASSERT(records.size() == entries.size());
    for (std::size_t i = 0; i < entries.size(); ++i) {
        RC_ASSERT(records[i].header == entries[i].header);
        RC_ASSERT(records[i].sequence == entries[i].sequence);
        RC_ASSERT(records[i].quality.has_value());
        RC_ASSERT(records[i].quality->size() == entries[i].sequence.size());
    }
    RC_ASSERT(parser.stats().droppedTrailingLines == 0u);
}

/// @brief FASTQ: 1-3 leftover lines never produce an extra record.
RC_GTEST_PROP(SequenceParserProperty, FastqTrailingFragmentIsDropped, ()) {
    const auto entries = *gen::entries(1, 10, 1);
    const auto leftover = *rc::gen::inRange<std::size_t>(1, 4);

    const std::string full = formatFastq(entries);
    const std::string extra = formatFastq({*gen::entry(1)});

    // Keep only the first `leftover` lines of one more block.
    std::size_t cut = 0;
    for (std::size_t line = 0; line < leftover; ++line) {
        cut = extra.find('\n', cut) + 1;
    }

    SequenceParser parser;
    const auto records = parser.parse(full + extra.substr(0, cut));

    RC_ASSERT(records.size() == entries.size());
    RC_ASSERT(parser.stats().droppedTrailingLines == leftover);
}

/// @brief Stats agree with the returned records.
RC_GTEST_PROP(SequenceParserProperty, StatsMatchRecords, ()) {
    const auto entries = *gen::entries(0, 20, 0);

    SequenceParser parser;
    const auto records = parser.parse(formatFasta(entries, 60));

    std::uint64_t bases = 0;
    for (const auto& record : records) {
        bases += record.sequence.size();
    }
    RC_ASSERT(parser.stats().totalRecords == records.size());
    RC_ASSERT(parser.stats().totalBases == bases);
}

}  // namespace gcl::io::test
