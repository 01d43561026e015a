// =============================================================================
// genome-cleaner - Sanitizer Property Tests
// =============================================================================
// *For any* string s: sanitize(s) has the same length as s, contains only
// {A,C,G,T,N}, is idempotent, and keeps every allowed base (uppercased) in
// place.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <string>

#include "gcl/algo/sanitizer.h"
#include "gcl/common/types.h"

namespace gcl::algo::test {

namespace gen {

/// @brief Printable ASCII, biased toward nucleotide letters.
[[nodiscard]] rc::Gen<std::string> mixedSequence() {
    return rc::gen::container<std::string>(rc::gen::oneOf(
        rc::gen::element('A', 'C', 'G', 'T', 'N', 'a', 'c', 'g', 't', 'n'),
        rc::gen::inRange<char>(' ', '~' + 1)));
}

}  // namespace gen

RC_GTEST_PROP(SanitizerProperty, PreservesLength, ()) {
    const auto input = *gen::mixedSequence();
    RC_ASSERT(sanitize(input).size() == input.size());
}

RC_GTEST_PROP(SanitizerProperty, OutputUsesAllowedAlphabet, ()) {
    const auto output = sanitize(*gen::mixedSequence());
    for (char c : output) {
        RC_ASSERT(kAllowedBases.find(c) != std::string_view::npos);
    }
    RC_ASSERT(countInvalidCharacters(output) == 0u);
}

RC_GTEST_PROP(SanitizerProperty, Idempotent, ()) {
    const auto once = sanitize(*gen::mixedSequence());
    RC_ASSERT(sanitize(once) == once);
}

RC_GTEST_PROP(SanitizerProperty, AllowedBasesKeepTheirPosition, ()) {
    const auto input = *gen::mixedSequence();
    const auto output = sanitize(input);
    std::size_t replaced = 0;
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (isAllowedBase(input[i])) {
            RC_ASSERT(output[i] == toUpperAscii(input[i]));
        } else {
            RC_ASSERT(output[i] == kSentinelBase);
            ++replaced;
        }
    }
    RC_ASSERT(replaced == countInvalidCharacters(input));
}

TEST(SanitizerTest, UppercasesAndReplaces) {
    EXPECT_EQ(sanitize("acXt"), "ACNT");
    EXPECT_EQ(sanitize("ACGTN"), "ACGTN");
    EXPECT_EQ(sanitize("nn-*"), "NNNN");
    EXPECT_EQ(sanitize(""), "");
}

TEST(SanitizerTest, CountsInvalidCharacters) {
    EXPECT_EQ(countInvalidCharacters("ACGT"), 0u);
    EXPECT_EQ(countInvalidCharacters("acgtn"), 0u);
    EXPECT_EQ(countInvalidCharacters("ACXT"), 1u);
    EXPECT_EQ(countInvalidCharacters("R Y-"), 4u);
}

TEST(SanitizerTest, StripsAllWhitespace) {
    EXPECT_EQ(stripWhitespace("AC GT\tN\r\n"), "ACGTN");
    EXPECT_EQ(stripWhitespace("   "), "");
    EXPECT_EQ(stripWhitespace("acgt"), "acgt");
}

}  // namespace gcl::algo::test
