// =============================================================================
// genome-cleaner - Sequence Sanitizer Implementation
// =============================================================================

#include "gcl/algo/sanitizer.h"

#include <algorithm>
#include <iterator>

#include "gcl/common/types.h"

namespace gcl::algo {

std::string sanitize(std::string_view sequence) {
    std::string result(sequence.size(), kSentinelBase);
    std::transform(sequence.begin(), sequence.end(), result.begin(), [](char c) {
        return isAllowedBase(c) ? toUpperAscii(c) : kSentinelBase;
    });
    return result;
}

std::string stripWhitespace(std::string_view sequence) {
    std::string result;
    result.reserve(sequence.size());
    std::copy_if(sequence.begin(), sequence.end(), std::back_inserter(result),
                 [](char c) { return !isAsciiWhitespace(c); });
    return result;
}

std::size_t countInvalidCharacters(std::string_view sequence) noexcept {
    return static_cast<std::size_t>(
        std::count_if(sequence.begin(), sequence.end(), [](char c) { return !isAllowedBase(c); }));
}

}  // namespace gcl::algo
