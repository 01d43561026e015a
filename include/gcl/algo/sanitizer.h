// =============================================================================
// genome-cleaner - Sequence Sanitizer
// =============================================================================
// Normalization pass applied to sequences when sanitization is enabled:
// every character is uppercased and anything outside {A,C,G,T,N} is replaced
// by the unknown-base sentinel 'N'. The transform is a 1:1 substitution, so
// positions in the output correspond to positions in the input.
// =============================================================================

#ifndef GCL_ALGO_SANITIZER_H
#define GCL_ALGO_SANITIZER_H

#include <cstddef>
#include <string>
#include <string_view>

namespace gcl::algo {

/// @brief Uppercase a sequence and replace illegal characters with 'N'.
/// @note Pure and idempotent; output length always equals input length.
[[nodiscard]] std::string sanitize(std::string_view sequence);

/// @brief Remove every ASCII whitespace character.
[[nodiscard]] std::string stripWhitespace(std::string_view sequence);

/// @brief Count characters outside the allowed alphabet (case-insensitive).
[[nodiscard]] std::size_t countInvalidCharacters(std::string_view sequence) noexcept;

}  // namespace gcl::algo

#endif  // GCL_ALGO_SANITIZER_H
