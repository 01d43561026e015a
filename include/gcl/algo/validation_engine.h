// =============================================================================
// genome-cleaner - Validation Engine
// =============================================================================
// Per-record rule evaluation for parsed FASTA/FASTQ records.
//
// Rules, evaluated in this fixed order (the order of ValidatedRecord::errors):
// 1. EmptySequence      - sequence is empty after whitespace stripping
// 2. InvalidCharacters  - any character outside {A,C,G,T,N} (case-insensitive)
// 3. BelowMinLength     - final sequence shorter than minLength
// 4. DuplicateHeader    - header already seen earlier in the same call
// 5. LowComplexity      - dominated by one base or a 1-3 base tandem repeat
//
// Whitespace is removed from every sequence before any rule runs, so a
// whitespace-only sequence is empty: length 0, no invalid characters, and an
// empty final sequence whether or not sanitization is on.
//
// When sanitization is enabled, rules 3-5 score the sanitized sequence while
// rule 2 always counts the original one, so InvalidCharacters is never masked.
// An empty sequence skips rules 2, 3 and 5; rule 4 still applies.
//
// Rules 1-3 and 5 are independent per record and run in parallel (TBB). The
// duplicate pass runs afterwards, strictly in file order.
// =============================================================================

#ifndef GCL_ALGO_VALIDATION_ENGINE_H
#define GCL_ALGO_VALIDATION_ENGINE_H

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

#include "gcl/common/error.h"
#include "gcl/common/types.h"

namespace gcl::algo {

// =============================================================================
// Constants
// =============================================================================

/// @brief Default fraction of the most frequent base that marks low complexity.
inline constexpr double kDefaultDominantFraction = 0.80;

/// @brief Default fraction of positions explained by a short tandem repeat.
inline constexpr double kDefaultRepeatCoverage = 0.90;

/// @brief Default longest repeat unit considered.
inline constexpr std::size_t kDefaultMaxRepeatUnit = 3;

/// @brief Default shortest sequence the low-complexity check applies to.
inline constexpr std::size_t kDefaultLowComplexityMinLength = 10;

// =============================================================================
// Configuration
// =============================================================================

/// @brief Thresholds for the low-complexity heuristic.
///
/// For a sequence s of length n >= minLength (compared case-insensitively),
/// s is low-complexity when either
/// - max_c count(c) / n >= dominantFraction, or
/// - for some k in [1, maxRepeatUnit] with k < n,
///   (k + #{ i in [k, n) : s[i] == s[i-k] }) / n >= repeatCoverage.
struct LowComplexityConfig {
    double dominantFraction = kDefaultDominantFraction;
    double repeatCoverage = kDefaultRepeatCoverage;
    std::size_t maxRepeatUnit = kDefaultMaxRepeatUnit;
    std::size_t minLength = kDefaultLowComplexityMinLength;
};

/// @brief Configuration for a validation run.
struct ValidationConfig {
    /// @brief Sanitize sequences before scoring rules 3-5.
    bool sanitize = false;

    /// @brief Minimum acceptable final sequence length.
    std::size_t minLength = kDefaultMinLength;

    LowComplexityConfig lowComplexity;

    /// @brief Worker threads for per-record rules (0 = all cores, 1 = serial).
    int threads = 1;

    /// @brief Validate configuration parameters.
    /// @return VoidResult indicating success or a usage error.
    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// ValidationEngine Class
// =============================================================================

/// @brief Applies the rule set to parsed records.
///
/// Usage:
/// @code
/// ValidationConfig config;
/// config.sanitize = true;
/// ValidationEngine engine(config);
/// auto validated = engine.validate(records);
/// @endcode
///
/// Every input record yields exactly one output record, in input order.
/// Each validate() call owns its duplicate-tracking state, so one engine may be
/// used from several threads at once.
class ValidationEngine {
public:
    /// @brief Construct with configuration.
    /// @throws UsageError if the configuration is invalid.
    explicit ValidationEngine(ValidationConfig config = {});

    /// @brief Validate records.
    /// @return One ValidatedRecord per input record, order-preserving.
    [[nodiscard]] std::vector<ValidatedRecord> validate(std::span<const RawRecord> records) const;

    [[nodiscard]] const ValidationConfig& config() const noexcept { return config_; }

private:
    ValidationConfig config_;
};

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Validate records with the given configuration.
/// @throws UsageError if the configuration is invalid.
[[nodiscard]] std::vector<ValidatedRecord> validateRecords(std::span<const RawRecord> records,
                                                           const ValidationConfig& config);

/// @brief Fraction of G/C bases (case-insensitive); 0 for an empty sequence.
[[nodiscard]] double computeGcContent(std::string_view sequence) noexcept;

/// @brief Count A/C/G/T/N occurrences (case-insensitive); other characters are ignored.
[[nodiscard]] BaseComposition computeBaseComposition(std::string_view sequence) noexcept;

/// @brief Apply the low-complexity heuristic to a sequence.
[[nodiscard]] bool isLowComplexity(std::string_view sequence,
                                   const LowComplexityConfig& config = {}) noexcept;

}  // namespace gcl::algo

#endif  // GCL_ALGO_VALIDATION_ENGINE_H
