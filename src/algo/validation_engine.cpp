// =============================================================================
// genome-cleaner - Validation Engine Implementation
// =============================================================================

#include "gcl/algo/validation_engine.h"

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#include <algorithm>
#include <array>
#include <string>
#include <unordered_set>

#include "gcl/algo/sanitizer.h"
#include "gcl/common/logger.h"

namespace gcl::algo {

namespace {

/// @brief Upper bound for LowComplexityConfig::maxRepeatUnit.
constexpr std::size_t kMaxSupportedRepeatUnit = 16;

/// @brief Outcome of the order-independent rules for one record.
struct ContentFindings {
    bool empty = false;
    bool belowMinLength = false;
    bool lowComplexity = false;
};

/// @brief Evaluate rules 1, 2, 3 and 5 for a single record.
void evaluateContentRules(const RawRecord& raw, const ValidationConfig& config,
                          ValidatedRecord& out, ContentFindings& findings) {
    out.header = raw.header;
    out.originalSequence = stripWhitespace(raw.sequence);

    if (out.originalSequence.empty()) {
        findings.empty = true;
        return;
    }

    out.finalSequence = config.sanitize ? sanitize(out.originalSequence) : out.originalSequence;
    out.length = out.finalSequence.size();
    out.gcContent = computeGcContent(out.finalSequence);
    out.invalidCharCount = countInvalidCharacters(out.originalSequence);
    out.composition = computeBaseComposition(out.finalSequence);

    findings.belowMinLength = out.length < config.minLength;
    findings.lowComplexity = isLowComplexity(out.finalSequence, config.lowComplexity);
}

}  // namespace

// =============================================================================
// ValidationConfig Implementation
// =============================================================================

VoidResult ValidationConfig::validate() const {
    if (!(lowComplexity.dominantFraction > 0.0 && lowComplexity.dominantFraction <= 1.0)) {
        return makeVoidError(ErrorCode::kUsageError,
                             "dominant base fraction must be in range (0, 1]");
    }

    if (!(lowComplexity.repeatCoverage > 0.0 && lowComplexity.repeatCoverage <= 1.0)) {
        return makeVoidError(ErrorCode::kUsageError, "repeat coverage must be in range (0, 1]");
    }

    if (lowComplexity.maxRepeatUnit > kMaxSupportedRepeatUnit) {
        return makeVoidError(ErrorCode::kUsageError,
                             "repeat unit length must be at most " +
                                 std::to_string(kMaxSupportedRepeatUnit));
    }

    if (threads < 0) {
        return makeVoidError(ErrorCode::kUsageError, "thread count must be >= 0");
    }

    return makeVoidSuccess();
}

// =============================================================================
// ValidationEngine Implementation
// =============================================================================

ValidationEngine::ValidationEngine(ValidationConfig config) : config_(config) {
    unwrapOrThrow(config_.validate());
}

std::vector<ValidatedRecord> ValidationEngine::validate(std::span<const RawRecord> records) const {
    const std::size_t count = records.size();
    std::vector<ValidatedRecord> results(count);
    std::vector<ContentFindings> findings(count);

    auto evaluateRange = [&](std::size_t begin, std::size_t end) {
        for (std::size_t i = begin; i < end; ++i) {
            results[i].index = i;
            evaluateContentRules(records[i], config_, results[i], findings[i]);
        }
    };

    if (config_.threads == 1 || count < 2) {
        evaluateRange(0, count);
    } else {
        const int concurrency =
            config_.threads > 0 ? config_.threads : tbb::task_arena::automatic;
        tbb::task_arena arena(concurrency);
        arena.execute([&] {
            tbb::parallel_for(tbb::blocked_range<std::size_t>(0, count),
                              [&](const tbb::blocked_range<std::size_t>& range) {
                                  evaluateRange(range.begin(), range.end());
                              });
        });
    }

    // Duplicate detection must follow file order: the first occurrence of a
    // header is never flagged.
    std::unordered_set<std::string_view> seenHeaders;
    seenHeaders.reserve(count);
    std::size_t invalidCount = 0;

    for (std::size_t i = 0; i < count; ++i) {
        ValidatedRecord& record = results[i];
        const ContentFindings& found = findings[i];
        const bool duplicate = !seenHeaders.insert(record.header).second;

        if (found.empty) {
            record.errors.push_back(RecordError::kEmptySequence);
        }
        if (!found.empty && record.invalidCharCount > 0) {
            record.errors.push_back(RecordError::kInvalidCharacters);
        }
        if (found.belowMinLength) {
            record.errors.push_back(RecordError::kBelowMinLength);
        }
        if (duplicate) {
            record.errors.push_back(RecordError::kDuplicateHeader);
        }
        if (found.lowComplexity) {
            record.errors.push_back(RecordError::kLowComplexity);
        }

        record.isValid = record.errors.empty();
        if (!record.isValid) {
            ++invalidCount;
            GCL_LOG_TRACE("Record {} '{}' failed {} rule(s), first {}", i, record.header,
                          record.errors.size(), recordErrorToString(record.errors.front()));
        }
    }

    GCL_LOG_DEBUG("Validated {} records: {} valid, {} invalid (sanitize={}, min_length={})",
                  count, count - invalidCount, invalidCount, config_.sanitize,
                  config_.minLength);

    return results;
}

// =============================================================================
// Utility Functions
// =============================================================================

std::vector<ValidatedRecord> validateRecords(std::span<const RawRecord> records,
                                             const ValidationConfig& config) {
    ValidationEngine engine(config);
    return engine.validate(records);
}

double computeGcContent(std::string_view sequence) noexcept {
    if (sequence.empty()) {
        return 0.0;
    }
    const auto gcCount = std::count_if(sequence.begin(), sequence.end(), isGcBase);
    return static_cast<double>(gcCount) / static_cast<double>(sequence.size());
}

BaseComposition computeBaseComposition(std::string_view sequence) noexcept {
    BaseComposition composition;
    for (char c : sequence) {
        switch (toUpperAscii(c)) {
            case 'A':
                ++composition.a;
                break;
            case 'C':
                ++composition.c;
                break;
            case 'G':
                ++composition.g;
                break;
            case 'T':
                ++composition.t;
                break;
            case 'N':
                ++composition.n;
                break;
            default:
                break;
        }
    }
    return composition;
}

bool isLowComplexity(std::string_view sequence, const LowComplexityConfig& config) noexcept {
    const std::size_t n = sequence.size();
    if (n == 0 || n < config.minLength) {
        return false;
    }

    std::array<std::size_t, 256> counts{};
    for (char c : sequence) {
        ++counts[static_cast<unsigned char>(toUpperAscii(c))];
    }
    const std::size_t dominant = *std::max_element(counts.begin(), counts.end());
    if (static_cast<double>(dominant) / static_cast<double>(n) >= config.dominantFraction) {
        return true;
    }

    const std::size_t maxUnit = std::min(config.maxRepeatUnit, n - 1);
    for (std::size_t k = 1; k <= maxUnit; ++k) {
        std::size_t matches = 0;
        for (std::size_t i = k; i < n; ++i) {
            if (toUpperAscii(sequence[i]) == toUpperAscii(sequence[i - k])) {
                ++matches;
            }
        }
        if (static_cast<double>(k + matches) / static_cast<double>(n) >= config.repeatCoverage) {
            return true;
        }
    }

    return false;
}

}  // namespace gcl::algo
