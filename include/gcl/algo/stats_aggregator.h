// =============================================================================
// genome-cleaner - Statistics Aggregator
// =============================================================================
// Dataset-level statistics over validated records.
//
// All length and GC statistics are computed over every record, valid or not.
// Summarizing an empty record list yields a zero summary.
//
// Each record also falls into exactly one quality tier:
// - high:     valid, no ambiguous (N) bases
// - medium:   valid, but carries N bases
// - low:      invalid only because of illegal characters, so sanitizing fixes it
// - unusable: any other invalid record
// =============================================================================

#ifndef GCL_ALGO_STATS_AGGREGATOR_H
#define GCL_ALGO_STATS_AGGREGATOR_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "gcl/common/types.h"

namespace gcl::algo {

// =============================================================================
// Quality Tiers
// =============================================================================

/// @brief Coarse usability class of a validated record.
enum class QualityTier : std::uint8_t {
    kHigh = 0,
    kMedium = 1,
    kLow = 2,
    kUnusable = 3
};

/// @brief Number of QualityTier values.
inline constexpr std::size_t kQualityTierCount = 4;

/// @brief All QualityTier values, best first.
inline constexpr QualityTier kAllQualityTiers[kQualityTierCount] = {
    QualityTier::kHigh, QualityTier::kMedium, QualityTier::kLow, QualityTier::kUnusable};

[[nodiscard]] constexpr std::string_view qualityTierToString(QualityTier tier) noexcept {
    switch (tier) {
        case QualityTier::kHigh:
            return "high";
        case QualityTier::kMedium:
            return "medium";
        case QualityTier::kLow:
            return "low";
        case QualityTier::kUnusable:
            return "unusable";
    }
    return "unknown";
}

/// @brief Assign a record to its quality tier.
[[nodiscard]] QualityTier classifyQuality(const ValidatedRecord& record) noexcept;

// =============================================================================
// Summary Types
// =============================================================================

/// @brief Entry of the longest-sequences ranking.
struct LengthRank {
    std::string header;
    std::size_t length = 0;

    /// @brief ValidatedRecord::index of the ranked record.
    std::uint64_t index = 0;
};

/// @brief Length quartiles, taken as sorted[n/4], sorted[n/2], sorted[3n/4].
struct LengthQuartiles {
    std::size_t q1 = 0;
    std::size_t q2 = 0;
    std::size_t q3 = 0;
};

/// @brief Aggregate statistics for one validated dataset.
struct DatasetSummary {
    std::size_t totalCount = 0;
    std::size_t validCount = 0;
    std::size_t invalidCount = 0;

    /// @brief Unweighted mean of per-record GC content.
    double avgGcContent = 0.0;
    double minGcContent = 0.0;
    double maxGcContent = 0.0;

    /// @brief GC content at sorted[n/2].
    double medianGcContent = 0.0;

    std::size_t minLength = 0;
    std::size_t maxLength = 0;
    double avgLength = 0.0;
    std::size_t medianLength = 0;
    LengthQuartiles lengthQuartiles;
    std::uint64_t totalBases = 0;

    /// @brief Records whose final sequence differs from the original.
    std::size_t sanitizedCount = 0;

    /// @brief Number of records exhibiting each error (absent codes omitted).
    std::map<RecordError, std::size_t> errorHistogram;

    /// @brief Sum of all per-record error list sizes.
    std::size_t totalErrors = 0;

    /// @brief Highest histogram entry; ties resolved by enum order.
    std::optional<RecordError> mostCommonError;

    /// @brief Record count per QualityTier, indexed by the enum value.
    std::array<std::size_t, kQualityTierCount> qualityDistribution{};

    /// @brief Up to kTopLongestLimit records, length descending.
    /// @note Ties keep the order of the summarized span, not ValidatedRecord::index.
    std::vector<LengthRank> topLongest;

    /// @brief Valid records as a percentage of all records (0 when empty).
    [[nodiscard]] double validityPercentage() const noexcept {
        return totalCount == 0 ? 0.0
                               : static_cast<double>(validCount) * 100.0 /
                                     static_cast<double>(totalCount);
    }

    [[nodiscard]] std::size_t qualityCount(QualityTier tier) const noexcept {
        return qualityDistribution[static_cast<std::size_t>(tier)];
    }

    /// @brief Histogram count for a code (0 when absent).
    [[nodiscard]] std::size_t errorCount(RecordError code) const noexcept {
        auto it = errorHistogram.find(code);
        return it == errorHistogram.end() ? 0 : it->second;
    }
};

// =============================================================================
// StatsAggregator Class
// =============================================================================

/// @brief Computes a DatasetSummary from validated records.
class StatsAggregator {
public:
    explicit StatsAggregator(std::size_t topLimit = kTopLongestLimit) noexcept
        : topLimit_(topLimit) {}

    /// @brief Summarize records; pure, input is not modified.
    [[nodiscard]] DatasetSummary summarize(std::span<const ValidatedRecord> records) const;

private:
    std::size_t topLimit_;
};

/// @brief Summarize records with the default ranking size.
[[nodiscard]] DatasetSummary summarizeRecords(std::span<const ValidatedRecord> records);

}  // namespace gcl::algo

#endif  // GCL_ALGO_STATS_AGGREGATOR_H
