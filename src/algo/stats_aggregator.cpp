// =============================================================================
// genome-cleaner - Statistics Aggregator Implementation
// =============================================================================

#include "gcl/algo/stats_aggregator.h"

#include <algorithm>
#include <numeric>

#include "gcl/common/logger.h"

namespace gcl::algo {

namespace {

std::vector<LengthRank> rankLongest(std::span<const ValidatedRecord> records, std::size_t limit) {
    std::vector<std::size_t> order(records.size());
    std::iota(order.begin(), order.end(), std::size_t{0});

    const std::size_t keep = std::min(limit, order.size());
    std::partial_sort(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(keep),
                      order.end(), [&records](std::size_t a, std::size_t b) {
                          if (records[a].length != records[b].length) {
                              return records[a].length > records[b].length;
                          }
                          return a < b;
                      });

    std::vector<LengthRank> ranking;
    ranking.reserve(keep);
    for (std::size_t i = 0; i < keep; ++i) {
        const ValidatedRecord& record = records[order[i]];
        ranking.push_back(LengthRank{record.header, record.length, record.index});
    }
    return ranking;
}

}  // namespace

QualityTier classifyQuality(const ValidatedRecord& record) noexcept {
    if (record.isValid) {
        return record.composition.n == 0 ? QualityTier::kHigh : QualityTier::kMedium;
    }
    const bool onlyInvalidCharacters =
        std::all_of(record.errors.begin(), record.errors.end(),
                    [](RecordError e) { return e == RecordError::kInvalidCharacters; });
    return onlyInvalidCharacters ? QualityTier::kLow : QualityTier::kUnusable;
}

DatasetSummary StatsAggregator::summarize(std::span<const ValidatedRecord> records) const {
    DatasetSummary summary;
    if (records.empty()) {
        GCL_LOG_DEBUG("Summarizing empty dataset");
        return summary;
    }

    const std::size_t n = records.size();
    summary.totalCount = n;
    summary.minLength = records.front().length;
    summary.minGcContent = records.front().gcContent;
    summary.maxGcContent = records.front().gcContent;

    std::vector<std::size_t> lengths;
    lengths.reserve(n);
    std::vector<double> gcValues;
    gcValues.reserve(n);
    double gcSum = 0.0;

    for (const auto& record : records) {
        if (record.isValid) {
            ++summary.validCount;
        }
        if (record.wasSanitized()) {
            ++summary.sanitizedCount;
        }

        lengths.push_back(record.length);
        summary.totalBases += record.length;
        summary.minLength = std::min(summary.minLength, record.length);
        summary.maxLength = std::max(summary.maxLength, record.length);

        gcSum += record.gcContent;
        gcValues.push_back(record.gcContent);
        summary.minGcContent = std::min(summary.minGcContent, record.gcContent);
        summary.maxGcContent = std::max(summary.maxGcContent, record.gcContent);

        // A record counts once per code even if the code were listed twice.
        for (RecordError code : kAllRecordErrors) {
            if (record.hasError(code)) {
                ++summary.errorHistogram[code];
            }
        }
        summary.totalErrors += record.errors.size();
        ++summary.qualityDistribution[static_cast<std::size_t>(classifyQuality(record))];
    }

    summary.invalidCount = n - summary.validCount;
    summary.avgGcContent = gcSum / static_cast<double>(n);
    summary.avgLength = static_cast<double>(summary.totalBases) / static_cast<double>(n);

    std::sort(lengths.begin(), lengths.end());
    summary.medianLength = lengths[n / 2];
    summary.lengthQuartiles = LengthQuartiles{lengths[n / 4], lengths[n / 2], lengths[3 * n / 4]};

    std::nth_element(gcValues.begin(), gcValues.begin() + static_cast<std::ptrdiff_t>(n / 2),
                     gcValues.end());
    summary.medianGcContent = gcValues[n / 2];

    std::size_t bestCount = 0;
    for (const auto& [code, count] : summary.errorHistogram) {
        if (count > bestCount) {
            bestCount = count;
            summary.mostCommonError = code;
        }
    }

    summary.topLongest = rankLongest(records, topLimit_);

    GCL_LOG_DEBUG("Summary: {} records, {} valid, {} bases, avg GC {:.4f}", summary.totalCount,
                  summary.validCount, summary.totalBases, summary.avgGcContent);
    return summary;
}

DatasetSummary summarizeRecords(std::span<const ValidatedRecord> records) {
    return StatsAggregator{}.summarize(records);
}

}  // namespace gcl::algo
