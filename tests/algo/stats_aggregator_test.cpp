// =============================================================================
// genome-cleaner - Statistics Aggregator Tests
// =============================================================================

#include "gcl/algo/stats_aggregator.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "gcl/algo/validation_engine.h"
#include "gcl/io/sequence_parser.h"

namespace gcl::algo {
namespace {

ValidatedRecord makeRecord(std::uint64_t index, std::string header, std::size_t length,
                           std::vector<RecordError> errors = {}) {
    ValidatedRecord record;
    record.index = index;
    record.header = std::move(header);
    record.originalSequence = std::string(length, 'A');
    record.finalSequence = record.originalSequence;
    record.length = length;
    record.errors = std::move(errors);
    record.isValid = record.errors.empty();
    return record;
}

TEST(StatsAggregatorTest, EmptyDatasetIsAllZero) {
    const DatasetSummary summary = summarizeRecords({});

    EXPECT_EQ(summary.totalCount, 0u);
    EXPECT_EQ(summary.validCount, 0u);
    EXPECT_EQ(summary.invalidCount, 0u);
    EXPECT_DOUBLE_EQ(summary.avgGcContent, 0.0);
    EXPECT_EQ(summary.minLength, 0u);
    EXPECT_EQ(summary.maxLength, 0u);
    EXPECT_DOUBLE_EQ(summary.validityPercentage(), 0.0);
    EXPECT_TRUE(summary.errorHistogram.empty());
    EXPECT_FALSE(summary.mostCommonError.has_value());
    EXPECT_TRUE(summary.topLongest.empty());
}

TEST(StatsAggregatorTest, AverageGcOverAllRecords) {
    ValidationConfig config;
    config.minLength = 3;
    const auto records = validateRecords(io::parseSequences(">a\nACGT\n>b\nACGTN\n"), config);

    const DatasetSummary summary = summarizeRecords(records);

    EXPECT_EQ(summary.totalCount, 2u);
    EXPECT_EQ(summary.validCount, 2u);
    EXPECT_NEAR(summary.avgGcContent, 0.45, 1e-12);
    EXPECT_DOUBLE_EQ(summary.minGcContent, 0.4);
    EXPECT_DOUBLE_EQ(summary.maxGcContent, 0.5);
    EXPECT_EQ(summary.minLength, 4u);
    EXPECT_EQ(summary.maxLength, 5u);
    EXPECT_DOUBLE_EQ(summary.avgLength, 4.5);
    EXPECT_EQ(summary.totalBases, 9u);
    EXPECT_DOUBLE_EQ(summary.validityPercentage(), 100.0);
}

TEST(StatsAggregatorTest, CountsAddUp) {
    std::vector<ValidatedRecord> records = {
        makeRecord(0, "a", 10),
        makeRecord(1, "b", 0, {RecordError::kEmptySequence}),
        makeRecord(2, "a", 4, {RecordError::kBelowMinLength, RecordError::kDuplicateHeader}),
        makeRecord(3, "c", 30),
    };

    const DatasetSummary summary = summarizeRecords(records);

    EXPECT_EQ(summary.totalCount, 4u);
    EXPECT_EQ(summary.validCount, 2u);
    EXPECT_EQ(summary.invalidCount, 2u);
    EXPECT_EQ(summary.validCount + summary.invalidCount, summary.totalCount);
    EXPECT_DOUBLE_EQ(summary.validityPercentage(), 50.0);
    EXPECT_EQ(summary.totalErrors, 3u);
    EXPECT_EQ(summary.minLength, 0u);
    EXPECT_EQ(summary.maxLength, 30u);
}

TEST(StatsAggregatorTest, ErrorHistogramAndMostCommon) {
    std::vector<ValidatedRecord> records = {
        makeRecord(0, "a", 5, {RecordError::kBelowMinLength}),
        makeRecord(1, "b", 5, {RecordError::kInvalidCharacters, RecordError::kBelowMinLength}),
        makeRecord(2, "c", 5, {RecordError::kInvalidCharacters}),
        makeRecord(3, "d", 50),
    };

    const DatasetSummary summary = summarizeRecords(records);

    EXPECT_EQ(summary.errorCount(RecordError::kBelowMinLength), 2u);
    EXPECT_EQ(summary.errorCount(RecordError::kInvalidCharacters), 2u);
    EXPECT_EQ(summary.errorCount(RecordError::kLowComplexity), 0u);
    // Ties resolve to the earlier error code.
    ASSERT_TRUE(summary.mostCommonError.has_value());
    EXPECT_EQ(*summary.mostCommonError, RecordError::kInvalidCharacters);
}

TEST(StatsAggregatorTest, MedianAndQuartiles) {
    std::vector<ValidatedRecord> records;
    const std::size_t lengths[] = {8, 1, 7, 2, 6, 3, 5, 4};
    for (std::size_t i = 0; i < std::size(lengths); ++i) {
        records.push_back(makeRecord(i, "r" + std::to_string(i), lengths[i]));
    }

    const DatasetSummary summary = summarizeRecords(records);

    // Sorted lengths: 1 2 3 4 5 6 7 8
    EXPECT_EQ(summary.medianLength, 5u);
    EXPECT_EQ(summary.lengthQuartiles.q1, 3u);
    EXPECT_EQ(summary.lengthQuartiles.q2, 5u);
    EXPECT_EQ(summary.lengthQuartiles.q3, 7u);
}

TEST(StatsAggregatorTest, TopLongestIsCappedAndOrdered) {
    std::vector<ValidatedRecord> records;
    for (std::size_t i = 0; i < 15; ++i) {
        records.push_back(makeRecord(i, "r" + std::to_string(i), 100 + i));
    }

    const DatasetSummary summary = summarizeRecords(records);

    ASSERT_EQ(summary.topLongest.size(), kTopLongestLimit);
    EXPECT_EQ(summary.topLongest.front().header, "r14");
    EXPECT_EQ(summary.topLongest.front().length, 114u);
    EXPECT_EQ(summary.topLongest.back().header, "r5");
    for (std::size_t i = 1; i < summary.topLongest.size(); ++i) {
        EXPECT_GE(summary.topLongest[i - 1].length, summary.topLongest[i].length);
    }
}

TEST(StatsAggregatorTest, TopLongestTiesKeepFileOrder) {
    std::vector<ValidatedRecord> records = {
        makeRecord(0, "short", 3),
        makeRecord(1, "first", 9),
        makeRecord(2, "second", 9),
        makeRecord(3, "third", 9),
    };

    const DatasetSummary summary = StatsAggregator{2}.summarize(records);

    ASSERT_EQ(summary.topLongest.size(), 2u);
    EXPECT_EQ(summary.topLongest[0].header, "first");
    EXPECT_EQ(summary.topLongest[1].header, "second");
}

TEST(StatsAggregatorTest, TopLongestTiesUseSpanOrderWithoutIndices) {
    // Records built by hand all carry index 0.
    std::vector<ValidatedRecord> records;
    for (const char* header : {"p", "q", "r", "s", "t", "u"}) {
        records.push_back(makeRecord(0, header, 7));
    }

    const DatasetSummary summary = StatsAggregator{4}.summarize(records);

    ASSERT_EQ(summary.topLongest.size(), 4u);
    EXPECT_EQ(summary.topLongest[0].header, "p");
    EXPECT_EQ(summary.topLongest[1].header, "q");
    EXPECT_EQ(summary.topLongest[2].header, "r");
    EXPECT_EQ(summary.topLongest[3].header, "s");
}

TEST(StatsAggregatorTest, MedianGcContent) {
    ValidationConfig config;
    config.minLength = 1;
    const auto records = validateRecords(
        io::parseSequences(">a\nGGGG\n>b\nAAAA\n>c\nACGT\n>d\nGCAT\n>e\nGGGA\n"), config);

    const DatasetSummary summary = summarizeRecords(records);

    // Sorted GC: 0.0 0.5 0.5 0.75 1.0
    EXPECT_DOUBLE_EQ(summary.medianGcContent, 0.5);
    EXPECT_DOUBLE_EQ(summarizeRecords({}).medianGcContent, 0.0);
}

TEST(StatsAggregatorTest, QualityDistribution) {
    ValidationConfig config;
    config.minLength = 4;
    const auto records = validateRecords(
        io::parseSequences(">high\nACGTTGCA\n>medium\nACGTNGCA\n>low\nACGTXGCA\n"
                           ">unusable\nAC\n>worse\nAX\n"),
        config);

    ASSERT_EQ(records.size(), 5u);
    EXPECT_EQ(classifyQuality(records[0]), QualityTier::kHigh);
    EXPECT_EQ(classifyQuality(records[1]), QualityTier::kMedium);
    EXPECT_EQ(classifyQuality(records[2]), QualityTier::kLow);
    EXPECT_EQ(classifyQuality(records[3]), QualityTier::kUnusable);
    EXPECT_EQ(classifyQuality(records[4]), QualityTier::kUnusable);

    const DatasetSummary summary = summarizeRecords(records);
    EXPECT_EQ(summary.qualityCount(QualityTier::kHigh), 1u);
    EXPECT_EQ(summary.qualityCount(QualityTier::kMedium), 1u);
    EXPECT_EQ(summary.qualityCount(QualityTier::kLow), 1u);
    EXPECT_EQ(summary.qualityCount(QualityTier::kUnusable), 2u);
}

TEST(StatsAggregatorTest, CountsSanitizedRecords) {
    ValidationConfig config;
    config.minLength = 1;
    config.sanitize = true;
    const auto records =
        validateRecords(io::parseSequences(">a\nacgt\n>b\nACGT\n>c\nAXGT\n"), config);

    const DatasetSummary summary = summarizeRecords(records);

    EXPECT_EQ(summary.sanitizedCount, 2u);
    EXPECT_EQ(summary.errorCount(RecordError::kInvalidCharacters), 1u);
}

}  // namespace
}  // namespace gcl::algo
