// =============================================================================
// genome-cleaner - FASTA Writer Tests
// =============================================================================

#include "gcl/io/fasta_writer.h"

#include "gcl/common/error.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace gcl::io {
namespace {

namespace fs = std::filesystem;

ValidatedRecord makeRecord(std::string header, std::string original, std::string final,
                           bool valid = true) {
    ValidatedRecord record;
    record.header = std::move(header);
    record.originalSequence = std::move(original);
    record.finalSequence = std::move(final);
    record.length = record.finalSequence.size();
    record.isValid = valid;
    if (!valid) {
        record.errors.push_back(RecordError::kBelowMinLength);
    }
    return record;
}

std::vector<ValidatedRecord> sampleRecords() {
    return {
        makeRecord("a desc", "acgtacgt", "ACGTACGT"),
        makeRecord("b", "GG", "GG", false),
        makeRecord("c", "ACGT", "ACGT"),
    };
}

TEST(FastaWriterTest, WritesFinalSequencesUnwrapped) {
    std::ostringstream out;
    const std::size_t written = writeFasta(sampleRecords(), out);

    EXPECT_EQ(written, 3u);
    EXPECT_EQ(out.str(), ">a desc\nACGTACGT\n>b\nGG\n>c\nACGT\n");
}

TEST(FastaWriterTest, WrapsAtLineWidth) {
    FastaWriterOptions options;
    options.lineWidth = 3;

    std::ostringstream out;
    (void)writeFasta(sampleRecords(), out, options);

    EXPECT_EQ(out.str(), ">a desc\nACG\nTAC\nGT\n>b\nGG\n>c\nACG\nT\n");
}

TEST(FastaWriterTest, ValidOnlySkipsInvalidRecords) {
    FastaWriterOptions options;
    options.validOnly = true;

    std::ostringstream out;
    EXPECT_EQ(writeFasta(sampleRecords(), out, options), 2u);
    EXPECT_EQ(out.str().find(">b\n"), std::string::npos);
}

TEST(FastaWriterTest, SanitizedOnlyKeepsChangedRecords) {
    FastaWriterOptions options;
    options.sanitizedOnly = true;

    std::ostringstream out;
    EXPECT_EQ(writeFasta(sampleRecords(), out, options), 1u);
    EXPECT_EQ(out.str(), ">a desc\nACGTACGT\n");
}

TEST(FastaWriterTest, EmptyRecordKeepsHeader) {
    std::vector<ValidatedRecord> records = {makeRecord("empty", "", "")};
    std::ostringstream out;
    (void)writeFasta(records, out);

    EXPECT_EQ(out.str(), ">empty\n\n");
}

TEST(FastaWriterTest, WritesFile) {
    const fs::path path = fs::temp_directory_path() / "gcl_fasta_writer_test.fa";
    EXPECT_EQ(writeFastaFile(sampleRecords(), path), 3u);

    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    in.close();
    fs::remove(path);

    EXPECT_EQ(buffer.str(), ">a desc\nACGTACGT\n>b\nGG\n>c\nACGT\n");
}

TEST(FastaWriterTest, UnwritablePathThrows) {
    const fs::path path = fs::temp_directory_path() / "gcl_missing_dir" / "out.fa";
    EXPECT_THROW((void)writeFastaFile(sampleRecords(), path), IOError);
}

}  // namespace
}  // namespace gcl::io
