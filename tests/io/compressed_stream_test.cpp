// =============================================================================
// genome-cleaner - Compressed Stream Tests
// =============================================================================
// Compressed inputs are produced in-process with each codec's own encoder and
// decoded back through CompressedInputStream.
// =============================================================================

#include "gcl/io/compressed_stream.h"

#include <gtest/gtest.h>

#include <bzlib.h>
#include <lzma.h>
#include <zlib.h>
#include <zstd.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace gcl::io {
namespace {

namespace fs = std::filesystem;

// =============================================================================
// Encoders
// =============================================================================

std::string gzipCompress(const std::string& input) {
    z_stream stream{};
    if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        ADD_FAILURE() << "deflateInit2 failed";
        return {};
    }
    std::string output(deflateBound(&stream, static_cast<uLong>(input.size())) + 32, '\0');
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(output.size());
    const int ret = deflate(&stream, Z_FINISH);
    EXPECT_EQ(ret, Z_STREAM_END);
    output.resize(stream.total_out);
    deflateEnd(&stream);
    return output;
}

std::string bzip2Compress(const std::string& input) {
    unsigned int destLen = static_cast<unsigned int>(input.size() + input.size() / 100 + 600);
    std::string output(destLen, '\0');
    const int ret = BZ2_bzBuffToBuffCompress(output.data(), &destLen,
                                             const_cast<char*>(input.data()),
                                             static_cast<unsigned int>(input.size()), 9, 0, 0);
    EXPECT_EQ(ret, BZ_OK);
    output.resize(destLen);
    return output;
}

std::string xzCompress(const std::string& input) {
    std::string output(lzma_stream_buffer_bound(input.size()), '\0');
    std::size_t outPos = 0;
    const lzma_ret ret = lzma_easy_buffer_encode(
        6, LZMA_CHECK_CRC64, nullptr, reinterpret_cast<const std::uint8_t*>(input.data()),
        input.size(), reinterpret_cast<std::uint8_t*>(output.data()), &outPos, output.size());
    EXPECT_EQ(ret, LZMA_OK);
    output.resize(outPos);
    return output;
}

std::string zstdCompress(const std::string& input) {
    std::string output(ZSTD_compressBound(input.size()), '\0');
    const std::size_t written =
        ZSTD_compress(output.data(), output.size(), input.data(), input.size(), 3);
    EXPECT_FALSE(ZSTD_isError(written));
    output.resize(written);
    return output;
}

// =============================================================================
// Helpers
// =============================================================================

std::string sampleFasta() {
    std::string text;
    for (int i = 0; i < 2000; ++i) {
        text += ">seq" + std::to_string(i) + " sample\n";
        text += "ACGTTGCAACGGTTCAGGCATTACGATCGATCGGATCCAAGT\n";
    }
    return text;
}

std::string decode(const std::string& bytes) {
    CompressedInputStream stream(std::make_unique<std::istringstream>(bytes));
    return readAll(stream);
}

CompressionFormat detect(const std::string& bytes) {
    return detectCompressionFormat(
        {reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size()});
}

// =============================================================================
// Format Detection Tests
// =============================================================================

TEST(DetectCompressionFormatTest, RecognizesMagicBytes) {
    EXPECT_EQ(detect(gzipCompress("x")), CompressionFormat::kGzip);
    EXPECT_EQ(detect(bzip2Compress("x")), CompressionFormat::kBzip2);
    EXPECT_EQ(detect(xzCompress("x")), CompressionFormat::kXz);
    EXPECT_EQ(detect(zstdCompress("x")), CompressionFormat::kZstd);
}

TEST(DetectCompressionFormatTest, PlainTextIsNone) {
    EXPECT_EQ(detect(">seq\nACGT\n"), CompressionFormat::kNone);
    EXPECT_EQ(detect(""), CompressionFormat::kNone);
    EXPECT_EQ(detect("\x1f"), CompressionFormat::kNone);
}

TEST(CompressionFormatNameTest, Names) {
    EXPECT_EQ(compressionFormatName(CompressionFormat::kGzip), "gzip");
    EXPECT_EQ(compressionFormatName(CompressionFormat::kNone), "none");
}

// =============================================================================
// Decoding Tests
// =============================================================================

TEST(CompressedInputStreamTest, PlainTextPassesThrough) {
    const std::string text = sampleFasta();
    CompressedInputStream stream(std::make_unique<std::istringstream>(text));

    EXPECT_EQ(stream.format(), CompressionFormat::kNone);
    EXPECT_FALSE(stream.isCompressed());
    EXPECT_EQ(readAll(stream), text);
}

TEST(CompressedInputStreamTest, EmptyInput) {
    EXPECT_EQ(decode(""), "");
}

TEST(CompressedInputStreamTest, Gzip) {
    const std::string text = sampleFasta();
    EXPECT_EQ(decode(gzipCompress(text)), text);
}

TEST(CompressedInputStreamTest, GzipConcatenatedMembers) {
    const std::string first = ">a\nACGT\n";
    const std::string second = ">b\nGGCC\n";
    EXPECT_EQ(decode(gzipCompress(first) + gzipCompress(second)), first + second);
}

TEST(CompressedInputStreamTest, Bzip2) {
    const std::string text = sampleFasta();
    EXPECT_EQ(decode(bzip2Compress(text)), text);
}

TEST(CompressedInputStreamTest, Bzip2ConcatenatedStreams) {
    const std::string first = ">a\nACGT\n";
    const std::string second = ">b\nGGCC\n";
    EXPECT_EQ(decode(bzip2Compress(first) + bzip2Compress(second)), first + second);
}

TEST(CompressedInputStreamTest, Xz) {
    const std::string text = sampleFasta();
    EXPECT_EQ(decode(xzCompress(text)), text);
}

TEST(CompressedInputStreamTest, Zstd) {
    const std::string text = sampleFasta();
    EXPECT_EQ(decode(zstdCompress(text)), text);
}

TEST(CompressedInputStreamTest, TruncatedGzipThrows) {
    const std::string bytes = gzipCompress(sampleFasta());
    EXPECT_THROW((void)decode(bytes.substr(0, bytes.size() / 2)), IOError);
}

TEST(CompressedInputStreamTest, TruncatedZstdThrows) {
    const std::string bytes = zstdCompress(sampleFasta());
    EXPECT_THROW((void)decode(bytes.substr(0, bytes.size() - 4)), IOError);
}

// =============================================================================
// File Tests
// =============================================================================

TEST(ReadInputTextTest, ReadsCompressedFile) {
    const fs::path path = fs::temp_directory_path() / "gcl_compressed_stream_test.fa.gz";
    const std::string text = sampleFasta();
    {
        std::ofstream out(path, std::ios::binary);
        out << gzipCompress(text);
    }

    const std::string decoded = readInputText(path);
    fs::remove(path);
    EXPECT_EQ(decoded, text);
}

TEST(ReadInputTextTest, MissingFileThrows) {
    const fs::path path = fs::temp_directory_path() / "gcl_does_not_exist.fa";
    try {
        (void)readInputText(path);
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        EXPECT_EQ(e.exitCode(), 2);
        ASSERT_TRUE(e.context().has_value());
        EXPECT_EQ(e.context()->filePath, path.string());
    }
}

}  // namespace
}  // namespace gcl::io
