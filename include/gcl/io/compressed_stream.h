// =============================================================================
// genome-cleaner - Compressed Stream Support
// =============================================================================
// Transparent decompression of input files.
//
// This module provides:
// - Compression format detection from magic bytes (gzip, bzip2, xz, zstd)
// - One std::streambuf per codec, decoding incrementally from a source stream
// - CompressedInputStream: std::istream that picks the right decoder
// - readInputText(): whole-file (or stdin) read used by the commands
//
// Multi-member gzip/bzip2 files and concatenated xz/zstd streams are decoded
// as one continuous text. A stream that ends mid-member raises IOError.
//
// Usage:
//   auto stream = openInputFile("/path/to/reads.fastq.gz");
//   std::string text = readInputText("/path/to/genome.fa.xz");
// =============================================================================

#ifndef GCL_IO_COMPRESSED_STREAM_H
#define GCL_IO_COMPRESSED_STREAM_H

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <span>
#include <streambuf>
#include <string>
#include <string_view>
#include <vector>

#include "gcl/common/error.h"

namespace gcl::io {

// =============================================================================
// Compression Format Detection
// =============================================================================

/// @brief Supported compression formats.
enum class CompressionFormat : std::uint8_t {
    kNone = 0,   ///< Uncompressed (plain text)
    kGzip = 1,   ///< gzip (.gz)
    kBzip2 = 2,  ///< bzip2 (.bz2)
    kXz = 3,     ///< xz/lzma (.xz)
    kZstd = 4,   ///< zstd (.zst)
    kUnknown = 255
};

/// @brief Detect compression format from file magic bytes.
/// @param data First few bytes of the file.
/// @return Detected compression format (kNone when no magic matches).
[[nodiscard]] CompressionFormat detectCompressionFormat(std::span<const std::uint8_t> data);

/// @brief Get human-readable name for compression format.
/// @param format Compression format.
/// @return Format name (e.g., "gzip").
[[nodiscard]] std::string_view compressionFormatName(CompressionFormat format);

// =============================================================================
// GzipStreamBuf
// =============================================================================

/// @brief Stream buffer for gzip decompression.
/// @note Uses zlib for streaming decompression.
class GzipStreamBuf : public std::streambuf {
public:
    /// @brief Construct a gzip stream buffer.
    /// @param source Source stream to decompress.
    /// @param bufferSize Internal buffer size.
    /// @throws IOError if zlib cannot be initialized.
    explicit GzipStreamBuf(std::istream& source, std::size_t bufferSize = 64 * 1024);

    ~GzipStreamBuf() override;

    GzipStreamBuf(const GzipStreamBuf&) = delete;
    GzipStreamBuf& operator=(const GzipStreamBuf&) = delete;

protected:
    int_type underflow() override;

private:
    std::size_t decompress();

    std::istream* source_ = nullptr;
    std::vector<std::uint8_t> inputBuffer_;
    std::vector<char> outputBuffer_;

    /// @brief zlib stream state (opaque pointer).
    void* zlibStream_ = nullptr;

    bool memberFinished_ = false;
    bool outputFull_ = false;
    bool streamEnd_ = false;
};

// =============================================================================
// Bzip2StreamBuf
// =============================================================================

/// @brief Stream buffer for bzip2 decompression.
/// @note Uses libbz2 for streaming decompression.
class Bzip2StreamBuf : public std::streambuf {
public:
    /// @throws IOError if libbz2 cannot be initialized.
    explicit Bzip2StreamBuf(std::istream& source, std::size_t bufferSize = 64 * 1024);

    ~Bzip2StreamBuf() override;

    Bzip2StreamBuf(const Bzip2StreamBuf&) = delete;
    Bzip2StreamBuf& operator=(const Bzip2StreamBuf&) = delete;

protected:
    int_type underflow() override;

private:
    /// @brief Reinitialize the decoder for the next stream, keeping pending input.
    void restartStream();

    std::size_t decompress();

    std::istream* source_ = nullptr;
    std::vector<char> inputBuffer_;
    std::vector<char> outputBuffer_;

    /// @brief bzip2 stream state (opaque pointer).
    void* bzStream_ = nullptr;

    bool memberFinished_ = false;
    bool outputFull_ = false;
    bool streamEnd_ = false;
};

// =============================================================================
// XzStreamBuf
// =============================================================================

/// @brief Stream buffer for xz/lzma decompression.
/// @note Uses liblzma for streaming decompression.
class XzStreamBuf : public std::streambuf {
public:
    /// @throws IOError if liblzma cannot be initialized.
    explicit XzStreamBuf(std::istream& source, std::size_t bufferSize = 64 * 1024);

    ~XzStreamBuf() override;

    XzStreamBuf(const XzStreamBuf&) = delete;
    XzStreamBuf& operator=(const XzStreamBuf&) = delete;

protected:
    int_type underflow() override;

private:
    std::size_t decompress();

    std::istream* source_ = nullptr;
    std::vector<std::uint8_t> inputBuffer_;
    std::vector<char> outputBuffer_;

    /// @brief lzma stream state (opaque pointer).
    void* lzmaStream_ = nullptr;

    bool inputEof_ = false;
    bool streamEnd_ = false;
};

// =============================================================================
// ZstdStreamBuf
// =============================================================================

/// @brief Stream buffer for zstd decompression.
/// @note Uses libzstd's streaming API.
class ZstdStreamBuf : public std::streambuf {
public:
    /// @throws IOError if a decompression context cannot be created.
    explicit ZstdStreamBuf(std::istream& source, std::size_t bufferSize = 64 * 1024);

    ~ZstdStreamBuf() override;

    ZstdStreamBuf(const ZstdStreamBuf&) = delete;
    ZstdStreamBuf& operator=(const ZstdStreamBuf&) = delete;

protected:
    int_type underflow() override;

private:
    std::size_t decompress();

    std::istream* source_ = nullptr;
    std::vector<char> inputBuffer_;
    std::vector<char> outputBuffer_;
    std::size_t inputPos_ = 0;
    std::size_t inputSize_ = 0;

    /// @brief ZSTD_DCtx (opaque pointer).
    void* dctx_ = nullptr;

    bool frameFinished_ = false;
    bool outputFull_ = false;
    bool streamEnd_ = false;
};

// =============================================================================
// CompressedInputStream
// =============================================================================

/// @brief Input stream with transparent decompression.
class CompressedInputStream : public std::istream {
public:
    /// @brief Construct from a file path.
    /// @throws IOError if file cannot be opened.
    explicit CompressedInputStream(const std::filesystem::path& path);

    /// @brief Construct from an existing stream.
    /// @param source Source stream (must be seekable when format is kUnknown).
    /// @param format Compression format (auto-detect if kUnknown).
    explicit CompressedInputStream(std::unique_ptr<std::istream> source,
                                   CompressionFormat format = CompressionFormat::kUnknown);

    ~CompressedInputStream() override;

    CompressedInputStream(const CompressedInputStream&) = delete;
    CompressedInputStream& operator=(const CompressedInputStream&) = delete;

    [[nodiscard]] CompressionFormat format() const noexcept { return format_; }

    [[nodiscard]] bool isCompressed() const noexcept { return format_ != CompressionFormat::kNone; }

private:
    /// @brief Detect format from the source's leading bytes and rewind it.
    void detectFromSource(std::istream& source);

    /// @brief Install the decoder for format_.
    void setup();

    std::unique_ptr<std::istream> sourceStream_;
    std::unique_ptr<std::streambuf> decompressBuf_;
    CompressionFormat format_ = CompressionFormat::kUnknown;
};

// =============================================================================
// Factory Functions
// =============================================================================

/// @brief Open a file or stdin with automatic decompression.
/// @param path File path (or "-" for stdin).
/// @throws IOError if file cannot be opened.
[[nodiscard]] std::unique_ptr<std::istream> openInputFile(const std::filesystem::path& path);

/// @brief Read an entire (possibly compressed) input into memory.
/// @param path File path (or "-" for stdin).
/// @throws IOError on open or decode failure.
[[nodiscard]] std::string readInputText(const std::filesystem::path& path);

/// @brief Read the remainder of a stream into memory.
/// @throws IOError (or the decoder's exception) on read failure.
[[nodiscard]] std::string readAll(std::istream& stream);

}  // namespace gcl::io

#endif  // GCL_IO_COMPRESSED_STREAM_H
