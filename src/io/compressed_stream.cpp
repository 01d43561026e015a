// =============================================================================
// genome-cleaner - Compressed Stream Implementation
// =============================================================================
// gzip via zlib, bzip2 via libbz2, xz via liblzma, zstd via libzstd.
// =============================================================================

#include "gcl/io/compressed_stream.h"

#include <bzlib.h>
#include <lzma.h>
#include <zlib.h>
#include <zstd.h>

#include <array>
#include <cstring>
#include <iostream>
#include <sstream>

#include "gcl/common/logger.h"

namespace gcl::io {

// =============================================================================
// Magic Bytes for Format Detection
// =============================================================================

namespace {

// Gzip magic: 0x1f 0x8b
constexpr std::uint8_t kGzipMagic[] = {0x1f, 0x8b};

// Bzip2 magic: 'B' 'Z' 'h'
constexpr std::uint8_t kBzip2Magic[] = {0x42, 0x5a, 0x68};

// XZ magic: 0xfd '7' 'z' 'X' 'Z' 0x00
constexpr std::uint8_t kXzMagic[] = {0xfd, 0x37, 0x7a, 0x58, 0x5a, 0x00};

// Zstd magic: 0x28 0xb5 0x2f 0xfd
constexpr std::uint8_t kZstdMagic[] = {0x28, 0xb5, 0x2f, 0xfd};

constexpr std::size_t kMagicProbeSize = 8;

template <std::size_t N>
bool hasMagic(std::span<const std::uint8_t> data, const std::uint8_t (&magic)[N]) {
    return data.size() >= N && std::memcmp(data.data(), magic, N) == 0;
}

/// @brief Read up to size bytes from source.
/// @return Bytes read; 0 at end of input.
std::size_t readSource(std::istream& source, void* data, std::size_t size) {
    if (source.eof()) {
        return 0;
    }
    source.read(static_cast<char*>(data), static_cast<std::streamsize>(size));
    if (source.bad()) {
        throw IOError("Failed to read compressed input");
    }
    return static_cast<std::size_t>(source.gcount());
}

}  // namespace

// =============================================================================
// Format Detection
// =============================================================================

CompressionFormat detectCompressionFormat(std::span<const std::uint8_t> data) {
    if (hasMagic(data, kGzipMagic)) {
        return CompressionFormat::kGzip;
    }
    if (hasMagic(data, kBzip2Magic)) {
        return CompressionFormat::kBzip2;
    }
    if (hasMagic(data, kXzMagic)) {
        return CompressionFormat::kXz;
    }
    if (hasMagic(data, kZstdMagic)) {
        return CompressionFormat::kZstd;
    }
    return CompressionFormat::kNone;
}

std::string_view compressionFormatName(CompressionFormat format) {
    switch (format) {
        case CompressionFormat::kGzip:
            return "gzip";
        case CompressionFormat::kBzip2:
            return "bzip2";
        case CompressionFormat::kXz:
            return "xz";
        case CompressionFormat::kZstd:
            return "zstd";
        case CompressionFormat::kNone:
            return "none";
        case CompressionFormat::kUnknown:
        default:
            return "unknown";
    }
}

// =============================================================================
// GzipStreamBuf Implementation
// =============================================================================

GzipStreamBuf::GzipStreamBuf(std::istream& source, std::size_t bufferSize)
    : source_(&source), inputBuffer_(bufferSize), outputBuffer_(bufferSize) {
    auto* stream = new z_stream;
    std::memset(stream, 0, sizeof(z_stream));

    // 16 + MAX_WBITS selects the gzip wrapper
    const int ret = inflateInit2(stream, 16 + MAX_WBITS);
    if (ret != Z_OK) {
        delete stream;
        throw IOError("Failed to initialize zlib: " + std::string(zError(ret)));
    }
    zlibStream_ = stream;
}

GzipStreamBuf::~GzipStreamBuf() {
    if (zlibStream_) {
        auto* stream = static_cast<z_stream*>(zlibStream_);
        inflateEnd(stream);
        delete stream;
    }
}

GzipStreamBuf::int_type GzipStreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }
    if (streamEnd_) {
        return traits_type::eof();
    }

    const std::size_t decompressed = decompress();
    if (decompressed == 0) {
        return traits_type::eof();
    }

    setg(outputBuffer_.data(), outputBuffer_.data(), outputBuffer_.data() + decompressed);
    return traits_type::to_int_type(*gptr());
}

std::size_t GzipStreamBuf::decompress() {
    auto* stream = static_cast<z_stream*>(zlibStream_);
    stream->avail_out = static_cast<uInt>(outputBuffer_.size());
    stream->next_out = reinterpret_cast<Bytef*>(outputBuffer_.data());

    while (stream->avail_out == outputBuffer_.size()) {
        // A full output buffer may leave decoded bytes inside zlib; drain
        // those before asking the source for more.
        if (stream->avail_in == 0 && !outputFull_) {
            const std::size_t bytesRead =
                readSource(*source_, inputBuffer_.data(), inputBuffer_.size());
            if (bytesRead == 0) {
                if (!memberFinished_) {
                    throw IOError("Gzip stream is truncated");
                }
                streamEnd_ = true;
                break;
            }
            stream->avail_in = static_cast<uInt>(bytesRead);
            stream->next_in = inputBuffer_.data();
        }

        const int ret = inflate(stream, Z_NO_FLUSH);
        if (ret == Z_STREAM_END) {
            // Continue with the next gzip member, if any.
            memberFinished_ = true;
            inflateReset(stream);
        } else if (ret == Z_OK) {
            memberFinished_ = false;
        } else if (ret != Z_BUF_ERROR) {
            throw IOError("Gzip decompression failed: " + std::string(zError(ret)));
        }
        outputFull_ = stream->avail_out == 0;
    }

    return outputBuffer_.size() - stream->avail_out;
}

// =============================================================================
// Bzip2StreamBuf Implementation
// =============================================================================

Bzip2StreamBuf::Bzip2StreamBuf(std::istream& source, std::size_t bufferSize)
    : source_(&source), inputBuffer_(bufferSize), outputBuffer_(bufferSize) {
    auto* stream = new bz_stream;
    std::memset(stream, 0, sizeof(bz_stream));

    const int ret = BZ2_bzDecompressInit(stream, 0, 0);
    if (ret != BZ_OK) {
        delete stream;
        throw IOError("Failed to initialize bzip2 decoder (code " + std::to_string(ret) + ")");
    }
    bzStream_ = stream;
}

Bzip2StreamBuf::~Bzip2StreamBuf() {
    if (bzStream_) {
        auto* stream = static_cast<bz_stream*>(bzStream_);
        BZ2_bzDecompressEnd(stream);
        delete stream;
    }
}

void Bzip2StreamBuf::restartStream() {
    auto* stream = static_cast<bz_stream*>(bzStream_);
    char* pendingInput = stream->next_in;
    const unsigned int pendingSize = stream->avail_in;

    BZ2_bzDecompressEnd(stream);
    std::memset(stream, 0, sizeof(bz_stream));
    const int ret = BZ2_bzDecompressInit(stream, 0, 0);
    if (ret != BZ_OK) {
        throw IOError("Failed to reinitialize bzip2 decoder (code " + std::to_string(ret) + ")");
    }

    stream->next_in = pendingInput;
    stream->avail_in = pendingSize;
}

Bzip2StreamBuf::int_type Bzip2StreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }
    if (streamEnd_) {
        return traits_type::eof();
    }

    const std::size_t decompressed = decompress();
    if (decompressed == 0) {
        return traits_type::eof();
    }

    setg(outputBuffer_.data(), outputBuffer_.data(), outputBuffer_.data() + decompressed);
    return traits_type::to_int_type(*gptr());
}

std::size_t Bzip2StreamBuf::decompress() {
    auto* stream = static_cast<bz_stream*>(bzStream_);
    stream->avail_out = static_cast<unsigned int>(outputBuffer_.size());
    stream->next_out = outputBuffer_.data();

    while (stream->avail_out == outputBuffer_.size()) {
        if (stream->avail_in == 0 && !outputFull_) {
            const std::size_t bytesRead =
                readSource(*source_, inputBuffer_.data(), inputBuffer_.size());
            if (bytesRead == 0) {
                if (!memberFinished_) {
                    throw IOError("Bzip2 stream is truncated");
                }
                streamEnd_ = true;
                break;
            }
            stream->avail_in = static_cast<unsigned int>(bytesRead);
            stream->next_in = inputBuffer_.data();
        }

        const int ret = BZ2_bzDecompress(stream);
        if (ret == BZ_STREAM_END) {
            memberFinished_ = true;
            const unsigned int produced =
                static_cast<unsigned int>(outputBuffer_.size()) - stream->avail_out;
            restartStream();
            stream->next_out = outputBuffer_.data() + produced;
            stream->avail_out = static_cast<unsigned int>(outputBuffer_.size()) - produced;
        } else if (ret == BZ_OK) {
            memberFinished_ = false;
        } else {
            throw IOError("Bzip2 decompression failed (code " + std::to_string(ret) + ")");
        }
        outputFull_ = stream->avail_out == 0;
    }

    return outputBuffer_.size() - stream->avail_out;
}

// =============================================================================
// XzStreamBuf Implementation
// =============================================================================

XzStreamBuf::XzStreamBuf(std::istream& source, std::size_t bufferSize)
    : source_(&source), inputBuffer_(bufferSize), outputBuffer_(bufferSize) {
    auto* stream = new lzma_stream;
    const lzma_stream init = LZMA_STREAM_INIT;
    *stream = init;

    const lzma_ret ret = lzma_stream_decoder(stream, UINT64_MAX, LZMA_CONCATENATED);
    if (ret != LZMA_OK) {
        delete stream;
        throw IOError("Failed to initialize xz decoder (code " +
                      std::to_string(static_cast<int>(ret)) + ")");
    }
    lzmaStream_ = stream;
}

XzStreamBuf::~XzStreamBuf() {
    if (lzmaStream_) {
        auto* stream = static_cast<lzma_stream*>(lzmaStream_);
        lzma_end(stream);
        delete stream;
    }
}

XzStreamBuf::int_type XzStreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }
    if (streamEnd_) {
        return traits_type::eof();
    }

    const std::size_t decompressed = decompress();
    if (decompressed == 0) {
        return traits_type::eof();
    }

    setg(outputBuffer_.data(), outputBuffer_.data(), outputBuffer_.data() + decompressed);
    return traits_type::to_int_type(*gptr());
}

std::size_t XzStreamBuf::decompress() {
    auto* stream = static_cast<lzma_stream*>(lzmaStream_);
    stream->avail_out = outputBuffer_.size();
    stream->next_out = reinterpret_cast<std::uint8_t*>(outputBuffer_.data());

    while (stream->avail_out == outputBuffer_.size()) {
        if (stream->avail_in == 0 && !inputEof_) {
            const std::size_t bytesRead =
                readSource(*source_, inputBuffer_.data(), inputBuffer_.size());
            if (bytesRead == 0) {
                inputEof_ = true;
            } else {
                stream->avail_in = bytesRead;
                stream->next_in = inputBuffer_.data();
            }
        }

        // LZMA_CONCATENATED only reports the end once told the input is over.
        const lzma_ret ret = lzma_code(stream, inputEof_ ? LZMA_FINISH : LZMA_RUN);
        if (ret == LZMA_STREAM_END) {
            streamEnd_ = true;
            break;
        }
        if (ret == LZMA_BUF_ERROR && inputEof_) {
            throw IOError("Xz stream is truncated");
        }
        if (ret != LZMA_OK) {
            throw IOError("Xz decompression failed (code " +
                          std::to_string(static_cast<int>(ret)) + ")");
        }
    }

    return outputBuffer_.size() - stream->avail_out;
}

// =============================================================================
// ZstdStreamBuf Implementation
// =============================================================================

ZstdStreamBuf::ZstdStreamBuf(std::istream& source, std::size_t bufferSize)
    : source_(&source), inputBuffer_(bufferSize), outputBuffer_(bufferSize) {
    dctx_ = ZSTD_createDCtx();
    if (!dctx_) {
        throw IOError("Failed to create zstd decompression context");
    }
}

ZstdStreamBuf::~ZstdStreamBuf() {
    if (dctx_) {
        ZSTD_freeDCtx(static_cast<ZSTD_DCtx*>(dctx_));
    }
}

ZstdStreamBuf::int_type ZstdStreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }
    if (streamEnd_) {
        return traits_type::eof();
    }

    const std::size_t decompressed = decompress();
    if (decompressed == 0) {
        return traits_type::eof();
    }

    setg(outputBuffer_.data(), outputBuffer_.data(), outputBuffer_.data() + decompressed);
    return traits_type::to_int_type(*gptr());
}

std::size_t ZstdStreamBuf::decompress() {
    auto* dctx = static_cast<ZSTD_DCtx*>(dctx_);
    std::size_t produced = 0;

    while (produced == 0) {
        if (inputPos_ == inputSize_ && !outputFull_) {
            const std::size_t bytesRead =
                readSource(*source_, inputBuffer_.data(), inputBuffer_.size());
            if (bytesRead == 0) {
                if (!frameFinished_) {
                    throw IOError("Zstd stream is truncated");
                }
                streamEnd_ = true;
                break;
            }
            inputSize_ = bytesRead;
            inputPos_ = 0;
        }

        ZSTD_inBuffer in{inputBuffer_.data(), inputSize_, inputPos_};
        ZSTD_outBuffer out{outputBuffer_.data(), outputBuffer_.size(), 0};
        const std::size_t ret = ZSTD_decompressStream(dctx, &out, &in);
        if (ZSTD_isError(ret)) {
            throw IOError("Zstd decompression failed: " + std::string(ZSTD_getErrorName(ret)));
        }

        inputPos_ = in.pos;
        produced = out.pos;
        frameFinished_ = ret == 0;
        outputFull_ = out.pos == out.size;
    }

    return produced;
}

// =============================================================================
// CompressedInputStream Implementation
// =============================================================================

CompressedInputStream::CompressedInputStream(const std::filesystem::path& path)
    : std::istream(nullptr) {
    auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!file->is_open()) {
        throw IOError("Failed to open file", ErrorContext(path.string()));
    }
    sourceStream_ = std::move(file);

    detectFromSource(*sourceStream_);
    setup();
}

CompressedInputStream::CompressedInputStream(std::unique_ptr<std::istream> source,
                                             CompressionFormat format)
    : std::istream(nullptr), sourceStream_(std::move(source)), format_(format) {
    if (!sourceStream_) {
        throw IOError("No source stream available");
    }
    if (format_ == CompressionFormat::kUnknown) {
        detectFromSource(*sourceStream_);
    }
    setup();
}

CompressedInputStream::~CompressedInputStream() {
    // The decoder references the source; release it first.
    rdbuf(nullptr);
    decompressBuf_.reset();
}

void CompressedInputStream::detectFromSource(std::istream& source) {
    std::array<std::uint8_t, kMagicProbeSize> magic{};
    source.read(reinterpret_cast<char*>(magic.data()), static_cast<std::streamsize>(magic.size()));
    const auto bytesRead = static_cast<std::size_t>(source.gcount());

    source.clear();
    source.seekg(0, std::ios::beg);
    if (!source) {
        throw IOError("Input stream is not seekable; cannot detect compression");
    }

    format_ = detectCompressionFormat({magic.data(), bytesRead});
}

void CompressedInputStream::setup() {
    std::istream& source = *sourceStream_;

    switch (format_) {
        case CompressionFormat::kNone:
            rdbuf(source.rdbuf());
            return;
        case CompressionFormat::kGzip:
            decompressBuf_ = std::make_unique<GzipStreamBuf>(source);
            break;
        case CompressionFormat::kBzip2:
            decompressBuf_ = std::make_unique<Bzip2StreamBuf>(source);
            break;
        case CompressionFormat::kXz:
            decompressBuf_ = std::make_unique<XzStreamBuf>(source);
            break;
        case CompressionFormat::kZstd:
            decompressBuf_ = std::make_unique<ZstdStreamBuf>(source);
            break;
        case CompressionFormat::kUnknown:
        default:
            throw IOError("Unknown compression format");
    }

    rdbuf(decompressBuf_.get());
    GCL_LOG_DEBUG("Opened {} compressed stream", compressionFormatName(format_));
}

// =============================================================================
// Factory Functions
// =============================================================================

std::unique_ptr<std::istream> openInputFile(const std::filesystem::path& path) {
    if (path == "-") {
        // stdin cannot be rewound, so buffer it before probing the magic bytes.
        GCL_LOG_DEBUG("Opening stdin for input");
        auto buffered = std::make_unique<std::stringstream>();
        *buffered << readAll(std::cin);
        return std::make_unique<CompressedInputStream>(std::move(buffered));
    }

    return std::make_unique<CompressedInputStream>(path);
}

std::string readAll(std::istream& stream) {
    std::streambuf* buffer = stream.rdbuf();
    if (!buffer) {
        throw IOError("Input stream has no buffer");
    }

    // Reading through the streambuf lets decoder exceptions reach the caller.
    std::string text;
    std::array<char, 64 * 1024> chunk{};
    while (true) {
        const std::streamsize n = buffer->sgetn(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        if (n <= 0) {
            break;
        }
        text.append(chunk.data(), static_cast<std::size_t>(n));
    }
    return text;
}

std::string readInputText(const std::filesystem::path& path) {
    auto stream = openInputFile(path);
    std::string text = readAll(*stream);
    GCL_LOG_DEBUG("Read {} bytes of input from {}", text.size(), path.string());
    return text;
}

}  // namespace gcl::io
