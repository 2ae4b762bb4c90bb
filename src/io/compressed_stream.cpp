// =============================================================================
// refcache - Compressed Stream Implementation
// =============================================================================

#include "refcache/io/compressed_stream.h"

#include <zlib.h>
#include <bzlib.h>
#include <lzma.h>

#include <cstring>
#include <format>
#include <string>

#include "refcache/common/logger.h"

namespace refcache::io {

// =============================================================================
// Magic Bytes for Format Detection
// =============================================================================

namespace {

// Gzip magic: 0x1f 0x8b (BGZF shares it)
constexpr std::uint8_t kGzipMagic[] = {0x1f, 0x8b};

// Bzip2 magic: 'B' 'Z' 'h'
constexpr std::uint8_t kBzip2Magic[] = {0x42, 0x5a, 0x68};

// XZ magic: 0xfd '7' 'z' 'X' 'Z' 0x00
constexpr std::uint8_t kXzMagic[] = {0xfd, 0x37, 0x7a, 0x58, 0x5a, 0x00};

// Zstd magic: 0x28 0xb5 0x2f 0xfd
constexpr std::uint8_t kZstdMagic[] = {0x28, 0xb5, 0x2f, 0xfd};

template <std::size_t N>
bool startsWith(std::span<const std::uint8_t> data, const std::uint8_t (&magic)[N]) {
    return data.size() >= N && std::memcmp(data.data(), magic, N) == 0;
}

}  // namespace

// =============================================================================
// Format Detection
// =============================================================================

CompressionFormat detectCompressionFormat(std::span<const std::uint8_t> data) noexcept {
    if (startsWith(data, kGzipMagic)) {
        return CompressionFormat::kGzip;
    }
    if (startsWith(data, kBzip2Magic)) {
        return CompressionFormat::kBzip2;
    }
    if (startsWith(data, kXzMagic)) {
        return CompressionFormat::kXz;
    }
    if (startsWith(data, kZstdMagic)) {
        return CompressionFormat::kZstd;
    }
    return CompressionFormat::kNone;
}

CompressionFormat sniffFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IOError("Failed to open file for sniffing", ErrorContext(path.string()));
    }
    std::uint8_t magic[kMagicSniffLength] = {};
    file.read(reinterpret_cast<char*>(magic), sizeof(magic));
    auto bytesRead = static_cast<std::size_t>(file.gcount());
    return detectCompressionFormat({magic, bytesRead});
}

std::string_view compressionFormatName(CompressionFormat format) noexcept {
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
            return "plain";
    }
    return "unknown";
}

// =============================================================================
// DecompressingStreamBuf Implementation
// =============================================================================

DecompressingStreamBuf::DecompressingStreamBuf(std::istream& source, std::size_t bufferSize)
    : source_(&source), inputBuffer_(bufferSize), outputBuffer_(bufferSize) {}

DecompressingStreamBuf::int_type DecompressingStreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }

    if (streamEnd_) {
        return traits_type::eof();
    }

    std::size_t produced = decompress();
    if (produced == 0) {
        return traits_type::eof();
    }

    setg(outputBuffer_.data(), outputBuffer_.data(), outputBuffer_.data() + produced);
    return traits_type::to_int_type(*gptr());
}

std::size_t DecompressingStreamBuf::refill() {
    if (source_ == nullptr || source_->eof()) {
        return 0;
    }
    source_->read(reinterpret_cast<char*>(inputBuffer_.data()),
                  static_cast<std::streamsize>(inputBuffer_.size()));
    if (source_->bad()) {
        throw IOError("Failed to read compressed input");
    }
    return static_cast<std::size_t>(source_->gcount());
}

// =============================================================================
// GzipStreamBuf Implementation
// =============================================================================

GzipStreamBuf::GzipStreamBuf(std::istream& source, std::size_t bufferSize)
    : DecompressingStreamBuf(source, bufferSize) {
    auto* stream = new z_stream;
    std::memset(stream, 0, sizeof(z_stream));

    // 16 + MAX_WBITS selects the gzip wrapper
    int ret = inflateInit2(stream, 16 + MAX_WBITS);
    if (ret != Z_OK) {
        delete stream;
        throw IOError("Failed to initialize zlib: " + std::string(zError(ret)));
    }
    zlibStream_ = stream;
}

GzipStreamBuf::~GzipStreamBuf() {
    if (zlibStream_ != nullptr) {
        auto* stream = static_cast<z_stream*>(zlibStream_);
        inflateEnd(stream);
        delete stream;
        zlibStream_ = nullptr;
    }
}

std::size_t GzipStreamBuf::decompress() {
    auto* stream = static_cast<z_stream*>(zlibStream_);

    stream->avail_out = static_cast<uInt>(outputBuffer_.size());
    stream->next_out = reinterpret_cast<Bytef*>(outputBuffer_.data());

    while (stream->avail_out == outputBuffer_.size()) {
        if (stream->avail_in == 0) {
            std::size_t bytesRead = refill();
            if (bytesRead == 0) {
                if (memberOpen_) {
                    throw IOError("Truncated gzip stream");
                }
                streamEnd_ = true;
                break;
            }
            stream->avail_in = static_cast<uInt>(bytesRead);
            stream->next_in = inputBuffer_.data();
        }

        memberOpen_ = true;
        int ret = inflate(stream, Z_NO_FLUSH);
        if (ret == Z_STREAM_END) {
            // Next member (BGZF block or concatenated gzip) starts after the trailer
            memberOpen_ = false;
            inflateReset(stream);
        } else if (ret != Z_OK && ret != Z_BUF_ERROR) {
            throw IOError("Gzip decompression failed: " + std::string(zError(ret)));
        }
    }

    return outputBuffer_.size() - stream->avail_out;
}

// =============================================================================
// Bzip2StreamBuf Implementation
// =============================================================================

Bzip2StreamBuf::Bzip2StreamBuf(std::istream& source, std::size_t bufferSize)
    : DecompressingStreamBuf(source, bufferSize) {
    initBzip2();
}

Bzip2StreamBuf::~Bzip2StreamBuf() { cleanupBzip2(); }

void Bzip2StreamBuf::initBzip2() {
    auto* stream = new bz_stream;
    std::memset(stream, 0, sizeof(bz_stream));
    int ret = BZ2_bzDecompressInit(stream, 0, 0);
    if (ret != BZ_OK) {
        delete stream;
        throw IOError(std::format("Failed to initialize bzip2 decoder (code {})", ret));
    }
    bzStream_ = stream;
}

void Bzip2StreamBuf::cleanupBzip2() noexcept {
    if (bzStream_ != nullptr) {
        auto* stream = static_cast<bz_stream*>(bzStream_);
        BZ2_bzDecompressEnd(stream);
        delete stream;
        bzStream_ = nullptr;
    }
}

std::size_t Bzip2StreamBuf::decompress() {
    auto* stream = static_cast<bz_stream*>(bzStream_);

    stream->avail_out = static_cast<unsigned int>(outputBuffer_.size());
    stream->next_out = outputBuffer_.data();

    while (stream->avail_out == outputBuffer_.size()) {
        if (stream->avail_in == 0) {
            std::size_t bytesRead = refill();
            if (bytesRead == 0) {
                if (memberOpen_) {
                    throw IOError("Truncated bzip2 stream");
                }
                streamEnd_ = true;
                break;
            }
            stream->avail_in = static_cast<unsigned int>(bytesRead);
            stream->next_in = reinterpret_cast<char*>(inputBuffer_.data());
        }

        memberOpen_ = true;
        int ret = BZ2_bzDecompress(stream);
        if (ret == BZ_STREAM_END) {
            // Keep unread input and restart the decoder for a concatenated stream
            char* pendingIn = stream->next_in;
            unsigned int pendingAvail = stream->avail_in;
            char* pendingOut = stream->next_out;
            unsigned int pendingOutAvail = stream->avail_out;

            cleanupBzip2();
            initBzip2();
            stream = static_cast<bz_stream*>(bzStream_);
            stream->next_in = pendingIn;
            stream->avail_in = pendingAvail;
            stream->next_out = pendingOut;
            stream->avail_out = pendingOutAvail;
            memberOpen_ = false;
        } else if (ret != BZ_OK) {
            throw IOError(std::format("Bzip2 decompression failed (code {})", ret));
        }
    }

    return outputBuffer_.size() - stream->avail_out;
}

// =============================================================================
// XzStreamBuf Implementation
// =============================================================================

XzStreamBuf::XzStreamBuf(std::istream& source, std::size_t bufferSize)
    : DecompressingStreamBuf(source, bufferSize) {
    auto* stream = new lzma_stream;
    *stream = LZMA_STREAM_INIT;
    lzma_ret ret = lzma_stream_decoder(stream, UINT64_MAX, LZMA_CONCATENATED);
    if (ret != LZMA_OK) {
        delete stream;
        throw IOError(std::format("Failed to initialize xz decoder (code {})",
                                  static_cast<int>(ret)));
    }
    lzmaStream_ = stream;
}

XzStreamBuf::~XzStreamBuf() {
    if (lzmaStream_ != nullptr) {
        auto* stream = static_cast<lzma_stream*>(lzmaStream_);
        lzma_end(stream);
        delete stream;
        lzmaStream_ = nullptr;
    }
}

std::size_t XzStreamBuf::decompress() {
    auto* stream = static_cast<lzma_stream*>(lzmaStream_);

    stream->avail_out = outputBuffer_.size();
    stream->next_out = reinterpret_cast<std::uint8_t*>(outputBuffer_.data());

    while (stream->avail_out == outputBuffer_.size()) {
        if (stream->avail_in == 0 && !inputExhausted_) {
            std::size_t bytesRead = refill();
            if (bytesRead == 0) {
                inputExhausted_ = true;
            } else {
                stream->avail_in = bytesRead;
                stream->next_in = inputBuffer_.data();
            }
        }

        // LZMA_CONCATENATED needs LZMA_FINISH to report the end of the last stream
        lzma_ret ret = lzma_code(stream, inputExhausted_ ? LZMA_FINISH : LZMA_RUN);
        if (ret == LZMA_STREAM_END) {
            streamEnd_ = true;
            break;
        }
        if (ret != LZMA_OK) {
            throw IOError(std::format("Xz decompression failed (code {})", static_cast<int>(ret)));
        }
    }

    return outputBuffer_.size() - stream->avail_out;
}

// =============================================================================
// CompressedInputStream Implementation
// =============================================================================

CompressedInputStream::CompressedInputStream(const std::filesystem::path& path)
    : std::istream(nullptr) {
    format_ = sniffFile(path);

    fileStream_ = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!fileStream_->is_open()) {
        throw IOError("Failed to open file", ErrorContext(path.string()));
    }

    switch (format_) {
        case CompressionFormat::kNone:
            rdbuf(fileStream_->rdbuf());
            break;
        case CompressionFormat::kGzip:
            decompressBuf_ = std::make_unique<GzipStreamBuf>(*fileStream_);
            rdbuf(decompressBuf_.get());
            break;
        case CompressionFormat::kBzip2:
            decompressBuf_ = std::make_unique<Bzip2StreamBuf>(*fileStream_);
            rdbuf(decompressBuf_.get());
            break;
        case CompressionFormat::kXz:
            decompressBuf_ = std::make_unique<XzStreamBuf>(*fileStream_);
            rdbuf(decompressBuf_.get());
            break;
        case CompressionFormat::kZstd:
            throw UnsupportedFormat("Compression format not supported: " +
                                        std::string(compressionFormatName(format_)),
                                    ErrorContext(path.string()));
    }

    REFCACHE_LOG_TRACE("Opened {} input {}", compressionFormatName(format_), path.string());
}

CompressedInputStream::~CompressedInputStream() {
    // Detach before the owned buffers are destroyed
    rdbuf(nullptr);
}

}  // namespace refcache::io
