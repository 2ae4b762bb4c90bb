// =============================================================================
// refcache - Compressed Stream Support
// =============================================================================
// Transparent decompression of downloaded genome sources.
//
// This module provides:
// - detectCompressionFormat(): magic-byte sniffing, independent of file name
// - Gzip/Bzip2/Xz stream buffers (multi-member / concatenated streams)
// - CompressedInputStream: std::istream over any supported input
//
// BGZF files are multi-member gzip files, so they decode through the gzip
// path like any other gzip input.
//
// Usage:
//   CompressedInputStream in("/cache/raw/genome.fa.src");
//   std::string line;
//   while (std::getline(in, line)) { ... }
// =============================================================================

#ifndef REFCACHE_IO_COMPRESSED_STREAM_H
#define REFCACHE_IO_COMPRESSED_STREAM_H

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <span>
#include <streambuf>
#include <string_view>
#include <vector>

#include "refcache/common/error.h"

namespace refcache::io {

// =============================================================================
// Compression Format Detection
// =============================================================================

/// @brief Compression formats recognized by magic bytes.
enum class CompressionFormat : std::uint8_t {
    kNone = 0,   ///< Uncompressed (plain text)
    kGzip = 1,   ///< gzip, including BGZF
    kBzip2 = 2,  ///< bzip2
    kXz = 3,     ///< xz
    kZstd = 4    ///< zstd (recognized, not supported)
};

/// @brief Number of leading bytes needed to recognize every format.
inline constexpr std::size_t kMagicSniffLength = 6;

/// @brief Detect compression format from leading bytes.
/// @param data First bytes of the file (fewer than kMagicSniffLength is fine).
/// @return Detected format; kNone when no magic matches.
[[nodiscard]] CompressionFormat detectCompressionFormat(std::span<const std::uint8_t> data) noexcept;

/// @brief Read the leading bytes of a file and detect its format.
/// @throws IOError if the file cannot be opened.
[[nodiscard]] CompressionFormat sniffFile(const std::filesystem::path& path);

/// @brief Get human-readable name for compression format.
[[nodiscard]] std::string_view compressionFormatName(CompressionFormat format) noexcept;

// =============================================================================
// DecompressingStreamBuf
// =============================================================================

/// @brief Common buffering for the codec stream buffers.
/// @note Subclasses fill outputBuffer_ from inputBuffer_ in decompress().
class DecompressingStreamBuf : public std::streambuf {
public:
    ~DecompressingStreamBuf() override = default;

    DecompressingStreamBuf(const DecompressingStreamBuf&) = delete;
    DecompressingStreamBuf& operator=(const DecompressingStreamBuf&) = delete;

protected:
    DecompressingStreamBuf(std::istream& source, std::size_t bufferSize);

    /// @brief Underflow handler - refill buffer.
    int_type underflow() override;

    /// @brief Decompress more data into outputBuffer_.
    /// @return Number of bytes produced; 0 at end of stream.
    virtual std::size_t decompress() = 0;

    /// @brief Read the next chunk of compressed input.
    /// @return Number of bytes read into inputBuffer_; 0 at end of input.
    std::size_t refill();

    std::istream* source_ = nullptr;
    std::vector<std::uint8_t> inputBuffer_;
    std::vector<char> outputBuffer_;
    bool streamEnd_ = false;
};

// =============================================================================
// GzipStreamBuf
// =============================================================================

/// @brief Stream buffer for gzip decompression (zlib).
/// @note Decodes every member of a multi-member file.
class GzipStreamBuf final : public DecompressingStreamBuf {
public:
    explicit GzipStreamBuf(std::istream& source, std::size_t bufferSize = 64 * 1024);
    ~GzipStreamBuf() override;

protected:
    std::size_t decompress() override;

private:
    /// @brief zlib stream state (opaque pointer).
    void* zlibStream_ = nullptr;

    /// @brief Whether a member has started but not reached its trailer.
    bool memberOpen_ = false;
};

// =============================================================================
// Bzip2StreamBuf
// =============================================================================

/// @brief Stream buffer for bzip2 decompression (libbz2).
/// @note Decodes concatenated streams as written by parallel bzip2 tools.
class Bzip2StreamBuf final : public DecompressingStreamBuf {
public:
    explicit Bzip2StreamBuf(std::istream& source, std::size_t bufferSize = 64 * 1024);
    ~Bzip2StreamBuf() override;

protected:
    std::size_t decompress() override;

private:
    void initBzip2();
    void cleanupBzip2() noexcept;

    void* bzStream_ = nullptr;
    bool memberOpen_ = false;
};

// =============================================================================
// XzStreamBuf
// =============================================================================

/// @brief Stream buffer for xz decompression (liblzma).
class XzStreamBuf final : public DecompressingStreamBuf {
public:
    explicit XzStreamBuf(std::istream& source, std::size_t bufferSize = 64 * 1024);
    ~XzStreamBuf() override;

protected:
    std::size_t decompress() override;

private:
    void* lzmaStream_ = nullptr;
    bool inputExhausted_ = false;
};

// =============================================================================
// CompressedInputStream
// =============================================================================

/// @brief Input stream with transparent decompression.
class CompressedInputStream : public std::istream {
public:
    /// @brief Open a file, sniffing its format.
    /// @throws IOError if the file cannot be opened.
    /// @throws UnsupportedFormat for recognized but undecodable formats.
    explicit CompressedInputStream(const std::filesystem::path& path);

    ~CompressedInputStream() override;

    CompressedInputStream(const CompressedInputStream&) = delete;
    CompressedInputStream& operator=(const CompressedInputStream&) = delete;

    /// @brief Get the detected compression format.
    [[nodiscard]] CompressionFormat format() const noexcept { return format_; }

    /// @brief Check if the stream is compressed.
    [[nodiscard]] bool isCompressed() const noexcept { return format_ != CompressionFormat::kNone; }

private:
    std::unique_ptr<std::ifstream> fileStream_;
    std::unique_ptr<std::streambuf> decompressBuf_;
    CompressionFormat format_ = CompressionFormat::kNone;
};

}  // namespace refcache::io

#endif  // REFCACHE_IO_COMPRESSED_STREAM_H
