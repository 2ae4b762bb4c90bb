// =============================================================================
// refcache - Format Transcoder
// =============================================================================
// Normalizes a downloaded sequence file into BGZF.
//
// The input format is determined from magic bytes, never from the file name:
// origins routinely serve gzip under a `.fa` name or plain text under `.gz`.
// Gzip input is always decoded and re-compressed, so a plain gzip file that is
// not block-compressed never reaches the indexer.
// =============================================================================

#ifndef REFCACHE_FORMAT_TRANSCODER_H
#define REFCACHE_FORMAT_TRANSCODER_H

#include <cstdint>
#include <filesystem>

#include "refcache/common/error.h"
#include "refcache/io/compressed_stream.h"

namespace refcache::format {

/// @brief Summary of one transcoding run.
struct TranscodeResult {
    io::CompressionFormat sourceFormat = io::CompressionFormat::kNone;
    std::uint64_t uncompressedBytes = 0;
};

/// @brief Decompress `source` (plain/gzip/bzip2/xz) and write it to `target` as BGZF.
/// @param level BGZF deflate level 1-9.
/// @throws UnsupportedFormat for recognized but undecodable input (zstd).
/// @throws IOError on read, decode or write failure; `target` is untouched then.
TranscodeResult transcodeToBgzf(const std::filesystem::path& source,
                                const std::filesystem::path& target, int level);

}  // namespace refcache::format

#endif  // REFCACHE_FORMAT_TRANSCODER_H
