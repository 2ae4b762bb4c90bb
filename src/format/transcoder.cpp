// =============================================================================
// refcache - Format Transcoder Implementation
// =============================================================================

#include "refcache/format/transcoder.h"

#include <string_view>
#include <vector>

#include "refcache/common/logger.h"
#include "refcache/format/bgzf_writer.h"

namespace refcache::format {

namespace {

constexpr std::size_t kCopyChunkSize = 1024 * 1024;

}  // namespace

TranscodeResult transcodeToBgzf(const std::filesystem::path& source,
                                const std::filesystem::path& target, int level) {
    io::CompressedInputStream in(source);
    // Rethrow decoder errors instead of only setting badbit
    in.exceptions(std::ios::badbit);

    REFCACHE_LOG_DEBUG("Transcoding {} ({}) -> {}", source.string(),
                       io::compressionFormatName(in.format()), target.string());

    BgzfWriter writer(target, level);
    std::vector<char> buffer(kCopyChunkSize);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto got = in.gcount();
        if (got > 0) {
            writer.write(std::string_view(buffer.data(), static_cast<std::size_t>(got)));
        }
    }
    writer.commit();

    REFCACHE_LOG_DEBUG("Transcoded {} bytes into {}", writer.bytesWritten(), target.string());
    return TranscodeResult{in.format(), writer.bytesWritten()};
}

}  // namespace refcache::format
