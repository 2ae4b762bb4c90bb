// =============================================================================
// refcache - Content Checksums Implementation
// =============================================================================

#include "refcache/io/checksum.h"

#include <fstream>
#include <memory>
#include <system_error>
#include <vector>

#include <xxhash.h>

#include "refcache/common/error.h"

namespace refcache::io {

namespace {

constexpr std::size_t kChecksumChunkSize = 1024 * 1024;

struct XxhStateDeleter {
    void operator()(XXH64_state_t* state) const noexcept { XXH64_freeState(state); }
};

}  // namespace

Checksum calculateXxHash64(std::span<const std::uint8_t> data, std::uint64_t seed) noexcept {
    return XXH64(data.data(), data.size(), seed);
}

Checksum fileChecksum(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw IOError("Failed to open file for checksum", ErrorContext(path.string()));
    }

    std::unique_ptr<XXH64_state_t, XxhStateDeleter> state(XXH64_createState());
    if (!state) {
        throw IOError("Failed to create xxHash64 state");
    }
    XXH64_reset(state.get(), 0);

    std::vector<char> buffer(kChecksumChunkSize);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto bytesRead = static_cast<std::size_t>(in.gcount());
        if (bytesRead > 0) {
            XXH64_update(state.get(), buffer.data(), bytesRead);
        }
    }
    if (in.bad()) {
        throw IOError("Failed to read file for checksum", ErrorContext(path.string()));
    }
    return XXH64_digest(state.get());
}

bool sameContent(const std::filesystem::path& lhs, const std::filesystem::path& rhs) {
    std::error_code ec;
    const auto lhsSize = std::filesystem::file_size(lhs, ec);
    if (ec) {
        return false;
    }
    const auto rhsSize = std::filesystem::file_size(rhs, ec);
    if (ec || lhsSize != rhsSize) {
        return false;
    }
    return fileChecksum(lhs) == fileChecksum(rhs);
}

}  // namespace refcache::io
