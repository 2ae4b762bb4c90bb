// =============================================================================
// refcache - Content Checksums
// =============================================================================
// xxHash64 over whole files, used to detect unchanged artifacts at publish
// time and recorded in the aggregate index.
// =============================================================================

#ifndef REFCACHE_IO_CHECKSUM_H
#define REFCACHE_IO_CHECKSUM_H

#include <cstdint>
#include <filesystem>
#include <span>

#include "refcache/common/types.h"

namespace refcache::io {

/// @brief xxHash64 of a memory range.
[[nodiscard]] Checksum calculateXxHash64(std::span<const std::uint8_t> data,
                                         std::uint64_t seed = 0) noexcept;

/// @brief xxHash64 of a file's full content, streamed in fixed-size chunks.
/// @throws IOError if the file cannot be read.
[[nodiscard]] Checksum fileChecksum(const std::filesystem::path& path);

/// @brief Check whether two files hold identical bytes (size, then checksum).
/// @return false if either file is missing.
[[nodiscard]] bool sameContent(const std::filesystem::path& lhs, const std::filesystem::path& rhs);

}  // namespace refcache::io

#endif  // REFCACHE_IO_CHECKSUM_H
