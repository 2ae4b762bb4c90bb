// =============================================================================
// refcache - Cache Configuration
// =============================================================================
// Runtime configuration of one cache instance.
//
// All settings are explicit and passed into GenomeCache at construction; the
// CLI fills them from flags and environment variables.
//
// Directory layout under `baseDir`:
//   cache/{provider}/{species}/{assembly}/raw/     downloaded sources + sidecars
//   cache/{provider}/{species}/{assembly}/ready/   staged BGZF artifacts + indexes
//   cache/{provider}/{species}/{assembly}/.lock    per-entry lock file
//   publish/{provider}/{species}/{assembly}/       published artifacts
//   publish/index.json                             aggregate index
//   meta/inventory.sqlite                          inventory store
// =============================================================================

#ifndef REFCACHE_COMMON_CONFIG_H
#define REFCACHE_COMMON_CONFIG_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "refcache/common/error.h"
#include "refcache/common/types.h"

namespace refcache {

// =============================================================================
// Enumerations
// =============================================================================

/// @brief Indexer implementation, chosen once at startup.
enum class IndexerBackend : std::uint8_t {
    /// @brief In-process indexing through htslib.
    kHtslib = 0,

    /// @brief samtools / tabix subprocesses.
    kExternalTools = 1
};

/// @brief Kind of range index built for annotations.
enum class AnnotationIndexKind : std::uint8_t {
    /// @brief Tabix index (coordinates up to 2^29).
    kTbi = 0,

    /// @brief Coordinate-sorted index for larger chromosomes.
    kCsi = 1
};

[[nodiscard]] std::string_view indexerBackendToString(IndexerBackend backend) noexcept;
[[nodiscard]] std::optional<IndexerBackend> indexerBackendFromString(std::string_view value) noexcept;

[[nodiscard]] std::string_view annotationIndexKindToString(AnnotationIndexKind kind) noexcept;
[[nodiscard]] std::optional<AnnotationIndexKind> annotationIndexKindFromString(
    std::string_view value) noexcept;

// =============================================================================
// CacheConfig
// =============================================================================

/// @brief Configuration for one cache instance.
struct CacheConfig {
    /// @brief Root directory of the cache.
    std::filesystem::path baseDir = "/data/genome_cache";

    /// @brief User-Agent header sent with every request.
    std::string userAgent = "refcache/1.0";

    /// @brief Whole-transfer timeout for one download.
    std::chrono::seconds httpTimeout{600};

    /// @brief Fixed backoff between lock acquisition attempts.
    std::chrono::milliseconds lockBackoff{200};

    /// @brief Upper bound on the lock wait; unbounded when empty.
    std::optional<std::chrono::seconds> lockTimeout;

    /// @brief Lease after which a lock left by a dead holder may be reclaimed.
    /// @note Disabled when empty: a stale lock must be removed by hand.
    std::optional<std::chrono::seconds> lockStaleAfter;

    /// @brief BGZF compression level (1-9).
    int compressionLevel = kDefaultCompressionLevel;

    /// @brief Indexer implementation.
    IndexerBackend indexer = IndexerBackend::kHtslib;

    /// @brief Range index kind for annotations.
    AnnotationIndexKind annotationIndex = AnnotationIndexKind::kTbi;

    /// @brief Delay between catalog passes in watch mode.
    std::chrono::seconds refreshInterval{86400};

    // =========================================================================
    // Derived Paths
    // =========================================================================

    [[nodiscard]] std::filesystem::path cacheRoot() const { return baseDir / "cache"; }
    [[nodiscard]] std::filesystem::path publishRoot() const { return baseDir / "publish"; }
    [[nodiscard]] std::filesystem::path metaRoot() const { return baseDir / "meta"; }
    [[nodiscard]] std::filesystem::path inventoryPath() const {
        return metaRoot() / "inventory.sqlite";
    }
    [[nodiscard]] std::filesystem::path aggregateIndexPath() const {
        return publishRoot() / "index.json";
    }
    [[nodiscard]] std::filesystem::path defaultCatalogPath() const {
        return baseDir / "sources.yaml";
    }

    /// @brief Per-entry working directory under cache/.
    [[nodiscard]] std::filesystem::path entryRoot(const GenomeKey& key) const {
        return cacheRoot() / key.provider / key.species / key.assembly;
    }

    /// @brief Per-entry directory in the public tree.
    [[nodiscard]] std::filesystem::path publishDir(const GenomeKey& key) const {
        return publishRoot() / key.provider / key.species / key.assembly;
    }

    /// @brief Validate value ranges.
    [[nodiscard]] VoidResult validate() const;
};

/// @brief Validate one component of a natural key for use as a directory name.
/// @return Error when empty, "." / "..", or containing a path separator.
[[nodiscard]] VoidResult validateKeyComponent(std::string_view field, std::string_view value);

}  // namespace refcache

#endif  // REFCACHE_COMMON_CONFIG_H
