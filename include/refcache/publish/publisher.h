// =============================================================================
// refcache - Atomic Publisher
// =============================================================================
// Promotes staged artifacts into the public tree.
//
// Each published set lives in its own generation directory and a `current`
// symlink selects the live one:
//
//   publish/{p}/{s}/{a}/current -> v3
//   publish/{p}/{s}/{a}/v2/        generation replaced by the last publish
//   publish/{p}/{s}/{a}/v3/        live generation
//
// A publish fills `v<N>.part-<pid>-<n>/` (files whose bytes match the live
// generation are hard-linked, the rest copied and fsync'd), renames it to
// `v<N>/`, then renames a fresh symlink over `current`. Published paths name
// the generation directory itself, so a reader resolving them through
// index.json sees the whole old set or the whole new one. A failure before
// the symlink swap removes the partial generation and leaves the live one as
// it was. The replaced generation is kept for readers that resolved paths
// before the switch; older ones are pruned.
//
// A staged set whose bytes match the live generation (size + XXH64) is not
// republished, so an unchanged set is a no-op on disk. Publishes of one key
// must be serialized by the caller.
//
// AggregateIndexWriter renders `publish/index.json` for consumers that only
// read the filesystem.
// =============================================================================

#ifndef REFCACHE_PUBLISH_PUBLISHER_H
#define REFCACHE_PUBLISH_PUBLISHER_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "refcache/common/error.h"
#include "refcache/common/types.h"

namespace refcache::publish {

/// @brief Counters from one publish.
struct PublishStats {
    /// @brief Files copied from the staged set.
    std::size_t filesWritten = 0;

    /// @brief Files whose bytes matched the live generation.
    std::size_t filesUnchanged = 0;

    /// @brief True when a new generation went live.
    bool generationCreated = false;

    /// @brief Live generation after the publish.
    std::uint64_t generation = 0;

    /// @brief Superseded generations deleted.
    std::size_t generationsRemoved = 0;
};

/// @brief Generational promoter from `ready/` into `publish/`.
class AtomicPublisher {
public:
    explicit AtomicPublisher(std::filesystem::path publishRoot)
        : publishRoot_(std::move(publishRoot)) {}

    /// @brief Publish a staged set under publish/{provider}/{species}/{assembly}/.
    /// @param stats Optional counters.
    /// @return Paths of the published artifacts inside the live generation.
    /// @throws IOError if any copy, rename or link fails; the live generation
    ///         is unchanged in that case.
    PublishedArtifacts publish(const GenomeKey& key, const StagedArtifacts& staged,
                               PublishStats* stats = nullptr);

    /// @brief Publish directory of a genome (parent of its generations).
    [[nodiscard]] std::filesystem::path destinationDir(const GenomeKey& key) const;

    /// @brief Directory of the live generation, resolved from the `current` link.
    [[nodiscard]] std::optional<std::filesystem::path> currentGeneration(
        const GenomeKey& key) const;

    /// @brief Directory name of a generation ("v<N>").
    [[nodiscard]] static std::string generationName(std::uint64_t generation);

private:
    std::filesystem::path publishRoot_;
};

/// @brief Writer of the aggregate `index.json`.
class AggregateIndexWriter {
public:
    /// @brief Current index format version.
    static constexpr int kVersion = 1;

    AggregateIndexWriter(std::filesystem::path indexPath, std::filesystem::path publishRoot)
        : indexPath_(std::move(indexPath)), publishRoot_(std::move(publishRoot)) {}

    /// @brief Render and atomically replace the index.
    /// @param records Usable records; others are skipped.
    /// @throws IOError on write failure.
    void write(const std::vector<GenomeRecord>& records) const;

    /// @brief Build the JSON document.
    [[nodiscard]] nlohmann::json render(const std::vector<GenomeRecord>& records,
                                        UnixSeconds generatedAt) const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return indexPath_; }

private:
    std::filesystem::path indexPath_;
    std::filesystem::path publishRoot_;
};

/// @brief Render a record's published paths as JSON (shared with the CLI).
[[nodiscard]] nlohmann::json artifactsToJson(const PublishedArtifacts& artifacts);

/// @brief Format a Unix timestamp as ISO-8601 UTC ("2024-01-31T12:00:00Z").
[[nodiscard]] std::string formatTimestamp(UnixSeconds seconds);

/// @brief Format a checksum as 16 lowercase hex digits.
[[nodiscard]] std::string formatChecksum(Checksum checksum);

}  // namespace refcache::publish

#endif  // REFCACHE_PUBLISH_PUBLISHER_H
