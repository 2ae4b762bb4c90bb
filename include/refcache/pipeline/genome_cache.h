// =============================================================================
// refcache - Genome Cache
// =============================================================================
// Orchestrates one catalog entry through the preparation pipeline:
//
//   validate -> upsert record -> lock -> fetch -> transcode -> index
//            -> publish -> mark published -> rewrite aggregate index
//
// Work products are built in a run-private directory and promoted into the
// entry's `ready/` set by rename, then published as a new generation by the
// AtomicPublisher. Each ready/ artifact carries a `.source` sidecar naming the
// origin token it was built from; a download whose token differs is rebuilt
// even when the origin answers "not modified". A failure after the lock is
// taken marks the record `error` with "<stage>: <message>" and leaves the
// previously published artifacts alone.
//
// Directory layout under the base directory:
//   cache/{p}/{s}/{a}/.lock             per-entry lock
//   cache/{p}/{s}/{a}/raw/              downloads + .etag/.lastmod/.url sidecars
//   cache/{p}/{s}/{a}/ready/            last complete staged set + .source sidecars
//   cache/{p}/{s}/{a}/work-XXXXXX/      run-private scratch (removed after run)
//   publish/{p}/{s}/{a}/v<N>/           published generations
//   publish/{p}/{s}/{a}/current         link to the live generation
//   publish/index.json                  aggregate index
//   meta/inventory.sqlite               inventory store
// =============================================================================

#ifndef REFCACHE_PIPELINE_GENOME_CACHE_H
#define REFCACHE_PIPELINE_GENOME_CACHE_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "refcache/common/config.h"
#include "refcache/common/error.h"
#include "refcache/common/types.h"
#include "refcache/fetch/content_fetcher.h"
#include "refcache/index/indexer.h"
#include "refcache/publish/publisher.h"
#include "refcache/store/inventory_store.h"

namespace refcache::pipeline {

// =============================================================================
// Outcome Types
// =============================================================================

/// @brief Result of ensuring one entry.
struct EnsureOutcome {
    PublishedArtifacts artifacts;

    /// @brief True when new origin content was downloaded.
    bool contentChanged = false;

    /// @brief True when transcoding and indexing ran.
    bool rebuilt = false;

    /// @brief True when a new published generation went live.
    bool generationPublished = false;

    /// @brief Files copied into the new generation.
    std::size_t filesPublished = 0;

    /// @brief Body bytes downloaded (sequence + annotation).
    std::uint64_t bytesFetched = 0;
};

/// @brief Outcome of one entry in a catalog pass.
struct EntryReport {
    GenomeKey key;
    Result<EnsureOutcome> outcome;

    /// @brief Stage that failed (set only on failure).
    std::optional<PipelineStage> failedStage;
};

/// @brief Outcome of a whole catalog pass.
struct PassReport {
    std::vector<EntryReport> entries;

    /// @brief Entries for which a new generation went live.
    [[nodiscard]] std::size_t publishedCount() const noexcept;

    /// @brief Entries that succeeded with the live generation unchanged.
    [[nodiscard]] std::size_t unchangedCount() const noexcept;

    [[nodiscard]] std::size_t failedCount() const noexcept;

    [[nodiscard]] bool allSucceeded() const noexcept { return failedCount() == 0; }
};

/// @brief Published paths resolved for a consumer.
struct ResolvedPaths {
    GenomeKey key;
    PublishedArtifacts artifacts;
    UnixSeconds publishedAt = 0;
};

// =============================================================================
// GenomeCache
// =============================================================================

/// @brief Reference-genome acquisition and preparation cache.
///
/// Thread Safety:
/// - A GenomeCache instance is used by one thread at a time
/// - Instances in different threads or processes sharing a base directory
///   coordinate through the per-entry lock and the inventory database
class GenomeCache {
public:
    /// @brief Create a cache with an injected transport and indexer.
    /// @param transport Must outlive the cache.
    /// @throws ConfigError if the configuration is invalid.
    /// @throws StoreError if the inventory cannot be opened.
    GenomeCache(CacheConfig config, fetch::HttpTransport& transport,
                std::unique_ptr<index::Indexer> indexer);

    /// @brief Create a cache owning its transport.
    GenomeCache(CacheConfig config, std::unique_ptr<fetch::HttpTransport> transport,
                std::unique_ptr<index::Indexer> indexer);

    /// @brief Create a production cache (libcurl transport, configured indexer).
    [[nodiscard]] static std::unique_ptr<GenomeCache> open(CacheConfig config);

    ~GenomeCache();

    GenomeCache(const GenomeCache&) = delete;
    GenomeCache& operator=(const GenomeCache&) = delete;

    /// @brief Ensure an entry is fetched, prepared and published.
    /// @return Published artifact paths.
    /// @throws RefCacheException subclasses describing the failing stage.
    PublishedArtifacts ensure(const CatalogEntry& entry);

    /// @brief ensure() with transfer and rebuild details.
    EnsureOutcome ensureDetailed(const CatalogEntry& entry);

    /// @brief Records with a complete published set, ordered by key.
    [[nodiscard]] std::vector<GenomeRecord> listPublished() const;

    /// @brief Every record, ordered by key.
    [[nodiscard]] std::vector<GenomeRecord> listAll() const;

    /// @brief Resolve published paths; the latest published assembly when none is given.
    [[nodiscard]] std::optional<ResolvedPaths> getPaths(
        std::string_view provider, std::string_view species,
        const std::optional<std::string>& assembly = std::nullopt) const;

    /// @brief Ensure every entry; one entry's failure does not stop the others.
    PassReport runCatalogPass(const std::vector<CatalogEntry>& catalog);

    /// @brief Reload the catalog and run a pass every `interval` until stopped.
    /// @param stopRequested Polled between passes and while sleeping.
    /// @param onPass Called with each pass report.
    void watch(const std::filesystem::path& catalogPath, std::chrono::seconds interval,
               const std::function<bool()>& stopRequested,
               const std::function<void(const PassReport&)>& onPass);

    /// @brief Rewrite publish/index.json from the inventory.
    void rewriteAggregateIndex();

    [[nodiscard]] const CacheConfig& config() const noexcept { return config_; }

    [[nodiscard]] const index::Indexer& indexer() const noexcept { return *indexer_; }

private:
    /// @brief Paths of one entry's cache directory.
    struct EntryPaths {
        std::filesystem::path root;
        std::filesystem::path lock;
        std::filesystem::path rawSequence;
        std::filesystem::path rawAnnotation;
        std::filesystem::path ready;
        StagedArtifacts readySet;
    };

    [[nodiscard]] EntryPaths entryPaths(const CatalogEntry& entry) const;

    /// @brief ensureDetailed() reporting the stage reached through `stage`.
    EnsureOutcome ensureTracked(const CatalogEntry& entry, PipelineStage& stage);

    /// @brief Take the entry lock, run the stages and record failures while holding it.
    EnsureOutcome runLocked(const CatalogEntry& entry, const EntryPaths& paths,
                            const GenomeRecord& record, PipelineStage& stage);

    /// @brief Fetch through the inventory update; the caller holds the entry lock.
    EnsureOutcome runStages(const CatalogEntry& entry, const EntryPaths& paths,
                            const GenomeRecord& record, PipelineStage& stage);

    /// @brief Transcode/sort and index into a work directory, then promote into ready/.
    /// @param sequenceSource Origin token of the sequence download to rebuild from, if any.
    /// @param annotationSource Origin token of the annotation download to rebuild from, if any.
    void rebuild(const CatalogEntry& entry, const EntryPaths& paths,
                 const std::optional<RevalidationToken>& sequenceSource,
                 const std::optional<RevalidationToken>& annotationSource, PipelineStage& stage);

    void recordFailure(const GenomeKey& key, PipelineStage stage, std::string_view message);

    CacheConfig config_;
    std::unique_ptr<fetch::HttpTransport> ownedTransport_;
    fetch::HttpTransport& transport_;
    std::unique_ptr<index::Indexer> indexer_;
    store::InventoryStore store_;
    fetch::ContentFetcher fetcher_;
    publish::AtomicPublisher publisher_;
    publish::AggregateIndexWriter indexWriter_;
};

}  // namespace refcache::pipeline

#endif  // REFCACHE_PIPELINE_GENOME_CACHE_H
