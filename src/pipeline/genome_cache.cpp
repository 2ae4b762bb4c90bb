// =============================================================================
// refcache - Genome Cache Implementation
// =============================================================================

#include "refcache/pipeline/genome_cache.h"

#include <stdlib.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <format>
#include <system_error>
#include <thread>

#include <nlohmann/json.hpp>

#include "refcache/common/logger.h"
#include "refcache/format/transcoder.h"
#include "refcache/index/annotation_sorter.h"
#include "refcache/io/atomic_file.h"
#include "refcache/io/checksum.h"
#include "refcache/io/file_lock.h"
#include "refcache/pipeline/catalog.h"

namespace refcache::pipeline {

namespace {

constexpr std::string_view kLockFileName = ".lock";
constexpr std::string_view kIndexLockFileName = ".index.lock";
constexpr std::string_view kRawDirName = "raw";
constexpr std::string_view kReadyDirName = "ready";
constexpr std::string_view kWorkDirPrefix = "work-";
constexpr std::string_view kRawSequenceName = "sequence.src";
constexpr std::string_view kRawAnnotationName = "annotation.src";

/// @brief Sleep granularity while waiting for the next watch pass.
constexpr std::chrono::seconds kWatchPollStep{1};

CacheConfig validatedConfig(CacheConfig config) {
    unwrapOrThrow(config.validate());
    return config;
}

void validateEntry(const CatalogEntry& entry) {
    const std::array<std::pair<std::string_view, std::string_view>, 3> components{{
        {"provider", entry.key.provider},
        {"species", entry.key.species},
        {"assembly", entry.key.assembly},
    }};
    for (const auto& [field, value] : components) {
        auto valid = validateKeyComponent(field, value);
        if (!valid) {
            throw ConfigError(valid.error().message(),
                              ErrorContext().withKey(entry.key.toString()));
        }
    }
    if (entry.sequenceUrl.empty()) {
        throw ConfigError("sequence_url must not be empty",
                          ErrorContext().withKey(entry.key.toString()));
    }
    if (entry.annotationUrl) {
        const auto format = index::requireGffAnnotation(*entry.annotationUrl, entry.annotationFormat);
        REFCACHE_LOG_DEBUG("{}: annotation is {}", entry.key.toString(),
                           index::annotationFormatName(format));
    }
}

bool allExist(std::initializer_list<std::string_view> paths) {
    return std::all_of(paths.begin(), paths.end(),
                       [](std::string_view p) { return std::filesystem::exists(p); });
}

io::LockOptions lockOptionsFrom(const CacheConfig& config) {
    io::LockOptions options;
    options.backoff = config.lockBackoff;
    if (config.lockTimeout) {
        options.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(*config.lockTimeout);
    }
    options.staleAfter = config.lockStaleAfter;
    return options;
}

void createCacheDirectories(const CacheConfig& config) {
    for (const auto& dir : {config.cacheRoot(), config.publishRoot()}) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw IOError("Failed to create cache directory", ec, ErrorContext(dir.string()));
        }
    }
}

/// @brief Run-private scratch directory, removed with its contents on destruction.
class WorkDir {
public:
    explicit WorkDir(const std::filesystem::path& parent) {
        std::string pattern = (parent / (std::string(kWorkDirPrefix) + "XXXXXX")).string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (::mkdtemp(buffer.data()) == nullptr) {
            throw IOError("Failed to create work directory",
                          std::error_code(errno, std::generic_category()),
                          ErrorContext(parent.string()));
        }
        path_ = buffer.data();
    }

    ~WorkDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            REFCACHE_LOG_WARNING("Failed to remove work directory {}: {}", path_.string(),
                                 ec.message());
        }
    }

    WorkDir(const WorkDir&) = delete;
    WorkDir& operator=(const WorkDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

/// @brief Remove scratch directories left behind by runs that died while holding the lock.
void removeAbandonedWorkDirs(const std::filesystem::path& root) {
    std::error_code ec;
    for (const auto& item : std::filesystem::directory_iterator(root, ec)) {
        const auto name = item.path().filename().string();
        if (item.is_directory() && name.starts_with(kWorkDirPrefix)) {
            std::error_code removeEc;
            std::filesystem::remove_all(item.path(), removeEc);
            if (removeEc) {
                REFCACHE_LOG_WARNING("Failed to remove abandoned work directory {}: {}",
                                     item.path().string(), removeEc.message());
            } else {
                REFCACHE_LOG_INFO("Removed abandoned work directory {}", item.path().string());
            }
        }
    }
}

std::filesystem::path withSuffix(const std::filesystem::path& path, std::string_view suffix) {
    return std::filesystem::path(path.string() + std::string(suffix));
}

std::optional<std::string> optionalString(const nlohmann::json& json, const char* field) {
    auto it = json.find(field);
    if (it == json.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

/// @brief Record the origin token a ready/ artifact was built from.
void writeBuiltFrom(const std::filesystem::path& artifact, const RevalidationToken& token) {
    nlohmann::json json;
    json["etag"] = token.etag ? nlohmann::json(*token.etag) : nlohmann::json(nullptr);
    json["last_modified"] =
        token.lastModified ? nlohmann::json(*token.lastModified) : nlohmann::json(nullptr);
    io::writeFileAtomic(withSuffix(artifact, kBuiltFromSuffix), json.dump() + "\n");
}

/// @brief Check that a ready/ artifact was built from the download `token` describes.
bool isBuiltFrom(const std::filesystem::path& artifact, const RevalidationToken& token) {
    auto text = io::readTrimmedFile(withSuffix(artifact, kBuiltFromSuffix));
    if (!text) {
        return false;
    }
    const auto json = nlohmann::json::parse(*text, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return false;
    }
    return RevalidationToken{optionalString(json, "etag"),
                             optionalString(json, "last_modified")} == token;
}

}  // namespace

// =============================================================================
// PassReport Implementation
// =============================================================================

std::size_t PassReport::publishedCount() const noexcept {
    return static_cast<std::size_t>(std::count_if(entries.begin(), entries.end(), [](const auto& e) {
        return e.outcome.has_value() && e.outcome->generationPublished;
    }));
}

std::size_t PassReport::unchangedCount() const noexcept {
    return static_cast<std::size_t>(std::count_if(entries.begin(), entries.end(), [](const auto& e) {
        return e.outcome.has_value() && !e.outcome->generationPublished;
    }));
}

std::size_t PassReport::failedCount() const noexcept {
    return static_cast<std::size_t>(std::count_if(
        entries.begin(), entries.end(), [](const auto& e) { return !e.outcome.has_value(); }));
}

// =============================================================================
// GenomeCache Construction
// =============================================================================

GenomeCache::GenomeCache(CacheConfig config, fetch::HttpTransport& transport,
                         std::unique_ptr<index::Indexer> indexer)
    : config_(validatedConfig(std::move(config))),
      transport_(transport),
      indexer_(std::move(indexer)),
      store_(config_.inventoryPath()),
      fetcher_(transport_),
      publisher_(config_.publishRoot()),
      indexWriter_(config_.aggregateIndexPath(), config_.publishRoot()) {
    if (!indexer_) {
        throw UsageError("GenomeCache requires an indexer");
    }
    createCacheDirectories(config_);
    REFCACHE_LOG_DEBUG("GenomeCache at {} (indexer: {})", config_.baseDir.string(),
                       indexer_->name());
}

GenomeCache::GenomeCache(CacheConfig config, std::unique_ptr<fetch::HttpTransport> transport,
                         std::unique_ptr<index::Indexer> indexer)
    : GenomeCache(std::move(config), *transport, std::move(indexer)) {
    ownedTransport_ = std::move(transport);
}

GenomeCache::~GenomeCache() = default;

std::unique_ptr<GenomeCache> GenomeCache::open(CacheConfig config) {
    fetch::CurlTransportOptions transportOptions;
    transportOptions.userAgent = config.userAgent;
    transportOptions.timeout = config.httpTimeout;

    auto transport = std::make_unique<fetch::CurlTransport>(std::move(transportOptions));
    auto indexer = index::createIndexer(config.indexer);
    return std::make_unique<GenomeCache>(std::move(config), std::move(transport),
                                         std::move(indexer));
}

// =============================================================================
// Queries
// =============================================================================

std::vector<GenomeRecord> GenomeCache::listPublished() const { return store_.listPublished(); }

std::vector<GenomeRecord> GenomeCache::listAll() const { return store_.listAll(); }

std::optional<ResolvedPaths> GenomeCache::getPaths(std::string_view provider,
                                                   std::string_view species,
                                                   const std::optional<std::string>& assembly) const {
    auto record = store_.findLatest(provider, species, assembly);
    if (!record) {
        return std::nullopt;
    }
    return ResolvedPaths{record->key, *record->published, record->publishedAt};
}

// =============================================================================
// Pipeline
// =============================================================================

GenomeCache::EntryPaths GenomeCache::entryPaths(const CatalogEntry& entry) const {
    EntryPaths paths;
    paths.root = config_.entryRoot(entry.key);
    paths.lock = paths.root / kLockFileName;
    paths.rawSequence = paths.root / kRawDirName / kRawSequenceName;
    paths.rawAnnotation = paths.root / kRawDirName / kRawAnnotationName;
    paths.ready = paths.root / kReadyDirName;

    const auto sequence = paths.ready / kSequenceFileName;
    paths.readySet.sequence = sequence.string();
    paths.readySet.sequenceFai = withSuffix(sequence, kFaiSuffix).string();
    paths.readySet.sequenceGzi = withSuffix(sequence, kGziSuffix).string();
    if (entry.annotationUrl) {
        const auto annotation = paths.ready / kAnnotationFileName;
        paths.readySet.annotation = annotation.string();
        paths.readySet.annotationIndex =
            index::annotationIndexPath(annotation, config_.annotationIndex).string();
    }
    return paths;
}

PublishedArtifacts GenomeCache::ensure(const CatalogEntry& entry) {
    return ensureDetailed(entry).artifacts;
}

EnsureOutcome GenomeCache::ensureDetailed(const CatalogEntry& entry) {
    PipelineStage stage = PipelineStage::kValidate;
    return ensureTracked(entry, stage);
}

EnsureOutcome GenomeCache::ensureTracked(const CatalogEntry& entry, PipelineStage& stage) {
    stage = PipelineStage::kValidate;
    const auto keyText = entry.key.toString();
    try {
        validateEntry(entry);

        auto upserted = store_.upsert(entry);
        if (upserted.sequenceUrlChanged || upserted.annotationUrlChanged) {
            REFCACHE_LOG_INFO("{}: source URL changed; stored validators will not be sent",
                              keyText);
        }

        EnsureOutcome outcome = runLocked(entry, entryPaths(entry), upserted.record, stage);

        if (outcome.generationPublished) {
            REFCACHE_LOG_INFO("{}: published ({} files, {} bytes fetched)", keyText,
                              outcome.filesPublished, outcome.bytesFetched);
        } else {
            REFCACHE_LOG_INFO("{}: up to date", keyText);
        }
        return outcome;
    } catch (const std::exception& e) {
        REFCACHE_LOG_ERROR("{}: {} failed: {}", keyText, pipelineStageToString(stage), e.what());
        throw;
    }
}

EnsureOutcome GenomeCache::runLocked(const CatalogEntry& entry, const EntryPaths& paths,
                                     const GenomeRecord& record, PipelineStage& stage) {
    // A lock wait that fails leaves the record to whoever holds the lock
    stage = PipelineStage::kLock;
    io::FileLock lock(paths.lock, lockOptionsFrom(config_));

    try {
        EnsureOutcome outcome = runStages(entry, paths, record, stage);
        stage = PipelineStage::kPublish;
        rewriteAggregateIndex();
        return outcome;
    } catch (const RefCacheException& e) {
        recordFailure(entry.key, stage, e.message());
        throw;
    } catch (const std::exception& e) {
        recordFailure(entry.key, stage, e.what());
        throw;
    }
}

EnsureOutcome GenomeCache::runStages(const CatalogEntry& entry, const EntryPaths& paths,
                                     const GenomeRecord& record, PipelineStage& stage) {
    removeAbandonedWorkDirs(paths.root);

    stage = PipelineStage::kFetch;
    store_.markFetching(entry.key);

    EnsureOutcome outcome;
    REFCACHE_LOG_DEBUG("{}: fetching sequence", entry.key.toString());
    const auto sequence = fetcher_.fetch(entry.sequenceUrl, paths.rawSequence);
    outcome.bytesFetched += sequence.bytes;

    std::optional<fetch::FetchResult> annotation;
    if (entry.annotationUrl) {
        REFCACHE_LOG_DEBUG("{}: fetching annotation", entry.key.toString());
        annotation = fetcher_.fetch(*entry.annotationUrl, paths.rawAnnotation);
        outcome.bytesFetched += annotation->bytes;
    }
    outcome.contentChanged = sequence.changed || (annotation && annotation->changed);

    // ready/ may predate the download when an earlier run failed after fetching
    const auto& ready = paths.readySet;
    const bool rebuildSequence =
        sequence.changed || !isBuiltFrom(ready.sequence, sequence.token) ||
        !allExist({ready.sequence, ready.sequenceFai, ready.sequenceGzi});
    const bool rebuildAnnotation =
        annotation && (annotation->changed || !isBuiltFrom(*ready.annotation, annotation->token) ||
                       !allExist({*ready.annotation, *ready.annotationIndex}));

    if (rebuildSequence || rebuildAnnotation) {
        std::optional<RevalidationToken> sequenceSource;
        std::optional<RevalidationToken> annotationSource;
        if (rebuildSequence) {
            sequenceSource = sequence.token;
        }
        if (rebuildAnnotation) {
            annotationSource = annotation->token;
        }
        rebuild(entry, paths, sequenceSource, annotationSource, stage);
        outcome.rebuilt = true;
    }

    stage = PipelineStage::kPublish;
    publish::PublishStats stats;
    outcome.artifacts = publisher_.publish(entry.key, ready, &stats);
    outcome.generationPublished = stats.generationCreated;
    outcome.filesPublished = stats.filesWritten;

    // Another holder may have published since the record was read before locking
    auto current = store_.find(entry.key);
    std::optional<Checksum> checksum = current ? current->sequenceChecksum : record.sequenceChecksum;
    if (stats.generationCreated || !checksum) {
        checksum = io::fileChecksum(outcome.artifacts.sequence);
    }

    store::PublishOutcome published;
    published.staged = ready;
    published.published = outcome.artifacts;
    published.sequenceToken = sequence.token;
    if (annotation) {
        published.annotationToken = annotation->token;
    }
    published.sequenceChecksum = checksum;
    store_.markPublished(entry.key, published);
    return outcome;
}

void GenomeCache::rebuild(const CatalogEntry& entry, const EntryPaths& paths,
                          const std::optional<RevalidationToken>& sequenceSource,
                          const std::optional<RevalidationToken>& annotationSource,
                          PipelineStage& stage) {
    std::error_code ec;
    std::filesystem::create_directories(paths.ready, ec);
    if (ec) {
        throw IOError("Failed to create ready directory", ec, ErrorContext(paths.ready.string()));
    }

    WorkDir work(paths.root);
    const auto builtSequence = work.path() / kSequenceFileName;
    const auto builtAnnotation = work.path() / kAnnotationFileName;
    index::SequenceIndexFiles sequenceIndex;
    std::filesystem::path annotationIndex;

    if (sequenceSource) {
        stage = PipelineStage::kTranscode;
        REFCACHE_LOG_DEBUG("{}: transcoding sequence", entry.key.toString());
        auto result = format::transcodeToBgzf(paths.rawSequence, builtSequence,
                                              config_.compressionLevel);
        REFCACHE_LOG_DEBUG("{}: sequence was {}, {} bytes", entry.key.toString(),
                           io::compressionFormatName(result.sourceFormat),
                           result.uncompressedBytes);

        stage = PipelineStage::kIndex;
        REFCACHE_LOG_DEBUG("{}: indexing sequence with {}", entry.key.toString(), indexer_->name());
        sequenceIndex = indexer_->indexSequence(builtSequence);
    }

    if (annotationSource) {
        stage = PipelineStage::kIndex;
        REFCACHE_LOG_DEBUG("{}: sorting annotation", entry.key.toString());
        auto stats = index::sortAnnotationFile(paths.rawAnnotation, builtAnnotation,
                                               config_.compressionLevel);
        REFCACHE_LOG_DEBUG("{}: annotation has {} headers, {} features", entry.key.toString(),
                           stats.headerLines, stats.featureLines);
        annotationIndex = indexer_->indexAnnotation(builtAnnotation, config_.annotationIndex);
    }

    // Clear the old set first so an interrupted promotion is seen as incomplete next run
    const auto& ready = paths.readySet;
    if (sequenceSource) {
        io::removeIfExists(withSuffix(ready.sequence, kBuiltFromSuffix));
        io::removeIfExists(ready.sequenceFai);
        io::removeIfExists(ready.sequenceGzi);
        io::removeIfExists(ready.sequence);
        io::renameAtomic(builtSequence, ready.sequence);
        io::renameAtomic(sequenceIndex.fai, ready.sequenceFai);
        io::renameAtomic(sequenceIndex.gzi, ready.sequenceGzi);
        writeBuiltFrom(ready.sequence, *sequenceSource);
    }
    if (annotationSource) {
        const std::filesystem::path readyAnnotation = *ready.annotation;
        io::removeIfExists(withSuffix(readyAnnotation, kBuiltFromSuffix));
        io::removeIfExists(withSuffix(readyAnnotation, kTbiSuffix));
        io::removeIfExists(withSuffix(readyAnnotation, kCsiSuffix));
        io::removeIfExists(readyAnnotation);
        io::renameAtomic(builtAnnotation, readyAnnotation);
        io::renameAtomic(annotationIndex, *ready.annotationIndex);
        writeBuiltFrom(readyAnnotation, *annotationSource);
    }
}

void GenomeCache::recordFailure(const GenomeKey& key, PipelineStage stage,
                                std::string_view message) {
    try {
        store_.markError(key, std::format("{}: {}", pipelineStageToString(stage), message));
    } catch (const RefCacheException& e) {
        // The original failure is rethrown by the caller; this one is only reported
        REFCACHE_LOG_ERROR("{}: could not record failure: {}", key.toString(), e.what());
    }
}

void GenomeCache::rewriteAggregateIndex() {
    io::FileLock lock(config_.publishRoot() / kIndexLockFileName, lockOptionsFrom(config_));
    indexWriter_.write(store_.listPublished());
}

// =============================================================================
// Catalog Passes
// =============================================================================

PassReport GenomeCache::runCatalogPass(const std::vector<CatalogEntry>& catalog) {
    PassReport report;
    report.entries.reserve(catalog.size());

    for (const auto& entry : catalog) {
        PipelineStage stage = PipelineStage::kValidate;
        EntryReport item{entry.key, tryExecute([&] { return ensureTracked(entry, stage); }),
                         std::nullopt};
        if (!item.outcome) {
            item.failedStage = stage;
        }
        report.entries.push_back(std::move(item));
    }

    REFCACHE_LOG_INFO("Catalog pass: {} published, {} unchanged, {} failed",
                      report.publishedCount(), report.unchangedCount(), report.failedCount());
    return report;
}

void GenomeCache::watch(const std::filesystem::path& catalogPath, std::chrono::seconds interval,
                        const std::function<bool()>& stopRequested,
                        const std::function<void(const PassReport&)>& onPass) {
    REFCACHE_LOG_INFO("Watching {} every {} s", catalogPath.string(), interval.count());
    while (!stopRequested()) {
        try {
            const auto catalog = loadCatalog(catalogPath);
            const auto report = runCatalogPass(catalog);
            if (onPass) {
                onPass(report);
            }
        } catch (const RefCacheException& e) {
            // A broken catalog skips this pass; the next one reloads it
            REFCACHE_LOG_ERROR("Catalog pass skipped: {}", e.what());
        }

        const auto deadline = std::chrono::steady_clock::now() + interval;
        while (!stopRequested() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(
                std::min<std::chrono::steady_clock::duration>(kWatchPollStep,
                                                              deadline - std::chrono::steady_clock::now()));
        }
    }
    REFCACHE_LOG_INFO("Watch stopped");
}

}  // namespace refcache::pipeline
