// =============================================================================
// refcache - Inventory Store
// =============================================================================
// Durable record of every genome the cache knows about (SQLite).
//
// The store is the single source of truth for "usable right now": a genome is
// usable exactly when its record carries a complete published artifact set.
// Each state transition is one transaction. A CHECK constraint forbids the
// `published` state without the published sequence triple, and rows read back
// are validated again so a database written by another tool cannot smuggle an
// incomplete record to readers.
//
// The database runs in WAL mode with a busy timeout so several processes can
// share it; each process opens its own connection.
// =============================================================================

#ifndef REFCACHE_STORE_INVENTORY_STORE_H
#define REFCACHE_STORE_INVENTORY_STORE_H

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "refcache/common/error.h"
#include "refcache/common/types.h"

// Forward declarations from sqlite3.h
struct sqlite3;
struct sqlite3_stmt;

namespace refcache::store {

/// @brief Outcome of InventoryStore::upsert().
struct UpsertResult {
    GenomeRecord record;

    /// @brief True when the record did not exist before.
    bool created = false;

    /// @brief True when an existing record's sequence URL was replaced.
    bool sequenceUrlChanged = false;

    /// @brief True when an existing record's annotation URL was replaced or removed.
    bool annotationUrlChanged = false;
};

/// @brief Tokens and checksum recorded on a successful publish.
struct PublishOutcome {
    StagedArtifacts staged;
    PublishedArtifacts published;
    RevalidationToken sequenceToken;
    RevalidationToken annotationToken;
    std::optional<Checksum> sequenceChecksum;
};

/// @brief SQLite-backed genome inventory.
///
/// Thread Safety:
/// - One InventoryStore must not be shared between threads
/// - Independent instances on the same file may be used concurrently
class InventoryStore {
public:
    /// @brief Open (and create if needed) the inventory database.
    /// @throws StoreError if the database cannot be opened or migrated.
    explicit InventoryStore(std::filesystem::path dbPath,
                            std::chrono::milliseconds busyTimeout = std::chrono::seconds(30));

    ~InventoryStore();

    InventoryStore(const InventoryStore&) = delete;
    InventoryStore& operator=(const InventoryStore&) = delete;
    InventoryStore(InventoryStore&&) = delete;
    InventoryStore& operator=(InventoryStore&&) = delete;

    /// @brief Create a `missing` record or update the URLs of an existing one.
    UpsertResult upsert(const CatalogEntry& entry);

    /// @brief Look up a record by its natural key.
    [[nodiscard]] std::optional<GenomeRecord> find(const GenomeKey& key) const;

    /// @brief Find a usable record.
    ///
    /// With an assembly this is find() restricted to usable records. Without
    /// one, the most recently published usable record for the
    /// provider/species pair is returned.
    [[nodiscard]] std::optional<GenomeRecord> findLatest(
        std::string_view provider, std::string_view species,
        const std::optional<std::string>& assembly = std::nullopt) const;

    /// @brief Transition to `fetching`. Published fields are not touched.
    void markFetching(const GenomeKey& key);

    /// @brief Transition to `published`, recording artifacts and tokens.
    /// @throws StoreInconsistency if `outcome.published` lacks the sequence triple.
    void markPublished(const GenomeKey& key, const PublishOutcome& outcome);

    /// @brief Transition to `error` with a message. Published fields are not touched.
    void markError(const GenomeKey& key, std::string_view message);

    /// @brief Every record with a complete published artifact set, ordered by key.
    [[nodiscard]] std::vector<GenomeRecord> listPublished() const;

    /// @brief Every record, ordered by key.
    [[nodiscard]] std::vector<GenomeRecord> listAll() const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return dbPath_; }

private:
    class Statement;
    class Transaction;

    void migrate();
    void exec(std::string_view sql) const;
    void requireChanged(const GenomeKey& key, std::string_view operation) const;
    [[nodiscard]] std::vector<GenomeRecord> query(std::string_view whereClause) const;
    [[nodiscard]] static GenomeRecord readRecord(Statement& stmt);
    [[noreturn]] void throwError(std::string_view what) const;

    std::filesystem::path dbPath_;
    sqlite3* db_ = nullptr;
};

}  // namespace refcache::store

#endif  // REFCACHE_STORE_INVENTORY_STORE_H
