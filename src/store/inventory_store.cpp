// =============================================================================
// refcache - Inventory Store Implementation
// =============================================================================

#include "refcache/store/inventory_store.h"

#include <sqlite3.h>

#include <format>
#include <system_error>

#include "refcache/common/logger.h"

namespace refcache::store {

namespace {

/// @brief Schema version stored in PRAGMA user_version.
constexpr int kSchemaVersion = 1;

constexpr std::string_view kSchema = R"sql(
CREATE TABLE IF NOT EXISTS genomes (
    id                          INTEGER PRIMARY KEY AUTOINCREMENT,
    provider                    TEXT NOT NULL,
    species                     TEXT NOT NULL,
    assembly                    TEXT NOT NULL,
    sequence_url                TEXT NOT NULL,
    annotation_url              TEXT,
    state                       TEXT NOT NULL DEFAULT 'missing'
        CHECK (state IN ('missing', 'fetching', 'published', 'error')),
    last_error                  TEXT,
    staged_sequence             TEXT,
    staged_sequence_fai         TEXT,
    staged_sequence_gzi         TEXT,
    staged_annotation           TEXT,
    staged_annotation_index     TEXT,
    published_sequence          TEXT,
    published_sequence_fai      TEXT,
    published_sequence_gzi      TEXT,
    published_annotation        TEXT,
    published_annotation_index  TEXT,
    sequence_etag               TEXT,
    sequence_lastmod            TEXT,
    annotation_etag             TEXT,
    annotation_lastmod          TEXT,
    sequence_checksum           INTEGER,
    created_at                  INTEGER NOT NULL,
    updated_at                  INTEGER NOT NULL,
    published_at                INTEGER NOT NULL DEFAULT 0,
    UNIQUE (provider, species, assembly),
    CHECK (state <> 'published' OR (published_sequence IS NOT NULL
                                    AND published_sequence_fai IS NOT NULL
                                    AND published_sequence_gzi IS NOT NULL))
);
)sql";

constexpr std::string_view kColumns =
    "provider, species, assembly, sequence_url, annotation_url, state, last_error, "
    "staged_sequence, staged_sequence_fai, staged_sequence_gzi, staged_annotation, "
    "staged_annotation_index, published_sequence, published_sequence_fai, "
    "published_sequence_gzi, published_annotation, published_annotation_index, "
    "sequence_etag, sequence_lastmod, annotation_etag, annotation_lastmod, "
    "sequence_checksum, updated_at, published_at";

constexpr std::string_view kUsableClause =
    "published_sequence IS NOT NULL AND published_sequence_fai IS NOT NULL "
    "AND published_sequence_gzi IS NOT NULL";

constexpr std::string_view kKeyOrder = " ORDER BY provider, species, assembly";

UnixSeconds nowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace

// =============================================================================
// Statement (RAII prepared statement)
// =============================================================================

class InventoryStore::Statement {
public:
    Statement(sqlite3* db, std::string_view sql) : db_(db) {
        int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt_, nullptr);
        if (rc != SQLITE_OK) {
            throw StoreError(std::format("Failed to prepare statement: {}", sqlite3_errmsg(db_)));
        }
    }

    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, std::string_view value) {
        check(sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                                SQLITE_TRANSIENT));
    }

    void bind(int index, const std::string& value) { bind(index, std::string_view(value)); }

    void bind(int index, const std::optional<std::string>& value) {
        if (value) {
            bind(index, std::string_view(*value));
        } else {
            check(sqlite3_bind_null(stmt_, index));
        }
    }

    void bind(int index, std::int64_t value) { check(sqlite3_bind_int64(stmt_, index, value)); }

    void bindChecksum(int index, const std::optional<Checksum>& value) {
        if (value) {
            // Stored bit-for-bit in a signed 64-bit column
            bind(index, static_cast<std::int64_t>(*value));
        } else {
            check(sqlite3_bind_null(stmt_, index));
        }
    }

    /// @return true while rows are available.
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        if (rc == SQLITE_CONSTRAINT) {
            throw StoreInconsistency(std::format("Constraint violated: {}", sqlite3_errmsg(db_)));
        }
        throw StoreError(std::format("Statement failed: {}", sqlite3_errmsg(db_)));
    }

    [[nodiscard]] std::optional<std::string> text(int column) const {
        if (sqlite3_column_type(stmt_, column) == SQLITE_NULL) {
            return std::nullopt;
        }
        const auto* data = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, column));
        const int size = sqlite3_column_bytes(stmt_, column);
        return std::string(data, static_cast<std::size_t>(size));
    }

    [[nodiscard]] std::string requiredText(int column) const {
        return text(column).value_or(std::string());
    }

    [[nodiscard]] std::optional<std::int64_t> int64(int column) const {
        if (sqlite3_column_type(stmt_, column) == SQLITE_NULL) {
            return std::nullopt;
        }
        return sqlite3_column_int64(stmt_, column);
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw StoreError(std::format("Failed to bind parameter: {}", sqlite3_errmsg(db_)));
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

// =============================================================================
// Transaction (RAII, rolls back unless committed)
// =============================================================================

class InventoryStore::Transaction {
public:
    explicit Transaction(const InventoryStore& store) : store_(store) {
        store_.exec("BEGIN IMMEDIATE");
    }

    ~Transaction() {
        if (!committed_) {
            char* errmsg = nullptr;
            if (sqlite3_exec(store_.db_, "ROLLBACK", nullptr, nullptr, &errmsg) != SQLITE_OK) {
                REFCACHE_LOG_ERROR("Rollback failed: {}", errmsg != nullptr ? errmsg : "unknown");
            }
            sqlite3_free(errmsg);
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        store_.exec("COMMIT");
        committed_ = true;
    }

private:
    const InventoryStore& store_;
    bool committed_ = false;
};

// =============================================================================
// InventoryStore Implementation
// =============================================================================

InventoryStore::InventoryStore(std::filesystem::path dbPath, std::chrono::milliseconds busyTimeout)
    : dbPath_(std::move(dbPath)) {
    std::error_code ec;
    if (dbPath_.has_parent_path()) {
        std::filesystem::create_directories(dbPath_.parent_path(), ec);
        if (ec) {
            throw IOError("Failed to create inventory directory", ec,
                          ErrorContext(dbPath_.parent_path().string()));
        }
    }

    int rc = sqlite3_open_v2(dbPath_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db_ != nullptr ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError(std::format("Failed to open inventory: {}", message),
                         ErrorContext(dbPath_.string()));
    }

    try {
        if (sqlite3_busy_timeout(db_, static_cast<int>(busyTimeout.count())) != SQLITE_OK) {
            throwError("Failed to set busy timeout");
        }
        exec("PRAGMA journal_mode=WAL");
        exec("PRAGMA synchronous=NORMAL");
        migrate();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }

    REFCACHE_LOG_DEBUG("Inventory opened: {}", dbPath_.string());
}

InventoryStore::~InventoryStore() {
    if (db_ != nullptr) {
        sqlite3_close(db_);
    }
}

void InventoryStore::throwError(std::string_view what) const {
    throw StoreError(std::format("{}: {}", what, sqlite3_errmsg(db_)),
                     ErrorContext(dbPath_.string()));
}

void InventoryStore::exec(std::string_view sql) const {
    std::string statement(sql);
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, statement.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string message = errmsg != nullptr ? errmsg : sqlite3_errstr(rc);
        sqlite3_free(errmsg);
        throw StoreError(std::format("'{}' failed: {}", statement.substr(0, 40), message),
                         ErrorContext(dbPath_.string()));
    }
}

void InventoryStore::migrate() {
    Statement version(db_, "PRAGMA user_version");
    int current = 0;
    if (version.step()) {
        current = static_cast<int>(version.int64(0).value_or(0));
    }
    if (current > kSchemaVersion) {
        throw StoreError(std::format("Inventory schema version {} is newer than supported {}",
                                     current, kSchemaVersion),
                         ErrorContext(dbPath_.string()));
    }
    if (current == kSchemaVersion) {
        return;
    }

    Transaction tx(*this);
    exec(kSchema);
    exec(std::format("PRAGMA user_version = {}", kSchemaVersion));
    tx.commit();
    REFCACHE_LOG_DEBUG("Inventory schema initialized at version {}", kSchemaVersion);
}

void InventoryStore::requireChanged(const GenomeKey& key, std::string_view operation) const {
    if (sqlite3_changes(db_) == 0) {
        throw StoreError(std::format("{}: no record for {}", operation, key.toString()),
                         ErrorContext(dbPath_.string()).withKey(key.toString()));
    }
}

GenomeRecord InventoryStore::readRecord(Statement& stmt) {
    GenomeRecord record;
    record.key = GenomeKey{stmt.requiredText(0), stmt.requiredText(1), stmt.requiredText(2)};
    record.sequenceUrl = stmt.requiredText(3);
    record.annotationUrl = stmt.text(4);

    const auto stateText = stmt.requiredText(5);
    const auto state = recordStateFromString(stateText);
    if (!state) {
        throw StoreInconsistency(std::format("Unknown state '{}'", stateText),
                                 ErrorContext().withKey(record.key.toString()));
    }
    record.state = *state;
    record.lastError = stmt.text(6);

    auto readSet = [&stmt](int first) -> std::optional<ArtifactSet> {
        if (!stmt.text(first)) {
            return std::nullopt;
        }
        ArtifactSet set;
        set.sequence = stmt.requiredText(first);
        set.sequenceFai = stmt.requiredText(first + 1);
        set.sequenceGzi = stmt.requiredText(first + 2);
        set.annotation = stmt.text(first + 3);
        set.annotationIndex = stmt.text(first + 4);
        return set;
    };
    record.staged = readSet(7);
    record.published = readSet(12);

    record.sequenceToken = RevalidationToken{stmt.text(17), stmt.text(18)};
    record.annotationToken = RevalidationToken{stmt.text(19), stmt.text(20)};
    if (auto checksum = stmt.int64(21)) {
        record.sequenceChecksum = static_cast<Checksum>(*checksum);
    }
    record.updatedAt = stmt.int64(22).value_or(0);
    record.publishedAt = stmt.int64(23).value_or(0);

    if (record.state == RecordState::kPublished && !record.isUsable()) {
        throw StoreInconsistency("Record is published without a complete sequence artifact set",
                                 ErrorContext().withKey(record.key.toString()));
    }
    if (record.published &&
        record.published->annotation.has_value() != record.published->annotationIndex.has_value()) {
        throw StoreInconsistency("Published annotation is missing its range index",
                                 ErrorContext().withKey(record.key.toString()));
    }
    return record;
}

std::vector<GenomeRecord> InventoryStore::query(std::string_view whereClause) const {
    Statement stmt(db_, std::format("SELECT {} FROM genomes {}{}", kColumns, whereClause, kKeyOrder));
    std::vector<GenomeRecord> records;
    while (stmt.step()) {
        records.push_back(readRecord(stmt));
    }
    return records;
}

UpsertResult InventoryStore::upsert(const CatalogEntry& entry) {
    Transaction tx(*this);

    UpsertResult result;
    auto existing = find(entry.key);
    const auto now = nowSeconds();

    if (!existing) {
        Statement insert(db_,
                         "INSERT INTO genomes (provider, species, assembly, sequence_url, "
                         "annotation_url, state, created_at, updated_at) "
                         "VALUES (?1, ?2, ?3, ?4, ?5, 'missing', ?6, ?6)");
        insert.bind(1, entry.key.provider);
        insert.bind(2, entry.key.species);
        insert.bind(3, entry.key.assembly);
        insert.bind(4, entry.sequenceUrl);
        insert.bind(5, entry.annotationUrl);
        insert.bind(6, now);
        insert.step();
        result.created = true;
        REFCACHE_LOG_DEBUG("Inventory: new record {}", entry.key.toString());
    } else {
        result.sequenceUrlChanged = existing->sequenceUrl != entry.sequenceUrl;
        result.annotationUrlChanged = existing->annotationUrl != entry.annotationUrl;
        if (result.sequenceUrlChanged || result.annotationUrlChanged) {
            Statement update(db_,
                             "UPDATE genomes SET sequence_url = ?4, annotation_url = ?5 "
                             "WHERE provider = ?1 AND species = ?2 AND assembly = ?3");
            update.bind(1, entry.key.provider);
            update.bind(2, entry.key.species);
            update.bind(3, entry.key.assembly);
            update.bind(4, entry.sequenceUrl);
            update.bind(5, entry.annotationUrl);
            update.step();
            REFCACHE_LOG_INFO("Inventory: source URLs of {} changed", entry.key.toString());
        }
    }

    auto record = find(entry.key);
    if (!record) {
        throw StoreInconsistency("Record vanished during upsert",
                                 ErrorContext(dbPath_.string()).withKey(entry.key.toString()));
    }
    tx.commit();

    result.record = std::move(*record);
    return result;
}

std::optional<GenomeRecord> InventoryStore::find(const GenomeKey& key) const {
    Statement stmt(db_, std::format("SELECT {} FROM genomes "
                                    "WHERE provider = ?1 AND species = ?2 AND assembly = ?3",
                                    kColumns));
    stmt.bind(1, key.provider);
    stmt.bind(2, key.species);
    stmt.bind(3, key.assembly);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return readRecord(stmt);
}

std::optional<GenomeRecord> InventoryStore::findLatest(
    std::string_view provider, std::string_view species,
    const std::optional<std::string>& assembly) const {
    std::string sql = std::format("SELECT {} FROM genomes WHERE provider = ?1 AND species = ?2 "
                                  "AND {}",
                                  kColumns, kUsableClause);
    if (assembly) {
        sql += " AND assembly = ?3";
    }
    sql += " ORDER BY published_at DESC, updated_at DESC, id DESC LIMIT 1";

    Statement stmt(db_, sql);
    stmt.bind(1, provider);
    stmt.bind(2, species);
    if (assembly) {
        stmt.bind(3, std::string_view(*assembly));
    }
    if (!stmt.step()) {
        return std::nullopt;
    }
    return readRecord(stmt);
}

void InventoryStore::markFetching(const GenomeKey& key) {
    Transaction tx(*this);
    Statement stmt(db_,
                   "UPDATE genomes SET state = 'fetching', updated_at = ?4 "
                   "WHERE provider = ?1 AND species = ?2 AND assembly = ?3");
    stmt.bind(1, key.provider);
    stmt.bind(2, key.species);
    stmt.bind(3, key.assembly);
    stmt.bind(4, nowSeconds());
    stmt.step();
    requireChanged(key, "markFetching");
    tx.commit();
}

void InventoryStore::markPublished(const GenomeKey& key, const PublishOutcome& outcome) {
    if (!outcome.published.hasSequence()) {
        throw StoreInconsistency("Refusing to publish without the sequence artifact set",
                                 ErrorContext().withKey(key.toString()));
    }
    if (outcome.published.annotation.has_value() !=
        outcome.published.annotationIndex.has_value()) {
        throw StoreInconsistency("Refusing to publish an annotation without its index",
                                 ErrorContext().withKey(key.toString()));
    }

    Transaction tx(*this);
    Statement stmt(db_,
                   "UPDATE genomes SET state = 'published', last_error = NULL, "
                   "staged_sequence = ?4, staged_sequence_fai = ?5, staged_sequence_gzi = ?6, "
                   "staged_annotation = ?7, staged_annotation_index = ?8, "
                   "published_sequence = ?9, published_sequence_fai = ?10, "
                   "published_sequence_gzi = ?11, published_annotation = ?12, "
                   "published_annotation_index = ?13, "
                   "sequence_etag = ?14, sequence_lastmod = ?15, "
                   "annotation_etag = ?16, annotation_lastmod = ?17, "
                   "sequence_checksum = ?18, updated_at = ?19, published_at = ?19 "
                   "WHERE provider = ?1 AND species = ?2 AND assembly = ?3");
    stmt.bind(1, key.provider);
    stmt.bind(2, key.species);
    stmt.bind(3, key.assembly);
    stmt.bind(4, outcome.staged.sequence);
    stmt.bind(5, outcome.staged.sequenceFai);
    stmt.bind(6, outcome.staged.sequenceGzi);
    stmt.bind(7, outcome.staged.annotation);
    stmt.bind(8, outcome.staged.annotationIndex);
    stmt.bind(9, outcome.published.sequence);
    stmt.bind(10, outcome.published.sequenceFai);
    stmt.bind(11, outcome.published.sequenceGzi);
    stmt.bind(12, outcome.published.annotation);
    stmt.bind(13, outcome.published.annotationIndex);
    stmt.bind(14, outcome.sequenceToken.etag);
    stmt.bind(15, outcome.sequenceToken.lastModified);
    stmt.bind(16, outcome.annotationToken.etag);
    stmt.bind(17, outcome.annotationToken.lastModified);
    stmt.bindChecksum(18, outcome.sequenceChecksum);
    stmt.bind(19, nowSeconds());
    stmt.step();
    requireChanged(key, "markPublished");
    tx.commit();
}

void InventoryStore::markError(const GenomeKey& key, std::string_view message) {
    Transaction tx(*this);
    Statement stmt(db_,
                   "UPDATE genomes SET state = 'error', last_error = ?4, updated_at = ?5 "
                   "WHERE provider = ?1 AND species = ?2 AND assembly = ?3");
    stmt.bind(1, key.provider);
    stmt.bind(2, key.species);
    stmt.bind(3, key.assembly);
    stmt.bind(4, message);
    stmt.bind(5, nowSeconds());
    stmt.step();
    requireChanged(key, "markError");
    tx.commit();
}

std::vector<GenomeRecord> InventoryStore::listPublished() const {
    return query(std::format("WHERE {}", kUsableClause));
}

std::vector<GenomeRecord> InventoryStore::listAll() const { return query(""); }

}  // namespace refcache::store
