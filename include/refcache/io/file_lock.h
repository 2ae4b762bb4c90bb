// =============================================================================
// refcache - Cross-Process File Lock
// =============================================================================
// Exclusive per-entry lock built on atomic exclusive file creation.
//
// Acquisition creates the lock file with O_CREAT|O_EXCL, so exactly one holder
// exists at a time across processes sharing the cache directory. Contenders
// retry with a fixed backoff. The file records the owner ("pid host epoch") for
// diagnostics and for the optional lease.
//
// By default there is no wait bound and no lease: a holder killed before
// release leaves the file behind and the key stays locked until the file is
// removed by hand. LockOptions can bound the wait (LockTimeout) and enable a
// lease after which a lock is considered abandoned and reclaimed.
// =============================================================================

#ifndef REFCACHE_IO_FILE_LOCK_H
#define REFCACHE_IO_FILE_LOCK_H

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "refcache/common/error.h"
#include "refcache/common/types.h"

namespace refcache::io {

/// @brief Tuning for FileLock acquisition.
struct LockOptions {
    /// @brief Sleep between attempts.
    std::chrono::milliseconds backoff{200};

    /// @brief Give up with LockTimeout after this long; wait forever when empty.
    std::optional<std::chrono::milliseconds> timeout;

    /// @brief Reclaim a lock whose recorded age exceeds this; never when empty.
    std::optional<std::chrono::seconds> staleAfter;
};

/// @brief Identity recorded in a lock file.
struct LockOwner {
    long pid = 0;
    std::string host;
    UnixSeconds acquiredAt = 0;

    /// @brief Serialize as "pid host epoch".
    [[nodiscard]] std::string toString() const;

    /// @brief Parse the serialized form.
    /// @return std::nullopt for malformed content.
    [[nodiscard]] static std::optional<LockOwner> parse(const std::string& text);
};

/// @brief RAII holder of one lock file.
///
/// Thread Safety:
/// - Distinct FileLock objects on the same path exclude each other, whether
///   they live in the same process or in different ones.
class FileLock {
public:
    /// @brief Block until the lock at `lockPath` is acquired.
    /// @throws LockTimeout if options.timeout elapses first.
    /// @throws IOError if the lock file cannot be created for another reason.
    FileLock(std::filesystem::path lockPath, LockOptions options = {});

    /// @brief Release the lock if still held.
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    FileLock(FileLock&&) = delete;
    FileLock& operator=(FileLock&&) = delete;

    /// @brief Release early. Safe to call multiple times.
    void release() noexcept;

    [[nodiscard]] bool isHeld() const noexcept { return held_; }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return lockPath_; }

    /// @brief Number of failed attempts before acquisition (0 = uncontended).
    [[nodiscard]] std::size_t contendedAttempts() const noexcept { return attempts_; }

    /// @brief Read the owner recorded in a lock file.
    [[nodiscard]] static std::optional<LockOwner> readOwner(const std::filesystem::path& lockPath);

private:
    /// @brief One O_EXCL creation attempt.
    /// @return true when acquired, false when the file already exists.
    bool tryCreate();

    /// @brief Remove the lock file if its lease has expired.
    /// @return true if a stale lock was removed.
    bool reclaimIfStale();

    std::filesystem::path lockPath_;
    LockOptions options_;
    std::string ownerToken_;
    std::size_t attempts_ = 0;
    bool held_ = false;
};

}  // namespace refcache::io

#endif  // REFCACHE_IO_FILE_LOCK_H
