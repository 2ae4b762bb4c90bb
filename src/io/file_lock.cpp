// =============================================================================
// refcache - Cross-Process File Lock Implementation
// =============================================================================

#include "refcache/io/file_lock.h"

#include <fcntl.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <format>
#include <sstream>
#include <system_error>
#include <thread>

#include "refcache/common/logger.h"
#include "refcache/io/atomic_file.h"

namespace refcache::io {

namespace {

std::string hostName() {
    std::array<char, 256> buffer{};
    if (::gethostname(buffer.data(), buffer.size() - 1) != 0) {
        return "unknown";
    }
    return std::string(buffer.data());
}

UnixSeconds nowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/// @brief Create a file exclusively and write `content` into it.
/// @return false if the file already exists.
bool createExclusive(const std::filesystem::path& path, const std::string& content) {
    int fd = ::open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
    if (fd < 0) {
        if (errno == EEXIST) {
            return false;
        }
        throw IOError("Failed to create lock file", std::error_code(errno, std::generic_category()),
                      ErrorContext(path.string()));
    }
    // The owner line is informational; the lock is the file's existence
    ssize_t written = ::write(fd, content.data(), content.size());
    int savedErrno = errno;
    ::close(fd);
    if (written < 0) {
        REFCACHE_LOG_WARNING("Failed to record lock owner in {}: {}", path.string(),
                             std::error_code(savedErrno, std::generic_category()).message());
    }
    return true;
}

}  // namespace

// =============================================================================
// LockOwner Implementation
// =============================================================================

std::string LockOwner::toString() const {
    return std::format("{} {} {}", pid, host, acquiredAt);
}

std::optional<LockOwner> LockOwner::parse(const std::string& text) {
    std::istringstream iss(text);
    LockOwner owner;
    if (!(iss >> owner.pid >> owner.host >> owner.acquiredAt)) {
        return std::nullopt;
    }
    return owner;
}

// =============================================================================
// FileLock Implementation
// =============================================================================

FileLock::FileLock(std::filesystem::path lockPath, LockOptions options)
    : lockPath_(std::move(lockPath)), options_(options) {
    std::error_code ec;
    std::filesystem::create_directories(lockPath_.parent_path(), ec);
    if (ec) {
        throw IOError("Failed to create lock directory", ec,
                      ErrorContext(lockPath_.parent_path().string()));
    }

    const auto start = std::chrono::steady_clock::now();
    while (!tryCreate()) {
        ++attempts_;
        if (attempts_ == 1) {
            auto owner = readOwner(lockPath_);
            REFCACHE_LOG_INFO("Waiting for lock {} held by {}", lockPath_.string(),
                              owner ? owner->toString() : std::string("unknown owner"));
        }

        if (options_.staleAfter && reclaimIfStale()) {
            continue;
        }

        if (options_.timeout &&
            std::chrono::steady_clock::now() - start >= *options_.timeout) {
            throw LockTimeout(std::format("Gave up waiting for lock after {} ms",
                                          options_.timeout->count()),
                              ErrorContext(lockPath_.string()));
        }

        std::this_thread::sleep_for(options_.backoff);
    }

    held_ = true;
    REFCACHE_LOG_DEBUG("Acquired lock {} after {} contended attempts", lockPath_.string(),
                       attempts_);
}

FileLock::~FileLock() { release(); }

bool FileLock::tryCreate() {
    LockOwner owner{static_cast<long>(::getpid()), hostName(), nowSeconds()};
    std::string token = owner.toString();
    if (!createExclusive(lockPath_, token + "\n")) {
        return false;
    }
    ownerToken_ = std::move(token);
    return true;
}

bool FileLock::reclaimIfStale() {
    auto owner = readOwner(lockPath_);
    if (!owner) {
        return false;
    }
    const auto age = nowSeconds() - owner->acquiredAt;
    if (age < options_.staleAfter->count()) {
        return false;
    }

    // A second exclusive file serializes reclaimers so only one removes the stale lock
    const auto reclaimPath = std::filesystem::path(lockPath_.string() + ".reclaim");
    if (!createExclusive(reclaimPath, std::to_string(::getpid()) + "\n")) {
        return false;
    }

    bool removed = false;
    auto current = readOwner(lockPath_);
    if (current && current->toString() == owner->toString()) {
        removed = removeIfExists(lockPath_);
        REFCACHE_LOG_WARNING("Reclaimed stale lock {} held by {} for {} s", lockPath_.string(),
                             owner->toString(), age);
    }
    removeIfExists(reclaimPath);
    return removed;
}

void FileLock::release() noexcept {
    if (!held_) {
        return;
    }
    held_ = false;

    // Skip removal if a lease reclaimer took the lock over in the meantime
    auto current = readTrimmedFile(lockPath_);
    if (current && *current != ownerToken_) {
        REFCACHE_LOG_WARNING("Lock {} was reclaimed by another holder; leaving it in place",
                             lockPath_.string());
        return;
    }
    removeIfExists(lockPath_);
    REFCACHE_LOG_DEBUG("Released lock {}", lockPath_.string());
}

std::optional<LockOwner> FileLock::readOwner(const std::filesystem::path& lockPath) {
    auto text = readTrimmedFile(lockPath);
    if (!text) {
        return std::nullopt;
    }
    return LockOwner::parse(*text);
}

}  // namespace refcache::io
