// =============================================================================
// refcache - Atomic File Primitives Implementation
// =============================================================================

#include "refcache/io/atomic_file.h"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <format>
#include <sstream>
#include <system_error>

#include "refcache/common/logger.h"

namespace refcache::io {

namespace {

/// @brief Per-process counter making temporary names unique across writers.
std::atomic<std::uint64_t> gTempCounter{0};

}  // namespace

// =============================================================================
// Free Functions
// =============================================================================

std::filesystem::path makeTempPath(const std::filesystem::path& target) {
    const auto serial = gTempCounter.fetch_add(1, std::memory_order_relaxed);
    auto name = std::format("{}.part-{}-{}", target.filename().string(),
                            static_cast<long>(::getpid()), serial);
    return target.parent_path() / name;
}

void fsyncFile(const std::filesystem::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throw IOError("Failed to open file for fsync",
                      std::error_code(errno, std::generic_category()),
                      ErrorContext(path.string()));
    }
    int ret = ::fsync(fd);
    int savedErrno = errno;
    ::close(fd);
    if (ret != 0) {
        throw IOError("fsync failed", std::error_code(savedErrno, std::generic_category()),
                      ErrorContext(path.string()));
    }
}

void renameAtomic(const std::filesystem::path& from, const std::filesystem::path& to) {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (ec) {
        throw IOError(std::format("Failed to rename {} into place", from.string()), ec,
                      ErrorContext(to.string()));
    }
}

void writeFileAtomic(const std::filesystem::path& target, std::string_view content) {
    AtomicFileWriter writer(target);
    writer.stream().write(content.data(), static_cast<std::streamsize>(content.size()));
    writer.commit();
}

std::optional<std::string> readTrimmedFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    std::string text = oss.str();

    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    text.erase(text.begin(), std::find_if(text.begin(), text.end(), notSpace));
    text.erase(std::find_if(text.rbegin(), text.rend(), notSpace).base(), text.end());

    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

bool removeIfExists(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    return std::filesystem::remove(path, ec);
}

// =============================================================================
// AtomicFileWriter Implementation
// =============================================================================

AtomicFileWriter::AtomicFileWriter(std::filesystem::path target)
    : targetPath_(std::move(target)), tempPath_(makeTempPath(targetPath_)) {
    stream_.open(tempPath_, std::ios::binary | std::ios::trunc);
    if (!stream_.is_open()) {
        throw IOError("Failed to create temporary file", ErrorContext(tempPath_.string()));
    }
    REFCACHE_LOG_TRACE("AtomicFileWriter: target={}, temp={}", targetPath_.string(),
                       tempPath_.string());
}

AtomicFileWriter::~AtomicFileWriter() {
    if (!committed_) {
        abort();
    }
}

void AtomicFileWriter::commit() {
    if (committed_) {
        return;
    }
    if (aborted_) {
        throw IOError("Cannot commit an aborted writer", ErrorContext(targetPath_.string()));
    }

    stream_.flush();
    if (!stream_.good()) {
        abort();
        throw IOError("Failed to write temporary file", ErrorContext(tempPath_.string()));
    }
    stream_.close();

    try {
        fsyncFile(tempPath_);
        renameAtomic(tempPath_, targetPath_);
    } catch (...) {
        abort();
        throw;
    }
    committed_ = true;
}

void AtomicFileWriter::abort() noexcept {
    if (aborted_ || committed_) {
        return;
    }
    aborted_ = true;
    if (stream_.is_open()) {
        stream_.close();
    }
    removeIfExists(tempPath_);
}

}  // namespace refcache::io
