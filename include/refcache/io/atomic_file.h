// =============================================================================
// refcache - Atomic File Primitives
// =============================================================================
// Temp-then-rename writes used by every component that touches files a
// concurrent reader may open.
//
// Every temporary lives in the same directory as its target (rename(2) is only
// atomic within one filesystem) and is named `<target>.part-<pid>-<n>` so two
// processes or two writers in one process never share a temporary.
//
// Usage:
//   AtomicFileWriter writer("/publish/index.json");
//   writer.stream() << payload;
//   writer.commit();  // fsync + rename; the destructor removes the temp otherwise
// =============================================================================

#ifndef REFCACHE_IO_ATOMIC_FILE_H
#define REFCACHE_IO_ATOMIC_FILE_H

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>

#include "refcache/common/error.h"

namespace refcache::io {

// =============================================================================
// Free Functions
// =============================================================================

/// @brief Create a unique temporary path next to a target.
/// @note Only the name is reserved by uniqueness; nothing is created on disk.
[[nodiscard]] std::filesystem::path makeTempPath(const std::filesystem::path& target);

/// @brief Flush a file's data to stable storage.
/// @throws IOError on failure.
void fsyncFile(const std::filesystem::path& path);

/// @brief Rename `from` over `to` in one step.
/// @throws IOError on failure.
void renameAtomic(const std::filesystem::path& from, const std::filesystem::path& to);

/// @brief Write `content` to `target` via a synced temporary and a rename.
/// @throws IOError on failure; the target is untouched in that case.
void writeFileAtomic(const std::filesystem::path& target, std::string_view content);

/// @brief Read a small text file (e.g. a sidecar) with surrounding whitespace trimmed.
/// @return std::nullopt if the file does not exist or is empty after trimming.
[[nodiscard]] std::optional<std::string> readTrimmedFile(const std::filesystem::path& path);

/// @brief Remove a file, ignoring "does not exist".
/// @return true if a file was removed.
bool removeIfExists(const std::filesystem::path& path) noexcept;

// =============================================================================
// AtomicFileWriter
// =============================================================================

/// @brief Stream writer that becomes visible at its target only on commit().
///
/// Error Handling:
/// - Throws IOError if the temporary cannot be created or committed
/// - An uncommitted writer removes its temporary on destruction
class AtomicFileWriter {
public:
    /// @brief Open a temporary next to `target`.
    /// @throws IOError if the temporary cannot be created.
    explicit AtomicFileWriter(std::filesystem::path target);

    ~AtomicFileWriter();

    AtomicFileWriter(const AtomicFileWriter&) = delete;
    AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;
    AtomicFileWriter(AtomicFileWriter&&) = delete;
    AtomicFileWriter& operator=(AtomicFileWriter&&) = delete;

    /// @brief Stream writing into the temporary.
    [[nodiscard]] std::ofstream& stream() noexcept { return stream_; }

    /// @brief Path of the temporary (for libraries that write by path).
    [[nodiscard]] const std::filesystem::path& tempPath() const noexcept { return tempPath_; }

    /// @brief Final path.
    [[nodiscard]] const std::filesystem::path& targetPath() const noexcept { return targetPath_; }

    /// @brief Flush, fsync and rename the temporary over the target.
    /// @throws IOError on failure (the temporary is removed).
    void commit();

    /// @brief Drop the temporary. Safe to call multiple times.
    void abort() noexcept;

    [[nodiscard]] bool isCommitted() const noexcept { return committed_; }

private:
    std::filesystem::path targetPath_;
    std::filesystem::path tempPath_;
    std::ofstream stream_;
    bool committed_ = false;
    bool aborted_ = false;
};

}  // namespace refcache::io

#endif  // REFCACHE_IO_ATOMIC_FILE_H
