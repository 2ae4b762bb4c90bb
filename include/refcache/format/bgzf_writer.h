// =============================================================================
// refcache - BGZF Writer
// =============================================================================
// Block-compressed output (htslib BGZF) written through a temporary file.
//
// BGZF is a series of independent gzip members of at most 64 KiB each, which
// is what makes `.gzi`/`.fai` random access and tabix range queries possible.
// The writer compresses into `<target>.part-<pid>-<n>` and only renames over
// the target on commit(), so a reader never observes a half-written file.
// =============================================================================

#ifndef REFCACHE_FORMAT_BGZF_WRITER_H
#define REFCACHE_FORMAT_BGZF_WRITER_H

#include <cstdint>
#include <filesystem>
#include <string_view>

#include "refcache/common/error.h"

// Forward declaration from htslib/bgzf.h
struct BGZF;

namespace refcache::format {

/// @brief Streaming BGZF writer with temp-then-rename semantics.
class BgzfWriter {
public:
    /// @brief Open a BGZF temporary next to `target`.
    /// @param level Deflate level 1-9.
    /// @throws IOError if the temporary cannot be opened.
    BgzfWriter(std::filesystem::path target, int level);

    /// @brief Remove the temporary if the writer was not committed.
    ~BgzfWriter();

    BgzfWriter(const BgzfWriter&) = delete;
    BgzfWriter& operator=(const BgzfWriter&) = delete;
    BgzfWriter(BgzfWriter&&) = delete;
    BgzfWriter& operator=(BgzfWriter&&) = delete;

    /// @brief Append uncompressed bytes.
    /// @throws IOError on write failure.
    void write(std::string_view data);

    /// @brief Append one line followed by '\n'.
    void writeLine(std::string_view line);

    /// @brief Close the stream (writing the EOF block), fsync and rename.
    /// @throws IOError on failure; the target is untouched in that case.
    void commit();

    /// @brief Close and remove the temporary. Safe to call multiple times.
    void abort() noexcept;

    /// @brief Uncompressed bytes written so far.
    [[nodiscard]] std::uint64_t bytesWritten() const noexcept { return bytesWritten_; }

    [[nodiscard]] const std::filesystem::path& targetPath() const noexcept { return targetPath_; }

private:
    std::filesystem::path targetPath_;
    std::filesystem::path tempPath_;
    BGZF* handle_ = nullptr;
    std::uint64_t bytesWritten_ = 0;
    bool committed_ = false;
};

}  // namespace refcache::format

#endif  // REFCACHE_FORMAT_BGZF_WRITER_H
