// =============================================================================
// refcache - BGZF Writer Implementation
// =============================================================================

#include "refcache/format/bgzf_writer.h"

#include <htslib/bgzf.h>

#include <format>

#include "refcache/common/logger.h"
#include "refcache/io/atomic_file.h"

namespace refcache::format {

BgzfWriter::BgzfWriter(std::filesystem::path target, int level)
    : targetPath_(std::move(target)), tempPath_(io::makeTempPath(targetPath_)) {
    if (level < 1 || level > 9) {
        throw UsageError(std::format("BGZF compression level must be 1-9, got {}", level));
    }
    const auto mode = std::format("w{}", level);
    handle_ = bgzf_open(tempPath_.c_str(), mode.c_str());
    if (handle_ == nullptr) {
        throw IOError("Failed to open BGZF output", ErrorContext(tempPath_.string()));
    }
}

BgzfWriter::~BgzfWriter() {
    if (!committed_) {
        abort();
    }
}

void BgzfWriter::write(std::string_view data) {
    if (handle_ == nullptr) {
        throw IOError("BGZF writer is closed", ErrorContext(targetPath_.string()));
    }
    if (data.empty()) {
        return;
    }
    if (bgzf_write(handle_, data.data(), data.size()) < 0) {
        throw IOError("BGZF write failed", ErrorContext(tempPath_.string()));
    }
    bytesWritten_ += data.size();
}

void BgzfWriter::writeLine(std::string_view line) {
    write(line);
    write("\n");
}

void BgzfWriter::commit() {
    if (committed_) {
        return;
    }
    if (handle_ == nullptr) {
        throw IOError("Cannot commit an aborted BGZF writer", ErrorContext(targetPath_.string()));
    }

    int ret = bgzf_close(handle_);
    handle_ = nullptr;
    if (ret != 0) {
        io::removeIfExists(tempPath_);
        throw IOError("Failed to finish BGZF output", ErrorContext(tempPath_.string()));
    }

    try {
        io::fsyncFile(tempPath_);
        io::renameAtomic(tempPath_, targetPath_);
    } catch (...) {
        io::removeIfExists(tempPath_);
        throw;
    }
    committed_ = true;
    REFCACHE_LOG_TRACE("BGZF committed: {} ({} bytes uncompressed)", targetPath_.string(),
                       bytesWritten_);
}

void BgzfWriter::abort() noexcept {
    if (handle_ != nullptr) {
        bgzf_close(handle_);
        handle_ = nullptr;
    }
    if (!committed_) {
        io::removeIfExists(tempPath_);
    }
}

}  // namespace refcache::format
