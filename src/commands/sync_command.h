// =============================================================================
// refcache - Sync Command
// =============================================================================
// Command handler that brings every catalog entry up to date.
//
// One pass loads the catalog, ensures each entry and prints a per-entry
// report. With --watch the pass repeats every refresh interval until a
// stop is requested (SIGINT/SIGTERM).
// =============================================================================

#ifndef REFCACHE_COMMANDS_SYNC_COMMAND_H
#define REFCACHE_COMMANDS_SYNC_COMMAND_H

#include <filesystem>
#include <functional>
#include <iosfwd>

#include "refcache/common/config.h"
#include "refcache/pipeline/genome_cache.h"

namespace refcache::commands {

// =============================================================================
// Sync Options
// =============================================================================

/// @brief Configuration options for the sync command.
struct SyncOptions {
    CacheConfig config;

    /// @brief Catalog file (YAML or JSON).
    std::filesystem::path catalogPath;

    /// @brief Keep running passes every config.refreshInterval.
    bool watch = false;

    /// @brief Polled between and during watch passes.
    std::function<bool()> stopRequested;
};

// =============================================================================
// SyncCommand Class
// =============================================================================

/// @brief Command handler for catalog passes.
class SyncCommand {
public:
    explicit SyncCommand(SyncOptions options);

    ~SyncCommand();

    SyncCommand(const SyncCommand&) = delete;
    SyncCommand& operator=(const SyncCommand&) = delete;

    /// @brief Execute the sync command.
    /// @return Exit code: 0 when every entry succeeded, else the first failure's code.
    [[nodiscard]] int execute();

    [[nodiscard]] const SyncOptions& options() const noexcept { return options_; }

private:
    int runOnce(pipeline::GenomeCache& cache);

    int runWatch(pipeline::GenomeCache& cache);

    SyncOptions options_;
};

/// @brief Print a pass report, one line per entry plus a summary.
void printPassReport(const pipeline::PassReport& report, std::ostream& out);

/// @brief Exit code for a pass: 0, or the code of the first failed entry.
[[nodiscard]] int passExitCode(const pipeline::PassReport& report) noexcept;

}  // namespace refcache::commands

#endif  // REFCACHE_COMMANDS_SYNC_COMMAND_H
