// =============================================================================
// refcache - Sync Command Implementation
// =============================================================================

#include "sync_command.h"

#include <format>
#include <iostream>

#include "refcache/common/logger.h"
#include "refcache/pipeline/catalog.h"

namespace refcache::commands {

// =============================================================================
// Report Formatting
// =============================================================================

void printPassReport(const pipeline::PassReport& report, std::ostream& out) {
    for (const auto& entry : report.entries) {
        if (entry.outcome.has_value()) {
            const auto& outcome = *entry.outcome;
            const char* status = outcome.generationPublished ? "published" : "unchanged";
            out << std::format("{:<10} {}", status, entry.key.toString());
            if (outcome.bytesFetched > 0) {
                out << std::format("  ({} bytes fetched)", outcome.bytesFetched);
            }
            out << '\n';
        } else {
            const std::string_view stage =
                entry.failedStage ? pipelineStageToString(*entry.failedStage) : "unknown";
            out << std::format("{:<10} {}  [{}] {}\n", "FAILED", entry.key.toString(), stage,
                               entry.outcome.error().message());
        }
    }
    out << std::format("{} published, {} unchanged, {} failed\n", report.publishedCount(),
                       report.unchangedCount(), report.failedCount());
}

int passExitCode(const pipeline::PassReport& report) noexcept {
    for (const auto& entry : report.entries) {
        if (!entry.outcome.has_value()) {
            return entry.outcome.error().exitCode();
        }
    }
    return 0;
}

// =============================================================================
// SyncCommand Implementation
// =============================================================================

SyncCommand::SyncCommand(SyncOptions options) : options_(std::move(options)) {}

SyncCommand::~SyncCommand() = default;

int SyncCommand::execute() {
    try {
        auto cache = pipeline::GenomeCache::open(options_.config);
        return options_.watch ? runWatch(*cache) : runOnce(*cache);
    } catch (const RefCacheException& e) {
        REFCACHE_LOG_ERROR("Sync failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        REFCACHE_LOG_ERROR("Unexpected error: {}", e.what());
        return 1;
    }
}

int SyncCommand::runOnce(pipeline::GenomeCache& cache) {
    const auto catalog = pipeline::loadCatalog(options_.catalogPath);
    if (catalog.empty()) {
        REFCACHE_LOG_WARNING("Catalog {} declares no sources", options_.catalogPath.string());
    }
    const auto report = cache.runCatalogPass(catalog);
    printPassReport(report, std::cout);
    return passExitCode(report);
}

int SyncCommand::runWatch(pipeline::GenomeCache& cache) {
    auto stop = options_.stopRequested ? options_.stopRequested : [] { return false; };
    int lastExit = 0;
    cache.watch(options_.catalogPath, options_.config.refreshInterval, stop,
                [&lastExit](const pipeline::PassReport& report) {
                    printPassReport(report, std::cout);
                    std::cout.flush();
                    lastExit = passExitCode(report);
                });
    return lastExit;
}

}  // namespace refcache::commands
