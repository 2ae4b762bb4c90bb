// =============================================================================
// refcache - Reference Genome Cache
// =============================================================================
// Main entry point for the refcache command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: sync, ensure, list, status, paths
// - Global options: base directory, catalog, logging, indexer, timeouts
// - SIGINT/SIGTERM handling to stop watch mode between passes
// =============================================================================

#include <CLI/CLI.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "refcache/common/config.h"
#include "refcache/common/error.h"
#include "refcache/common/logger.h"
#include "refcache/common/types.h"

// Command implementations
#include "commands/ensure_command.h"
#include "commands/inventory_command.h"
#include "commands/sync_command.h"

// Forward declarations for command handlers
namespace refcache::commands {
int runSync(CLI::App* app);
int runEnsure(CLI::App* app);
int runInventory(CLI::App* app, InventoryView view);
}  // namespace refcache::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "1.0.0";
constexpr const char* kDescription =
    "refcache: reference genome acquisition and preparation cache\n"
    "Fetches genome sequences and annotations from their origins, recompresses them\n"
    "into BGZF, builds .fai/.gzi and tabix/CSI indexes, and publishes complete sets\n"
    "atomically under <base>/publish.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string baseDir = "/data/genome_cache";
    std::string catalog;          // empty = <base>/sources.yaml
    int verbosity = 0;            // 0 = info, 1 = debug, 2 = trace
    bool quiet = false;
    std::string logFile;
    std::string indexer = "htslib";
    std::string annotationIndex = "tbi";
    int compressionLevel = refcache::kDefaultCompressionLevel;
    int httpTimeout = 600;        // seconds
    int lockTimeout = 0;          // seconds, 0 = wait forever
    int lockStaleAfter = 0;       // seconds, 0 = never reclaim
    std::string userAgent = "refcache/1.0";
};

GlobalOptions gOptions;

// =============================================================================
// Subcommand Options
// =============================================================================

struct CliSyncOptions {
    bool watch = false;
    int refreshInterval = 86400;  // seconds
};

CliSyncOptions gSyncOpts;

struct CliKeyOptions {
    std::string provider;
    std::string species;
    std::string assembly;
};

CliKeyOptions gEnsureOpts;
CliKeyOptions gPathsOpts;

bool gListJson = false;
bool gStatusJson = false;

// =============================================================================
// Signal Handling
// =============================================================================

std::atomic<bool> gStopRequested{false};

void handleStopSignal(int /*signum*/) {
    gStopRequested.store(true);
}

void installStopHandlers() {
    if (std::signal(SIGINT, handleStopSignal) == SIG_ERR) {
        REFCACHE_LOG_WARNING("Failed to install SIGINT handler");
    }
    if (std::signal(SIGTERM, handleStopSignal) == SIG_ERR) {
        REFCACHE_LOG_WARNING("Failed to install SIGTERM handler");
    }
}

// =============================================================================
// Configuration Assembly
// =============================================================================

/// @brief Build the cache configuration from global options.
/// @throws UsageError for values CLI11 validators cannot express.
refcache::CacheConfig buildConfig() {
    refcache::CacheConfig config;
    config.baseDir = gOptions.baseDir;
    config.userAgent = gOptions.userAgent;
    config.httpTimeout = std::chrono::seconds(gOptions.httpTimeout);
    config.compressionLevel = gOptions.compressionLevel;
    if (gOptions.lockTimeout > 0) {
        config.lockTimeout = std::chrono::seconds(gOptions.lockTimeout);
    }
    if (gOptions.lockStaleAfter > 0) {
        config.lockStaleAfter = std::chrono::seconds(gOptions.lockStaleAfter);
    }
    config.refreshInterval = std::chrono::seconds(gSyncOpts.refreshInterval);

    auto backend = refcache::indexerBackendFromString(gOptions.indexer);
    if (!backend) {
        throw refcache::UsageError("Unknown indexer: " + gOptions.indexer);
    }
    config.indexer = *backend;

    auto kind = refcache::annotationIndexKindFromString(gOptions.annotationIndex);
    if (!kind) {
        throw refcache::UsageError("Unknown annotation index: " + gOptions.annotationIndex);
    }
    config.annotationIndex = *kind;
    return config;
}

std::filesystem::path catalogPath(const refcache::CacheConfig& config) {
    return gOptions.catalog.empty() ? config.defaultCatalogPath()
                                    : std::filesystem::path(gOptions.catalog);
}

// =============================================================================
// Subcommand Setup
// =============================================================================

void addKeyOptions(CLI::App* cmd, CliKeyOptions& opts, bool assemblyRequired) {
    cmd->add_option("--provider", opts.provider, "Data provider (e.g. ensemblplants)")
        ->required();
    cmd->add_option("--species", opts.species, "Species name")->required();
    auto* assembly = cmd->add_option("--assembly", opts.assembly, "Assembly name");
    if (assemblyRequired) {
        assembly->required();
    }
}

void setupSyncCommand(CLI::App& app) {
    auto* sync = app.add_subcommand("sync", "Ensure every catalog entry is fetched and published");

    sync->add_flag("-w,--watch", gSyncOpts.watch,
                   "Keep running, repeating the pass every refresh interval");

    sync->add_option("--refresh-interval", gSyncOpts.refreshInterval,
                     "Seconds between passes in watch mode")
        ->default_val(86400)
        ->check(CLI::PositiveNumber);
}

void setupEnsureCommand(CLI::App& app) {
    auto* ensure = app.add_subcommand("ensure", "Fetch and publish one catalog entry");
    addKeyOptions(ensure, gEnsureOpts, true);
}

void setupListCommand(CLI::App& app) {
    auto* list = app.add_subcommand("list", "List published genomes");
    list->alias("ls");
    list->add_flag("--json", gListJson, "Output as JSON");
}

void setupStatusCommand(CLI::App& app) {
    auto* status = app.add_subcommand("status", "Show every record with state and last error");
    status->add_flag("--json", gStatusJson, "Output as JSON");
}

void setupPathsCommand(CLI::App& app) {
    auto* paths = app.add_subcommand(
        "paths", "Print published paths of a genome (latest assembly if none given)");
    addKeyOptions(paths, gPathsOpts, false);
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    // Global options
    app.add_option("-b,--base", gOptions.baseDir, "Cache base directory")
        ->envname("REFCACHE_BASE")
        ->default_val("/data/genome_cache");

    app.add_option("-c,--catalog", gOptions.catalog,
                   "Catalog file, YAML or JSON (default: <base>/sources.yaml)")
        ->envname("REFCACHE_CATALOG");

    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v, -vv for trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Only log errors");

    app.add_option("--log-file", gOptions.logFile, "Also append log messages to this file");

    app.add_option("--indexer", gOptions.indexer, "Indexer backend")
        ->default_val("htslib")
        ->check(CLI::IsMember({"htslib", "tools"}));

    app.add_option("--annotation-index", gOptions.annotationIndex,
                   "Annotation range index kind")
        ->default_val("tbi")
        ->check(CLI::IsMember({"tbi", "csi"}));

    app.add_option("-l,--compression-level", gOptions.compressionLevel,
                   "BGZF compression level (1-9)")
        ->default_val(refcache::kDefaultCompressionLevel)
        ->check(CLI::Range(1, 9));

    app.add_option("--timeout", gOptions.httpTimeout, "Per-download timeout in seconds")
        ->default_val(600)
        ->check(CLI::PositiveNumber);

    app.add_option("--lock-timeout", gOptions.lockTimeout,
                   "Give up waiting for an entry lock after N seconds (0 = wait forever)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);

    app.add_option("--lock-stale-after", gOptions.lockStaleAfter,
                   "Reclaim locks whose holder is older than N seconds (0 = never)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);

    app.add_option("--user-agent", gOptions.userAgent, "User-Agent header for downloads")
        ->default_val("refcache/1.0");

    // Setup subcommands
    setupSyncCommand(app);
    setupEnsureCommand(app);
    setupListCommand(app);
    setupStatusCommand(app);
    setupPathsCommand(app);

    // Require a subcommand
    app.require_subcommand(1);

    // Parse arguments
    CLI11_PARSE(app, argc, argv);

    // Initialize logger
    try {
        refcache::log::init(
            refcache::log::configFromVerbosity(gOptions.verbosity, gOptions.quiet,
                                               gOptions.logFile));
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    installStopHandlers();

    // Dispatch to subcommand handlers
    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("sync")) {
            exitCode = refcache::commands::runSync(app.get_subcommand("sync"));
        } else if (app.got_subcommand("ensure")) {
            exitCode = refcache::commands::runEnsure(app.get_subcommand("ensure"));
        } else if (app.got_subcommand("list")) {
            exitCode = refcache::commands::runInventory(app.get_subcommand("list"),
                                                        refcache::commands::InventoryView::kList);
        } else if (app.got_subcommand("status")) {
            exitCode = refcache::commands::runInventory(
                app.get_subcommand("status"), refcache::commands::InventoryView::kStatus);
        } else if (app.got_subcommand("paths")) {
            exitCode = refcache::commands::runInventory(app.get_subcommand("paths"),
                                                        refcache::commands::InventoryView::kPaths);
        }
    } catch (const refcache::RefCacheException& ex) {
        REFCACHE_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        REFCACHE_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    refcache::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace refcache::commands {

int runSync([[maybe_unused]] CLI::App* app) {
    SyncOptions opts;
    opts.config = buildConfig();
    opts.catalogPath = catalogPath(opts.config);
    opts.watch = gSyncOpts.watch;
    opts.stopRequested = [] { return gStopRequested.load(); };

    auto cmd = std::make_unique<SyncCommand>(std::move(opts));
    return cmd->execute();
}

int runEnsure([[maybe_unused]] CLI::App* app) {
    EnsureOptions opts;
    opts.config = buildConfig();
    opts.catalogPath = catalogPath(opts.config);
    opts.key = GenomeKey{gEnsureOpts.provider, gEnsureOpts.species, gEnsureOpts.assembly};

    auto cmd = std::make_unique<EnsureCommand>(std::move(opts));
    return cmd->execute();
}

int runInventory([[maybe_unused]] CLI::App* app, InventoryView view) {
    InventoryOptions opts;
    opts.config = buildConfig();
    opts.view = view;
    opts.jsonOutput = view == InventoryView::kList ? gListJson : gStatusJson;
    if (view == InventoryView::kPaths) {
        opts.provider = gPathsOpts.provider;
        opts.species = gPathsOpts.species;
        if (!gPathsOpts.assembly.empty()) {
            opts.assembly = gPathsOpts.assembly;
        }
    }

    auto cmd = std::make_unique<InventoryCommand>(std::move(opts));
    return cmd->execute();
}

}  // namespace refcache::commands
