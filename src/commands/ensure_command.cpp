// =============================================================================
// refcache - Ensure Command Implementation
// =============================================================================

#include "ensure_command.h"

#include <iostream>

#include <nlohmann/json.hpp>

#include "refcache/common/logger.h"
#include "refcache/pipeline/catalog.h"
#include "refcache/pipeline/genome_cache.h"
#include "refcache/publish/publisher.h"

namespace refcache::commands {

EnsureCommand::EnsureCommand(EnsureOptions options) : options_(std::move(options)) {}

EnsureCommand::~EnsureCommand() = default;

int EnsureCommand::execute() {
    try {
        const auto catalog = pipeline::loadCatalog(options_.catalogPath);
        const auto entry = pipeline::findEntry(catalog, options_.key);
        if (!entry) {
            throw UsageError("Genome " + options_.key.toString() + " is not in the catalog",
                             ErrorContext(options_.catalogPath.string()));
        }

        auto cache = pipeline::GenomeCache::open(options_.config);
        const auto outcome = cache->ensureDetailed(*entry);

        nlohmann::json out;
        out["provider"] = options_.key.provider;
        out["species"] = options_.key.species;
        out["assembly"] = options_.key.assembly;
        out["paths"] = publish::artifactsToJson(outcome.artifacts);
        out["content_changed"] = outcome.contentChanged;
        out["rebuilt"] = outcome.rebuilt;
        out["generation_published"] = outcome.generationPublished;
        out["files_published"] = outcome.filesPublished;
        out["bytes_fetched"] = outcome.bytesFetched;
        std::cout << out.dump(2) << std::endl;
        return 0;

    } catch (const RefCacheException& e) {
        REFCACHE_LOG_ERROR("Ensure failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        REFCACHE_LOG_ERROR("Unexpected error: {}", e.what());
        return 1;
    }
}

}  // namespace refcache::commands
