// =============================================================================
// refcache - Inventory Commands Implementation
// =============================================================================

#include "inventory_command.h"

#include <algorithm>
#include <format>
#include <iostream>

#include <nlohmann/json.hpp>

#include "refcache/common/logger.h"
#include "refcache/pipeline/genome_cache.h"
#include "refcache/publish/publisher.h"

namespace refcache::commands {

namespace {

nlohmann::json recordToJson(const GenomeRecord& record) {
    nlohmann::json json;
    json["provider"] = record.key.provider;
    json["species"] = record.key.species;
    json["assembly"] = record.key.assembly;
    json["display_name"] = record.key.displayName();
    json["state"] = recordStateToString(record.state);
    json["last_error"] =
        record.lastError ? nlohmann::json(*record.lastError) : nlohmann::json(nullptr);
    json["paths"] = record.published ? publish::artifactsToJson(*record.published)
                                     : nlohmann::json(nullptr);
    json["updated_at"] = record.updatedAt;
    json["published_at"] = record.publishedAt;
    return json;
}

std::size_t keyColumnWidth(const std::vector<GenomeRecord>& records) {
    std::size_t width = 6;
    for (const auto& record : records) {
        width = std::max(width, record.key.toString().size());
    }
    return width;
}

}  // namespace

// =============================================================================
// Table Formatting
// =============================================================================

void printRecordTable(const std::vector<GenomeRecord>& records, std::ostream& out) {
    if (records.empty()) {
        out << "No published genomes.\n";
        return;
    }
    const auto width = keyColumnWidth(records);
    out << std::format("{:<{}}  {:<20}  {}\n", "GENOME", width, "PUBLISHED", "SEQUENCE");
    for (const auto& record : records) {
        out << std::format("{:<{}}  {:<20}  {}\n", record.key.toString(), width,
                           publish::formatTimestamp(record.publishedAt),
                           record.published ? record.published->sequence : std::string("-"));
    }
}

void printStatusTable(const std::vector<GenomeRecord>& records, std::ostream& out) {
    if (records.empty()) {
        out << "Inventory is empty.\n";
        return;
    }
    const auto width = keyColumnWidth(records);
    out << std::format("{:<{}}  {:<9}  {:<6}  {}\n", "GENOME", width, "STATE", "USABLE",
                       "LAST ERROR");
    for (const auto& record : records) {
        out << std::format("{:<{}}  {:<9}  {:<6}  {}\n", record.key.toString(), width,
                           recordStateToString(record.state), record.isUsable() ? "yes" : "no",
                           record.lastError.value_or("-"));
    }
}

// =============================================================================
// InventoryCommand Implementation
// =============================================================================

InventoryCommand::InventoryCommand(InventoryOptions options) : options_(std::move(options)) {}

InventoryCommand::~InventoryCommand() = default;

int InventoryCommand::execute() {
    try {
        switch (options_.view) {
            case InventoryView::kList:
                return runList();
            case InventoryView::kStatus:
                return runStatus();
            case InventoryView::kPaths:
                return runPaths();
        }
        return 1;
    } catch (const RefCacheException& e) {
        REFCACHE_LOG_ERROR("Inventory query failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        REFCACHE_LOG_ERROR("Unexpected error: {}", e.what());
        return 1;
    }
}

int InventoryCommand::runList() {
    auto cache = pipeline::GenomeCache::open(options_.config);
    const auto records = cache->listPublished();
    if (options_.jsonOutput) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& record : records) {
            out.push_back(recordToJson(record));
        }
        std::cout << out.dump(2) << std::endl;
    } else {
        printRecordTable(records, std::cout);
    }
    return 0;
}

int InventoryCommand::runStatus() {
    auto cache = pipeline::GenomeCache::open(options_.config);
    const auto records = cache->listAll();
    if (options_.jsonOutput) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& record : records) {
            out.push_back(recordToJson(record));
        }
        std::cout << out.dump(2) << std::endl;
    } else {
        printStatusTable(records, std::cout);
    }
    return 0;
}

int InventoryCommand::runPaths() {
    auto cache = pipeline::GenomeCache::open(options_.config);
    const auto resolved = cache->getPaths(options_.provider, options_.species, options_.assembly);
    if (!resolved) {
        const auto label = options_.provider + "/" + options_.species +
                           (options_.assembly ? "/" + *options_.assembly : std::string());
        throw IOError("No published genome for " + label);
    }

    nlohmann::json out;
    out["provider"] = resolved->key.provider;
    out["species"] = resolved->key.species;
    out["assembly"] = resolved->key.assembly;
    out["paths"] = publish::artifactsToJson(resolved->artifacts);
    out["published_at"] = publish::formatTimestamp(resolved->publishedAt);
    std::cout << out.dump(2) << std::endl;
    return 0;
}

}  // namespace refcache::commands
