// =============================================================================
// refcache - Catalog Loader Implementation
// =============================================================================

#include "refcache/pipeline/catalog.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <fstream>
#include <map>
#include <set>
#include <sstream>

#include <nlohmann/json.hpp>

#include "refcache/common/config.h"
#include "refcache/common/logger.h"

namespace refcache::pipeline {

namespace {

/// @brief Field values of one record before validation; absent and null are the same.
using RawRecord = std::map<std::string, std::string, std::less<>>;

constexpr std::string_view kSourcesKey = "sources";

std::string describeRecord(std::size_t index, const RawRecord& raw) {
    auto field = [&raw](std::string_view name) -> std::string {
        auto it = raw.find(name);
        return it != raw.end() ? it->second : std::string("?");
    };
    return std::format("entry #{} ({}/{}/{})", index + 1, field("provider"), field("species"),
                       field("assembly"));
}

std::optional<std::string> takeField(const RawRecord& raw, std::string_view name,
                                     std::string_view alias = {}) {
    auto it = raw.find(name);
    if (it == raw.end() && !alias.empty()) {
        it = raw.find(alias);
    }
    if (it == raw.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

std::string requireField(const RawRecord& raw, std::string_view name, std::string_view alias,
                         std::size_t index, std::string_view sourceName) {
    auto value = takeField(raw, name, alias);
    if (!value) {
        throw ConfigError(std::format("{} is missing required field '{}'",
                                      describeRecord(index, raw), name),
                          ErrorContext(std::string(sourceName)));
    }
    return *value;
}

CatalogEntry toEntry(const RawRecord& raw, std::size_t index, std::string_view sourceName) {
    CatalogEntry entry;
    entry.key.provider = requireField(raw, "provider", {}, index, sourceName);
    entry.key.species = requireField(raw, "species", {}, index, sourceName);
    entry.key.assembly = requireField(raw, "assembly", {}, index, sourceName);
    entry.sequenceUrl = requireField(raw, "sequence_url", "fasta_url", index, sourceName);
    entry.annotationUrl = takeField(raw, "annotation_url", "anno_url");
    entry.annotationFormat = takeField(raw, "annotation_format");

    const std::array<std::pair<std::string_view, std::string_view>, 3> components{{
        {"provider", entry.key.provider},
        {"species", entry.key.species},
        {"assembly", entry.key.assembly},
    }};
    for (const auto& [field, value] : components) {
        auto valid = validateKeyComponent(field, value);
        if (!valid) {
            throw ConfigError(std::format("{}: {}", describeRecord(index, raw),
                                          valid.error().message()),
                              ErrorContext(std::string(sourceName)));
        }
    }
    if (entry.annotationFormat && !entry.annotationUrl) {
        throw ConfigError(std::format("{}: annotation_format given without annotation_url",
                                      describeRecord(index, raw)),
                          ErrorContext(std::string(sourceName)));
    }
    return entry;
}

// =============================================================================
// YAML
// =============================================================================

std::vector<RawRecord> readYaml(std::string_view text, std::string_view sourceName) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::format("Invalid YAML: {}", e.what()),
                          ErrorContext(std::string(sourceName)));
    }

    std::vector<RawRecord> records;
    if (!root || root.IsNull()) {
        return records;
    }
    if (!root.IsMap()) {
        throw ConfigError("Catalog root must be a mapping with a 'sources' list",
                          ErrorContext(std::string(sourceName)));
    }

    const YAML::Node sources = root[std::string(kSourcesKey)];
    if (!sources || sources.IsNull()) {
        return records;
    }
    if (!sources.IsSequence()) {
        throw ConfigError("'sources' must be a list", ErrorContext(std::string(sourceName)));
    }

    for (std::size_t i = 0; i < sources.size(); ++i) {
        const YAML::Node item = sources[i];
        if (!item.IsMap()) {
            throw ConfigError(std::format("entry #{} is not a mapping", i + 1),
                              ErrorContext(std::string(sourceName)));
        }
        RawRecord raw;
        for (const auto& kv : item) {
            const auto name = kv.first.as<std::string>();
            if (kv.second.IsNull()) {
                continue;
            }
            if (!kv.second.IsScalar()) {
                throw ConfigError(std::format("entry #{}: field '{}' must be a string", i + 1, name),
                                  ErrorContext(std::string(sourceName)));
            }
            raw[name] = kv.second.as<std::string>();
        }
        records.push_back(std::move(raw));
    }
    return records;
}

// =============================================================================
// JSON
// =============================================================================

std::vector<RawRecord> readJson(std::string_view text, std::string_view sourceName) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::format("Invalid JSON: {}", e.what()),
                          ErrorContext(std::string(sourceName)));
    }

    std::vector<RawRecord> records;
    if (!root.is_object()) {
        throw ConfigError("Catalog root must be an object with a 'sources' array",
                          ErrorContext(std::string(sourceName)));
    }
    auto it = root.find(std::string(kSourcesKey));
    if (it == root.end() || it->is_null()) {
        return records;
    }
    if (!it->is_array()) {
        throw ConfigError("'sources' must be an array", ErrorContext(std::string(sourceName)));
    }

    std::size_t index = 0;
    for (const auto& item : *it) {
        ++index;
        if (!item.is_object()) {
            throw ConfigError(std::format("entry #{} is not an object", index),
                              ErrorContext(std::string(sourceName)));
        }
        RawRecord raw;
        for (auto field = item.begin(); field != item.end(); ++field) {
            const std::string& name = field.key();
            const nlohmann::json& value = field.value();
            if (value.is_null()) {
                continue;
            }
            if (!value.is_string()) {
                throw ConfigError(std::format("entry #{}: field '{}' must be a string", index, name),
                                  ErrorContext(std::string(sourceName)));
            }
            raw[name] = value.get<std::string>();
        }
        records.push_back(std::move(raw));
    }
    return records;
}

}  // namespace

CatalogFormat catalogFormatFromPath(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".json" ? CatalogFormat::kJson : CatalogFormat::kYaml;
}

std::vector<CatalogEntry> parseCatalog(std::string_view text, CatalogFormat format,
                                       std::string_view sourceName) {
    const auto records = format == CatalogFormat::kJson ? readJson(text, sourceName)
                                                        : readYaml(text, sourceName);

    std::vector<CatalogEntry> entries;
    entries.reserve(records.size());
    std::set<GenomeKey> seen;
    for (std::size_t i = 0; i < records.size(); ++i) {
        CatalogEntry entry = toEntry(records[i], i, sourceName);
        if (!seen.insert(entry.key).second) {
            throw ConfigError(std::format("{}: duplicate key {}", describeRecord(i, records[i]),
                                          entry.key.toString()),
                              ErrorContext(std::string(sourceName)));
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::vector<CatalogEntry> loadCatalog(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw IOError("Failed to open catalog", ErrorContext(path.string()));
    }
    std::ostringstream oss;
    oss << in.rdbuf();

    auto entries = parseCatalog(oss.str(), catalogFormatFromPath(path), path.string());
    REFCACHE_LOG_DEBUG("Catalog {}: {} entries", path.string(), entries.size());
    return entries;
}

std::optional<CatalogEntry> findEntry(const std::vector<CatalogEntry>& catalog,
                                      const GenomeKey& key) {
    auto it = std::find_if(catalog.begin(), catalog.end(),
                           [&key](const CatalogEntry& entry) { return entry.key == key; });
    if (it == catalog.end()) {
        return std::nullopt;
    }
    return *it;
}

}  // namespace refcache::pipeline
