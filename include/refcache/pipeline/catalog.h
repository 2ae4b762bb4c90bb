// =============================================================================
// refcache - Catalog Loader
// =============================================================================
// Reads the static list of genome sources.
//
// Two encodings are accepted, chosen by file extension:
//
//   sources.yaml / .yml          sources.json
//   ---------------------        ----------------------------
//   sources:                     {"sources": [
//     - provider: ensemblplants    {"provider": "ensemblplants",
//       species: Arabidopsis         "species": "Arabidopsis",
//       assembly: TAIR10             "assembly": "TAIR10",
//       sequence_url: https://...    "sequence_url": "https://...",
//       annotation_url: https://..   "annotation_url": "https://..."}
//                                ]}
//
// `fasta_url` and `anno_url` are accepted as aliases. A load either returns
// every entry or fails naming the offending record; nothing is partially
// applied.
// =============================================================================

#ifndef REFCACHE_PIPELINE_CATALOG_H
#define REFCACHE_PIPELINE_CATALOG_H

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "refcache/common/error.h"
#include "refcache/common/types.h"

namespace refcache::pipeline {

/// @brief Catalog encodings.
enum class CatalogFormat : std::uint8_t {
    kYaml = 0,
    kJson = 1
};

/// @brief Pick the encoding from a file extension (.json, otherwise YAML).
[[nodiscard]] CatalogFormat catalogFormatFromPath(const std::filesystem::path& path);

/// @brief Load and validate a catalog file.
/// @throws ConfigError for malformed documents, missing fields, invalid keys or duplicates.
/// @throws IOError if the file cannot be read.
[[nodiscard]] std::vector<CatalogEntry> loadCatalog(const std::filesystem::path& path);

/// @brief Parse catalog text in the given encoding.
/// @param sourceName Name used in error messages.
[[nodiscard]] std::vector<CatalogEntry> parseCatalog(std::string_view text, CatalogFormat format,
                                                     std::string_view sourceName = "<catalog>");

/// @brief Find an entry by natural key.
[[nodiscard]] std::optional<CatalogEntry> findEntry(const std::vector<CatalogEntry>& catalog,
                                                    const GenomeKey& key);

}  // namespace refcache::pipeline

#endif  // REFCACHE_PIPELINE_CATALOG_H
