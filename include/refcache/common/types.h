// =============================================================================
// refcache - Common Type Definitions
// =============================================================================
// Core type definitions for the refcache library.
//
// This module defines:
// - GenomeKey: natural key (provider, species, assembly)
// - RecordState: lifecycle state of a genome record
// - RevalidationToken: entity tag / last-modified pair from the origin
// - StagedArtifacts / PublishedArtifacts: artifact path sets
// - GenomeRecord: one row of the inventory
// - PipelineStage: stage names used in error reports
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _ (classes), camelCase (structs)
// - Constants: kConstant
// =============================================================================

#ifndef REFCACHE_COMMON_TYPES_H
#define REFCACHE_COMMON_TYPES_H

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace refcache {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Unix timestamp in seconds.
using UnixSeconds = std::int64_t;

/// @brief Type alias for content checksums (xxHash64).
using Checksum = std::uint64_t;

// =============================================================================
// Constants
// =============================================================================

/// @brief File name of the block-compressed sequence in ready/ and publish/.
inline constexpr std::string_view kSequenceFileName = "genome.fa.gz";

/// @brief File name of the block-compressed annotation in ready/ and publish/.
inline constexpr std::string_view kAnnotationFileName = "genes.gff3.gz";

/// @brief Suffix of the sequence index (name -> byte range).
inline constexpr std::string_view kFaiSuffix = ".fai";

/// @brief Suffix of the BGZF block-boundary index.
inline constexpr std::string_view kGziSuffix = ".gzi";

/// @brief Suffix of a tabix range index.
inline constexpr std::string_view kTbiSuffix = ".tbi";

/// @brief Suffix of a CSI range index.
inline constexpr std::string_view kCsiSuffix = ".csi";

/// @brief Suffix of the entity-tag sidecar next to a downloaded file.
inline constexpr std::string_view kEtagSuffix = ".etag";

/// @brief Suffix of the last-modified sidecar next to a downloaded file.
inline constexpr std::string_view kLastModifiedSuffix = ".lastmod";

/// @brief Suffix of the sidecar naming the URL a download came from.
inline constexpr std::string_view kSourceUrlSuffix = ".url";

/// @brief Suffix of the sidecar naming the origin token a ready/ artifact was built from.
inline constexpr std::string_view kBuiltFromSuffix = ".source";

/// @brief Name of the symlink selecting the live generation in publish/{p}/{s}/{a}/.
inline constexpr std::string_view kCurrentGenerationName = "current";

/// @brief Default BGZF compression level.
inline constexpr int kDefaultCompressionLevel = 6;

// =============================================================================
// GenomeKey
// =============================================================================

/// @brief Natural key identifying one genome record.
struct GenomeKey {
    std::string provider;
    std::string species;
    std::string assembly;

    /// @brief Render as "provider/species/assembly".
    [[nodiscard]] std::string toString() const {
        return provider + "/" + species + "/" + assembly;
    }

    /// @brief Human-friendly label, e.g. "ensemblplants/Arabidopsis_thaliana (TAIR10)".
    [[nodiscard]] std::string displayName() const {
        return provider + "/" + species + " (" + assembly + ")";
    }

    auto operator<=>(const GenomeKey&) const = default;
    bool operator==(const GenomeKey&) const = default;
};

// =============================================================================
// CatalogEntry
// =============================================================================

/// @brief One source declared in the catalog.
struct CatalogEntry {
    GenomeKey key;
    std::string sequenceUrl;
    std::optional<std::string> annotationUrl;

    /// @brief Explicit annotation format ("gff3", "gff"); inferred from the URL when empty.
    std::optional<std::string> annotationFormat;

    bool operator==(const CatalogEntry&) const = default;
};

// =============================================================================
// Record State
// =============================================================================

/// @brief Lifecycle state of a genome record.
enum class RecordState : std::uint8_t {
    /// @brief Known from the catalog, never processed.
    kMissing = 0,

    /// @brief A run holds the lock and is fetching/processing.
    kFetching = 1,

    /// @brief Artifacts are complete and published.
    kPublished = 2,

    /// @brief The last run failed; previously published artifacts remain.
    kError = 3
};

/// @brief Convert RecordState to its stored string form.
[[nodiscard]] constexpr std::string_view recordStateToString(RecordState state) noexcept {
    switch (state) {
        case RecordState::kMissing:
            return "missing";
        case RecordState::kFetching:
            return "fetching";
        case RecordState::kPublished:
            return "published";
        case RecordState::kError:
            return "error";
    }
    return "missing";
}

/// @brief Parse a stored state string.
/// @return std::nullopt for unknown strings.
[[nodiscard]] constexpr std::optional<RecordState> recordStateFromString(
    std::string_view value) noexcept {
    if (value == "missing") {
        return RecordState::kMissing;
    }
    if (value == "fetching") {
        return RecordState::kFetching;
    }
    if (value == "published") {
        return RecordState::kPublished;
    }
    if (value == "error") {
        return RecordState::kError;
    }
    return std::nullopt;
}

// =============================================================================
// Pipeline Stage
// =============================================================================

/// @brief Stages of one entry's run, used to report where a failure happened.
enum class PipelineStage : std::uint8_t {
    kValidate = 0,
    kLock,
    kFetch,
    kTranscode,
    kIndex,
    kPublish
};

[[nodiscard]] constexpr std::string_view pipelineStageToString(PipelineStage stage) noexcept {
    switch (stage) {
        case PipelineStage::kValidate:
            return "validate";
        case PipelineStage::kLock:
            return "lock";
        case PipelineStage::kFetch:
            return "fetch";
        case PipelineStage::kTranscode:
            return "transcode";
        case PipelineStage::kIndex:
            return "index";
        case PipelineStage::kPublish:
            return "publish";
    }
    return "unknown";
}

// =============================================================================
// Revalidation Token
// =============================================================================

/// @brief Origin-supplied validators for a conditional request.
struct RevalidationToken {
    /// @brief Entity tag (sent back as If-None-Match).
    std::optional<std::string> etag;

    /// @brief Last-Modified value (sent back as If-Modified-Since).
    std::optional<std::string> lastModified;

    /// @brief Check whether any validator is present.
    [[nodiscard]] bool empty() const noexcept { return !etag && !lastModified; }

    bool operator==(const RevalidationToken&) const = default;
};

// =============================================================================
// Artifact Path Sets
// =============================================================================

/// @brief Complete artifact set for one genome, either staged or published.
/// @note Annotation fields are all set or all empty.
struct ArtifactSet {
    std::string sequence;
    std::string sequenceFai;
    std::string sequenceGzi;
    std::optional<std::string> annotation;
    std::optional<std::string> annotationIndex;

    /// @brief Check the sequence triple is present.
    [[nodiscard]] bool hasSequence() const noexcept {
        return !sequence.empty() && !sequenceFai.empty() && !sequenceGzi.empty();
    }

    /// @brief Check the annotation pair is present.
    [[nodiscard]] bool hasAnnotation() const noexcept {
        return annotation.has_value() && annotationIndex.has_value();
    }

    bool operator==(const ArtifactSet&) const = default;
};

/// @brief Artifacts produced by the indexer under cache/.../ready/.
using StagedArtifacts = ArtifactSet;

/// @brief Artifacts promoted into the public tree.
using PublishedArtifacts = ArtifactSet;

// =============================================================================
// GenomeRecord
// =============================================================================

/// @brief One inventory row: everything known about a genome.
/// @note Invariant: state == kPublished implies published->hasSequence().
struct GenomeRecord {
    GenomeKey key;
    std::string sequenceUrl;
    std::optional<std::string> annotationUrl;

    RecordState state = RecordState::kMissing;
    std::optional<std::string> lastError;

    std::optional<StagedArtifacts> staged;
    std::optional<PublishedArtifacts> published;

    RevalidationToken sequenceToken;
    RevalidationToken annotationToken;

    /// @brief Time of the last state transition.
    UnixSeconds updatedAt = 0;

    /// @brief Time of the last successful publish (0 if never published).
    UnixSeconds publishedAt = 0;

    /// @brief xxHash64 of the published sequence file.
    std::optional<Checksum> sequenceChecksum;

    /// @brief Check whether a complete artifact set is available to readers.
    [[nodiscard]] bool isUsable() const noexcept {
        return published.has_value() && published->hasSequence();
    }
};

}  // namespace refcache

#endif  // REFCACHE_COMMON_TYPES_H
