// =============================================================================
// refcache - Annotation Sorter
// =============================================================================
// Prepares GFF annotation files for range indexing.
//
// tabix requires features grouped by sequence and ordered by start position,
// with all header lines before the first feature. Origins publish annotation
// in gene order, so the file is rewritten:
//
//   1. `#` lines are collected as headers in their original order
//   2. blank lines are dropped
//   3. `##FASTA` ends the feature section; the embedded sequence is dropped
//   4. features are stably sorted by (seqid, numeric start)
//   5. headers, then features, are written as BGZF
//
// Only the GFF family is accepted. GTF and unrecognized formats are refused up
// front so the pipeline can reject an entry before touching the network.
// =============================================================================

#ifndef REFCACHE_INDEX_ANNOTATION_SORTER_H
#define REFCACHE_INDEX_ANNOTATION_SORTER_H

#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "refcache/common/error.h"

namespace refcache::index {

// =============================================================================
// Annotation Format Detection
// =============================================================================

/// @brief Annotation formats distinguished by the cache.
enum class AnnotationFormat : std::uint8_t {
    kUnknown = 0,
    kGff3 = 1,
    kGff = 2,
    kGtf = 3
};

/// @brief Detect the annotation format from a URL or file name.
///
/// Query string and fragment are ignored, as is one trailing compression
/// suffix (`.gz`, `.bz2`, `.xz`). Matching is case-insensitive.
[[nodiscard]] AnnotationFormat detectAnnotationFormat(std::string_view url) noexcept;

/// @brief Parse an explicit format name ("gff3", "gff", "gtf").
[[nodiscard]] AnnotationFormat annotationFormatFromString(std::string_view name) noexcept;

[[nodiscard]] std::string_view annotationFormatName(AnnotationFormat format) noexcept;

/// @brief Check the format belongs to the GFF family.
[[nodiscard]] constexpr bool isGffFamily(AnnotationFormat format) noexcept {
    return format == AnnotationFormat::kGff3 || format == AnnotationFormat::kGff;
}

/// @brief Resolve the annotation format of a catalog entry and require GFF.
/// @param url Annotation URL.
/// @param declared Explicit format from the catalog; takes precedence over the URL.
/// @throws UnsupportedFormat for GTF or when the format cannot be recognized.
AnnotationFormat requireGffAnnotation(std::string_view url,
                                      const std::optional<std::string>& declared);

// =============================================================================
// Sorting
// =============================================================================

/// @brief One feature line with its sort key.
struct FeatureLine {
    std::string text;
    std::size_t seqidLength = 0;
    std::uint64_t start = 0;

    [[nodiscard]] std::string_view seqid() const noexcept {
        return std::string_view(text).substr(0, seqidLength);
    }
};

/// @brief Annotation split into hoisted headers and sorted features.
struct SortedAnnotation {
    std::vector<std::string> headers;
    std::vector<FeatureLine> features;

    /// @brief Lines discarded after a `##FASTA` directive.
    std::uint64_t droppedFastaLines = 0;
};

/// @brief Parse one feature line.
/// @param lineNumber 1-based line number for error reporting.
/// @throws FormatError if the line has fewer than 9 columns or a non-numeric start.
[[nodiscard]] FeatureLine parseFeatureLine(std::string line, std::uint64_t lineNumber);

/// @brief Read an annotation stream and sort it.
/// @param sourceName Name used in error messages.
/// @throws FormatError naming the first malformed feature line.
[[nodiscard]] SortedAnnotation sortAnnotation(std::istream& in, std::string_view sourceName);

/// @brief Line counts of a sorted annotation file.
struct AnnotationStats {
    std::uint64_t headerLines = 0;
    std::uint64_t featureLines = 0;
    std::uint64_t droppedFastaLines = 0;
};

/// @brief Decompress, sort and write an annotation file as BGZF.
/// @param level BGZF deflate level 1-9.
/// @throws FormatError, IOError, UnsupportedFormat.
AnnotationStats sortAnnotationFile(const std::filesystem::path& source,
                                   const std::filesystem::path& target, int level);

}  // namespace refcache::index

#endif  // REFCACHE_INDEX_ANNOTATION_SORTER_H
