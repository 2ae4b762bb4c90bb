// =============================================================================
// refcache - Annotation Sorter Implementation
// =============================================================================

#include "refcache/index/annotation_sorter.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <format>

#include "refcache/common/logger.h"
#include "refcache/format/bgzf_writer.h"
#include "refcache/io/compressed_stream.h"

namespace refcache::index {

namespace {

/// @brief Number of tab-separated columns in a GFF feature line.
constexpr std::size_t kGffColumns = 9;

/// @brief Zero-based index of the start coordinate column.
constexpr std::size_t kStartColumn = 3;

constexpr std::string_view kFastaDirective = "##FASTA";

std::string toLower(std::string_view value) {
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool isBlank(std::string_view line) noexcept {
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

// =============================================================================
// Annotation Format Detection
// =============================================================================

AnnotationFormat detectAnnotationFormat(std::string_view url) noexcept {
    const auto cut = url.find_first_of("?#");
    if (cut != std::string_view::npos) {
        url = url.substr(0, cut);
    }

    std::string name;
    try {
        name = toLower(url);
    } catch (const std::bad_alloc&) {
        return AnnotationFormat::kUnknown;
    }
    std::string_view view(name);

    for (std::string_view suffix : {".gz", ".bz2", ".xz"}) {
        if (view.ends_with(suffix)) {
            view.remove_suffix(suffix.size());
            break;
        }
    }

    if (view.ends_with(".gff3")) {
        return AnnotationFormat::kGff3;
    }
    if (view.ends_with(".gff")) {
        return AnnotationFormat::kGff;
    }
    if (view.ends_with(".gtf")) {
        return AnnotationFormat::kGtf;
    }
    return AnnotationFormat::kUnknown;
}

AnnotationFormat annotationFormatFromString(std::string_view name) noexcept {
    if (name == "gff3" || name == "GFF3") {
        return AnnotationFormat::kGff3;
    }
    if (name == "gff" || name == "GFF") {
        return AnnotationFormat::kGff;
    }
    if (name == "gtf" || name == "GTF") {
        return AnnotationFormat::kGtf;
    }
    return AnnotationFormat::kUnknown;
}

std::string_view annotationFormatName(AnnotationFormat format) noexcept {
    switch (format) {
        case AnnotationFormat::kGff3:
            return "gff3";
        case AnnotationFormat::kGff:
            return "gff";
        case AnnotationFormat::kGtf:
            return "gtf";
        case AnnotationFormat::kUnknown:
            return "unknown";
    }
    return "unknown";
}

AnnotationFormat requireGffAnnotation(std::string_view url,
                                      const std::optional<std::string>& declared) {
    AnnotationFormat format = AnnotationFormat::kUnknown;
    if (declared) {
        format = annotationFormatFromString(*declared);
        if (format == AnnotationFormat::kUnknown) {
            throw UnsupportedFormat(std::format("Unknown annotation format '{}'", *declared),
                                    ErrorContext().withUrl(std::string(url)));
        }
    } else {
        format = detectAnnotationFormat(url);
    }

    if (format == AnnotationFormat::kGtf) {
        throw UnsupportedFormat("GTF annotation cannot be range-indexed; provide GFF3",
                                ErrorContext().withUrl(std::string(url)));
    }
    if (format == AnnotationFormat::kUnknown) {
        throw UnsupportedFormat(
            "Cannot determine annotation format from URL (expected .gff3 or .gff)",
            ErrorContext().withUrl(std::string(url)));
    }
    return format;
}

// =============================================================================
// Sorting
// =============================================================================

FeatureLine parseFeatureLine(std::string line, std::uint64_t lineNumber) {
    std::array<std::size_t, kGffColumns> columnStart{};
    std::size_t columns = 1;
    for (std::size_t pos = 0; pos < line.size() && columns < kGffColumns; ++pos) {
        if (line[pos] == '\t') {
            columnStart[columns++] = pos + 1;
        }
    }
    if (columns < kGffColumns) {
        throw FormatError(std::format("Feature line has {} columns, expected {}", columns,
                                      kGffColumns),
                          ErrorContext().withLine(lineNumber));
    }

    const std::size_t startBegin = columnStart[kStartColumn];
    const std::size_t startEnd = columnStart[kStartColumn + 1] - 1;
    const char* first = line.data() + startBegin;
    const char* last = line.data() + startEnd;

    std::uint64_t start = 0;
    auto [ptr, ec] = std::from_chars(first, last, start);
    if (ec != std::errc{} || ptr != last || first == last) {
        throw FormatError(std::format("Non-numeric start coordinate '{}'",
                                      std::string_view(first, static_cast<std::size_t>(last - first))),
                          ErrorContext().withLine(lineNumber));
    }

    FeatureLine feature;
    feature.seqidLength = columnStart[1] - 1;
    feature.start = start;
    feature.text = std::move(line);
    return feature;
}

SortedAnnotation sortAnnotation(std::istream& in, std::string_view sourceName) {
    SortedAnnotation result;
    std::string line;
    std::uint64_t lineNumber = 0;
    bool inFasta = false;

    while (std::getline(in, line)) {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (inFasta) {
            ++result.droppedFastaLines;
            continue;
        }
        if (line.starts_with(kFastaDirective)) {
            inFasta = true;
            ++result.droppedFastaLines;
            continue;
        }
        if (isBlank(line)) {
            continue;
        }
        if (line.front() == '#') {
            result.headers.push_back(std::move(line));
            continue;
        }

        try {
            result.features.push_back(parseFeatureLine(std::move(line), lineNumber));
        } catch (const FormatError& e) {
            throw FormatError(e.message(),
                              ErrorContext(std::string(sourceName)).withLine(lineNumber));
        }
    }

    std::stable_sort(result.features.begin(), result.features.end(),
                     [](const FeatureLine& lhs, const FeatureLine& rhs) {
                         const auto lhsId = lhs.seqid();
                         const auto rhsId = rhs.seqid();
                         if (lhsId != rhsId) {
                             return lhsId < rhsId;
                         }
                         return lhs.start < rhs.start;
                     });

    REFCACHE_LOG_DEBUG("Sorted {}: {} headers, {} features, {} FASTA lines dropped", sourceName,
                       result.headers.size(), result.features.size(), result.droppedFastaLines);
    return result;
}

AnnotationStats sortAnnotationFile(const std::filesystem::path& source,
                                   const std::filesystem::path& target, int level) {
    io::CompressedInputStream in(source);
    in.exceptions(std::ios::badbit);

    SortedAnnotation sorted = sortAnnotation(in, source.string());

    format::BgzfWriter writer(target, level);
    for (const auto& header : sorted.headers) {
        writer.writeLine(header);
    }
    for (const auto& feature : sorted.features) {
        writer.writeLine(feature.text);
    }
    writer.commit();

    return AnnotationStats{sorted.headers.size(), sorted.features.size(),
                           sorted.droppedFastaLines};
}

}  // namespace refcache::index
