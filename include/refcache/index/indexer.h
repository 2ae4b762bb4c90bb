// =============================================================================
// refcache - Indexer
// =============================================================================
// Random-access indexes over BGZF artifacts.
//
// Two backends implement the same capability:
// - HtslibIndexer: in-process through htslib (fai_build3, tbx_index_build)
// - ExternalToolIndexer: runs `samtools faidx` and `tabix -p gff`
//
// The backend is chosen once at startup (createIndexer) and injected into the
// pipeline. Both write their outputs next to the input file, using the same
// names htslib does: `<file>.fai`, `<file>.gzi`, `<file>.tbi` / `<file>.csi`.
// =============================================================================

#ifndef REFCACHE_INDEX_INDEXER_H
#define REFCACHE_INDEX_INDEXER_H

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "refcache/common/config.h"
#include "refcache/common/error.h"

namespace refcache::index {

/// @brief Files produced by sequence indexing.
struct SequenceIndexFiles {
    std::filesystem::path fai;
    std::filesystem::path gzi;
};

/// @brief Polymorphic indexing capability.
class Indexer {
public:
    virtual ~Indexer() = default;

    /// @brief Build `.fai` and `.gzi` for a BGZF FASTA file.
    /// @throws ToolFailure if indexing fails.
    virtual SequenceIndexFiles indexSequence(const std::filesystem::path& bgzfFasta) = 0;

    /// @brief Build a range index for a sorted BGZF GFF file.
    /// @return Path of the `.tbi` or `.csi` file.
    /// @throws ToolFailure if indexing fails.
    virtual std::filesystem::path indexAnnotation(const std::filesystem::path& bgzfGff,
                                                  AnnotationIndexKind kind) = 0;

    /// @brief Backend name for logs.
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

protected:
    Indexer() = default;
};

/// @brief Path of the range index file for an annotation.
[[nodiscard]] std::filesystem::path annotationIndexPath(const std::filesystem::path& bgzfGff,
                                                        AnnotationIndexKind kind);

// =============================================================================
// HtslibIndexer
// =============================================================================

/// @brief Indexer linked against htslib.
class HtslibIndexer final : public Indexer {
public:
    SequenceIndexFiles indexSequence(const std::filesystem::path& bgzfFasta) override;

    std::filesystem::path indexAnnotation(const std::filesystem::path& bgzfGff,
                                          AnnotationIndexKind kind) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "htslib"; }
};

// =============================================================================
// ExternalToolIndexer
// =============================================================================

/// @brief Indexer that invokes samtools and tabix.
///
/// A tool that exits with a non-zero status, is killed by a signal or cannot
/// be started is reported as ToolFailure.
class ExternalToolIndexer final : public Indexer {
public:
    ExternalToolIndexer(std::string samtools = "samtools", std::string tabix = "tabix")
        : samtools_(std::move(samtools)), tabix_(std::move(tabix)) {}

    SequenceIndexFiles indexSequence(const std::filesystem::path& bgzfFasta) override;

    std::filesystem::path indexAnnotation(const std::filesystem::path& bgzfGff,
                                          AnnotationIndexKind kind) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "tools"; }

private:
    std::string samtools_;
    std::string tabix_;
};

/// @brief Run a command and wait for it.
/// @throws ToolFailure on spawn failure, signal, or non-zero exit.
void runTool(const std::vector<std::string>& argv);

/// @brief Create the indexer for a configured backend.
[[nodiscard]] std::unique_ptr<Indexer> createIndexer(IndexerBackend backend);

}  // namespace refcache::index

#endif  // REFCACHE_INDEX_INDEXER_H
