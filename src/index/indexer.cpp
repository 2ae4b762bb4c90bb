// =============================================================================
// refcache - Indexer Implementation
// =============================================================================

#include "refcache/index/indexer.h"

#include <htslib/faidx.h>
#include <htslib/tbx.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <format>
#include <system_error>

#include "refcache/common/logger.h"
#include "refcache/common/types.h"

namespace refcache::index {

namespace {

/// @brief tabix min_shift: 0 selects TBI, 14 selects CSI with the default bin size.
constexpr int kTbiMinShift = 0;
constexpr int kCsiMinShift = 14;

std::filesystem::path withSuffix(const std::filesystem::path& path, std::string_view suffix) {
    return std::filesystem::path(path.string() + std::string(suffix));
}

void requireOutput(const std::filesystem::path& path, std::string_view tool) {
    if (!std::filesystem::exists(path)) {
        throw ToolFailure(std::format("{} reported success but produced no {}", tool,
                                      path.filename().string()),
                          ErrorContext(path.string()));
    }
}

std::string joinCommand(const std::vector<std::string>& argv) {
    std::string command;
    for (const auto& arg : argv) {
        if (!command.empty()) {
            command += ' ';
        }
        command += arg;
    }
    return command;
}

}  // namespace

std::filesystem::path annotationIndexPath(const std::filesystem::path& bgzfGff,
                                          AnnotationIndexKind kind) {
    return withSuffix(bgzfGff, kind == AnnotationIndexKind::kCsi ? kCsiSuffix : kTbiSuffix);
}

// =============================================================================
// HtslibIndexer Implementation
// =============================================================================

SequenceIndexFiles HtslibIndexer::indexSequence(const std::filesystem::path& bgzfFasta) {
    SequenceIndexFiles files{withSuffix(bgzfFasta, kFaiSuffix), withSuffix(bgzfFasta, kGziSuffix)};

    REFCACHE_LOG_DEBUG("fai_build3 {}", bgzfFasta.string());
    if (fai_build3(bgzfFasta.c_str(), files.fai.c_str(), files.gzi.c_str()) != 0) {
        throw ToolFailure("fai_build3 failed to index sequence", ErrorContext(bgzfFasta.string()));
    }
    requireOutput(files.fai, "fai_build3");
    requireOutput(files.gzi, "fai_build3");
    return files;
}

std::filesystem::path HtslibIndexer::indexAnnotation(const std::filesystem::path& bgzfGff,
                                                     AnnotationIndexKind kind) {
    const int minShift = kind == AnnotationIndexKind::kCsi ? kCsiMinShift : kTbiMinShift;

    REFCACHE_LOG_DEBUG("tbx_index_build {} ({})", bgzfGff.string(),
                       annotationIndexKindToString(kind));
    int ret = tbx_index_build(bgzfGff.c_str(), minShift, &tbx_conf_gff);
    if (ret != 0) {
        throw ToolFailure(std::format("tbx_index_build failed with code {}", ret),
                          ErrorContext(bgzfGff.string()));
    }

    auto indexPath = annotationIndexPath(bgzfGff, kind);
    requireOutput(indexPath, "tbx_index_build");
    return indexPath;
}

// =============================================================================
// ExternalToolIndexer Implementation
// =============================================================================

void runTool(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw ToolFailure("Empty command line");
    }
    const std::string command = joinCommand(argv);
    REFCACHE_LOG_DEBUG("Running: {}", command);

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid == -1) {
        throw ToolFailure(std::format("Failed to fork for {}: {}", argv.front(),
                                      std::error_code(errno, std::generic_category()).message()));
    }
    if (pid == 0) {
        ::execvp(args[0], args.data());
        // 127 mirrors the shell's "command not found"
        ::_exit(127);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw ToolFailure(std::format("waitpid failed for {}: {}", argv.front(),
                                          std::error_code(errno, std::generic_category()).message()));
        }
    }

    if (WIFSIGNALED(status)) {
        throw ToolFailure(std::format("{} terminated by signal {}", command, WTERMSIG(status)));
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        throw ToolFailure(argv.front(), WEXITSTATUS(status), ErrorContext().withFile(command));
    }
}

SequenceIndexFiles ExternalToolIndexer::indexSequence(const std::filesystem::path& bgzfFasta) {
    runTool({samtools_, "faidx", bgzfFasta.string()});

    SequenceIndexFiles files{withSuffix(bgzfFasta, kFaiSuffix), withSuffix(bgzfFasta, kGziSuffix)};
    requireOutput(files.fai, samtools_);
    requireOutput(files.gzi, samtools_);
    return files;
}

std::filesystem::path ExternalToolIndexer::indexAnnotation(const std::filesystem::path& bgzfGff,
                                                           AnnotationIndexKind kind) {
    std::vector<std::string> argv{tabix_, "-f", "-p", "gff"};
    if (kind == AnnotationIndexKind::kCsi) {
        argv.emplace_back("-C");
    }
    argv.push_back(bgzfGff.string());
    runTool(argv);

    auto indexPath = annotationIndexPath(bgzfGff, kind);
    requireOutput(indexPath, tabix_);
    return indexPath;
}

// =============================================================================
// Factory
// =============================================================================

std::unique_ptr<Indexer> createIndexer(IndexerBackend backend) {
    switch (backend) {
        case IndexerBackend::kHtslib:
            return std::make_unique<HtslibIndexer>();
        case IndexerBackend::kExternalTools:
            return std::make_unique<ExternalToolIndexer>();
    }
    throw UsageError("Unknown indexer backend");
}

}  // namespace refcache::index
