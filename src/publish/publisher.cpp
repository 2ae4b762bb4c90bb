// =============================================================================
// refcache - Atomic Publisher Implementation
// =============================================================================

#include "refcache/publish/publisher.h"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <format>
#include <iterator>
#include <system_error>

#include "refcache/common/logger.h"
#include "refcache/io/atomic_file.h"
#include "refcache/io/checksum.h"

namespace refcache::publish {

namespace {

constexpr char kGenerationPrefix = 'v';
constexpr std::string_view kTempMarker = ".part-";

/// @brief One artifact of a staged set and its name inside a generation.
struct ArtifactFile {
    std::filesystem::path source;
    std::string name;
};

std::vector<ArtifactFile> artifactFiles(const StagedArtifacts& staged) {
    const std::string sequence(kSequenceFileName);
    std::vector<ArtifactFile> files{
        {staged.sequence, sequence},
        {staged.sequenceFai, sequence + std::string(kFaiSuffix)},
        {staged.sequenceGzi, sequence + std::string(kGziSuffix)},
    };
    if (staged.hasAnnotation()) {
        const std::string annotation(kAnnotationFileName);
        const auto indexSuffix =
            std::filesystem::path(*staged.annotationIndex).extension().string();
        files.push_back({*staged.annotation, annotation});
        files.push_back({*staged.annotationIndex, annotation + indexSuffix});
    }
    return files;
}

PublishedArtifacts artifactsIn(const std::filesystem::path& dir,
                               const std::vector<ArtifactFile>& files) {
    PublishedArtifacts published;
    published.sequence = (dir / files[0].name).string();
    published.sequenceFai = (dir / files[1].name).string();
    published.sequenceGzi = (dir / files[2].name).string();
    if (files.size() > 3) {
        published.annotation = (dir / files[3].name).string();
        published.annotationIndex = (dir / files[4].name).string();
    }
    return published;
}

/// @brief Generation number of a "v<N>" name; nullopt for anything else.
std::optional<std::uint64_t> parseGeneration(std::string_view name) {
    if (name.size() < 2 || name.front() != kGenerationPrefix) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    const char* last = name.data() + name.size();
    auto [ptr, ec] = std::from_chars(name.data() + 1, last, value);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return value;
}

/// @brief Check that `dir` holds exactly `files`, byte for byte.
bool holdsSameSet(const std::filesystem::path& dir, const std::vector<ArtifactFile>& files) {
    std::error_code ec;
    const auto entries = std::distance(std::filesystem::directory_iterator(dir, ec),
                                       std::filesystem::directory_iterator{});
    if (ec || static_cast<std::size_t>(entries) != files.size()) {
        return false;
    }
    return std::all_of(files.begin(), files.end(), [&dir](const ArtifactFile& file) {
        return io::sameContent(file.source, dir / file.name);
    });
}

void removeTree(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        REFCACHE_LOG_WARNING("Failed to remove {}: {}", path.string(), ec.message());
    }
}

void copyInto(const std::filesystem::path& source, const std::filesystem::path& destination,
              const GenomeKey& key) {
    std::error_code ec;
    std::filesystem::copy_file(source, destination, ec);
    if (ec) {
        throw IOError(std::format("Failed to copy {}", source.string()), ec,
                      ErrorContext(destination.string()).withKey(key.toString()));
    }
    io::fsyncFile(destination);
}

/// @brief Point `current` at a generation with one rename.
void switchCurrent(const std::filesystem::path& dir, const std::filesystem::path& generation) {
    const auto link = dir / kCurrentGenerationName;
    const auto temp = io::makeTempPath(link);
    std::error_code ec;
    std::filesystem::create_directory_symlink(generation.filename(), temp, ec);
    if (ec) {
        throw IOError("Failed to create generation link", ec, ErrorContext(temp.string()));
    }
    try {
        io::renameAtomic(temp, link);
    } catch (...) {
        io::removeIfExists(temp);
        throw;
    }
}

}  // namespace

// =============================================================================
// AtomicPublisher Implementation
// =============================================================================

std::filesystem::path AtomicPublisher::destinationDir(const GenomeKey& key) const {
    return publishRoot_ / key.provider / key.species / key.assembly;
}

std::string AtomicPublisher::generationName(std::uint64_t generation) {
    return std::format("{}{}", kGenerationPrefix, generation);
}

std::optional<std::filesystem::path> AtomicPublisher::currentGeneration(
    const GenomeKey& key) const {
    const auto dir = destinationDir(key);
    std::error_code ec;
    const auto target = std::filesystem::read_symlink(dir / kCurrentGenerationName, ec);
    if (ec || !parseGeneration(target.filename().string())) {
        return std::nullopt;
    }
    return dir / target.filename();
}

PublishedArtifacts AtomicPublisher::publish(const GenomeKey& key, const StagedArtifacts& staged,
                                            PublishStats* stats) {
    if (!staged.hasSequence()) {
        throw IOError("Staged set lacks the sequence artifacts",
                      ErrorContext().withKey(key.toString()));
    }

    const auto dir = destinationDir(key);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw IOError("Failed to create publish directory", ec, ErrorContext(dir.string()));
    }

    const auto files = artifactFiles(staged);
    const auto live = currentGeneration(key);
    PublishStats local;

    if (live && holdsSameSet(*live, files)) {
        local.filesUnchanged = files.size();
        local.generation = parseGeneration(live->filename().string()).value_or(0);
        REFCACHE_LOG_DEBUG("Published {}: generation {} unchanged", key.toString(),
                           local.generation);
        if (stats != nullptr) {
            *stats = local;
        }
        return artifactsIn(*live, files);
    }

    // Collect existing generations (including ones no link points at) to number the next
    std::vector<std::filesystem::path> leftovers;
    std::uint64_t next = 1;
    for (const auto& item : std::filesystem::directory_iterator(dir, ec)) {
        const auto name = item.path().filename().string();
        if (auto generation = parseGeneration(name)) {
            next = std::max(next, *generation + 1);
            leftovers.push_back(item.path());
        } else if (name.find(kTempMarker) != std::string::npos) {
            leftovers.push_back(item.path());
        }
    }
    if (ec) {
        throw IOError("Failed to list publish directory", ec, ErrorContext(dir.string()));
    }

    const auto generationDir = dir / generationName(next);
    const auto buildDir = io::makeTempPath(generationDir);
    try {
        if (!std::filesystem::create_directory(buildDir, ec) || ec) {
            throw IOError("Failed to create generation directory", ec,
                          ErrorContext(buildDir.string()).withKey(key.toString()));
        }
        for (const auto& file : files) {
            const auto target = buildDir / file.name;
            if (live && io::sameContent(file.source, *live / file.name)) {
                std::error_code linkEc;
                std::filesystem::create_hard_link(*live / file.name, target, linkEc);
                if (!linkEc) {
                    ++local.filesUnchanged;
                    continue;
                }
            }
            copyInto(file.source, target, key);
            ++local.filesWritten;
        }
        io::renameAtomic(buildDir, generationDir);
    } catch (...) {
        removeTree(buildDir);
        throw;
    }

    try {
        switchCurrent(dir, generationDir);
    } catch (...) {
        removeTree(generationDir);
        throw;
    }
    local.generationCreated = true;
    local.generation = next;

    // The replaced generation stays for readers that resolved it before the switch
    for (const auto& path : leftovers) {
        if (live && path == *live) {
            continue;
        }
        removeTree(path);
        if (parseGeneration(path.filename().string())) {
            ++local.generationsRemoved;
        }
    }

    REFCACHE_LOG_DEBUG("Published {}: generation {} ({} written, {} unchanged, {} pruned)",
                       key.toString(), local.generation, local.filesWritten,
                       local.filesUnchanged, local.generationsRemoved);
    if (stats != nullptr) {
        *stats = local;
    }
    return artifactsIn(generationDir, files);
}

// =============================================================================
// AggregateIndexWriter Implementation
// =============================================================================

nlohmann::json artifactsToJson(const PublishedArtifacts& artifacts) {
    nlohmann::json json;
    json["sequence"] = artifacts.sequence;
    json["sequence_fai"] = artifacts.sequenceFai;
    json["sequence_gzi"] = artifacts.sequenceGzi;
    json["annotation"] =
        artifacts.annotation ? nlohmann::json(*artifacts.annotation) : nlohmann::json(nullptr);
    json["annotation_index"] = artifacts.annotationIndex
                                   ? nlohmann::json(*artifacts.annotationIndex)
                                   : nlohmann::json(nullptr);
    return json;
}

std::string formatTimestamp(UnixSeconds seconds) {
    const std::chrono::sys_seconds tp{std::chrono::seconds(seconds)};
    return std::format("{:%FT%TZ}", tp);
}

std::string formatChecksum(Checksum checksum) { return std::format("{:016x}", checksum); }

nlohmann::json AggregateIndexWriter::render(const std::vector<GenomeRecord>& records,
                                            UnixSeconds generatedAt) const {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& record : records) {
        if (!record.isUsable()) {
            continue;
        }
        nlohmann::json entry;
        entry["provider"] = record.key.provider;
        entry["species"] = record.key.species;
        entry["assembly"] = record.key.assembly;
        entry["display_name"] = record.key.displayName();
        entry["paths"] = artifactsToJson(*record.published);
        entry["updated_at"] = record.updatedAt;
        entry["published_at"] = record.publishedAt;
        entry["sequence_checksum"] = record.sequenceChecksum
                                         ? nlohmann::json(formatChecksum(*record.sequenceChecksum))
                                         : nlohmann::json(nullptr);
        entries.push_back(std::move(entry));
    }

    nlohmann::json document;
    document["version"] = kVersion;
    document["generated_at"] = formatTimestamp(generatedAt);
    document["publish_root"] = publishRoot_.string();
    document["entries"] = std::move(entries);
    return document;
}

void AggregateIndexWriter::write(const std::vector<GenomeRecord>& records) const {
    const auto now = std::chrono::duration_cast<std::chrono::seconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
    const auto document = render(records, now);

    std::error_code ec;
    std::filesystem::create_directories(indexPath_.parent_path(), ec);
    if (ec) {
        throw IOError("Failed to create index directory", ec,
                      ErrorContext(indexPath_.parent_path().string()));
    }
    io::writeFileAtomic(indexPath_, document.dump(2) + "\n");
    REFCACHE_LOG_DEBUG("Aggregate index written: {} ({} entries)", indexPath_.string(),
                       document["entries"].size());
}

}  // namespace refcache::publish
