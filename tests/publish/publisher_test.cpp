// =============================================================================
// refcache - Publisher Tests
// =============================================================================

#include "refcache/publish/publisher.h"

#include <gtest/gtest.h>

#include <atomic>
#include <fstream>
#include <string>
#include <thread>

#include "test_support.h"

namespace refcache::publish {
namespace {

using refcache::test::TempDir;
using refcache::test::readText;
using refcache::test::writeText;

const GenomeKey kKey{"ensemblplants", "Arabidopsis_thaliana", "TAIR10"};

StagedArtifacts writeStaged(const std::filesystem::path& ready, const std::string& version,
                            bool withAnnotation = true, std::string_view indexSuffix = ".tbi") {
    StagedArtifacts staged;
    staged.sequence = (ready / "genome.fa.gz").string();
    staged.sequenceFai = (ready / "genome.fa.gz.fai").string();
    staged.sequenceGzi = (ready / "genome.fa.gz.gzi").string();
    writeText(staged.sequence, "sequence " + version);
    writeText(staged.sequenceFai, "fai " + version);
    writeText(staged.sequenceGzi, "gzi " + version);
    if (withAnnotation) {
        staged.annotation = (ready / "genes.gff3.gz").string();
        staged.annotationIndex = (ready / ("genes.gff3.gz" + std::string(indexSuffix))).string();
        writeText(*staged.annotation, "annotation " + version);
        writeText(*staged.annotationIndex, "index " + version);
    }
    return staged;
}

bool hasTempFiles(const std::filesystem::path& dir) {
    for (const auto& item : std::filesystem::recursive_directory_iterator(dir)) {
        if (item.path().filename().string().find(".part-") != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::size_t generationCount(const std::filesystem::path& dir) {
    std::size_t count = 0;
    for (const auto& item : std::filesystem::directory_iterator(dir)) {
        if (!item.is_symlink() && item.is_directory()) {
            ++count;
        }
    }
    return count;
}

// =============================================================================
// AtomicPublisher
// =============================================================================

TEST(AtomicPublisherTest, PublishesCompleteSetIntoFirstGeneration) {
    TempDir dir;
    AtomicPublisher publisher(dir / "publish");
    const auto staged = writeStaged(dir / "ready", "v1");

    PublishStats stats;
    const auto published = publisher.publish(kKey, staged, &stats);

    const auto dest = dir.path() / "publish" / "ensemblplants" / "Arabidopsis_thaliana" / "TAIR10";
    EXPECT_EQ(publisher.destinationDir(kKey), dest);
    ASSERT_EQ(publisher.currentGeneration(kKey), dest / "v1");
    EXPECT_EQ(std::filesystem::read_symlink(dest / "current"), "v1");
    EXPECT_EQ(std::filesystem::path(published.sequence), dest / "v1" / "genome.fa.gz");
    EXPECT_EQ(std::filesystem::path(published.sequenceGzi), dest / "v1" / "genome.fa.gz.gzi");
    EXPECT_EQ(readText(dest / "current" / "genome.fa.gz"), "sequence v1");
    EXPECT_EQ(readText(*published.annotationIndex), "index v1");
    EXPECT_TRUE(stats.generationCreated);
    EXPECT_EQ(stats.generation, 1u);
    EXPECT_EQ(stats.filesWritten, 5u);
    EXPECT_EQ(stats.filesUnchanged, 0u);
    EXPECT_FALSE(hasTempFiles(dest));
}

TEST(AtomicPublisherTest, RepublishingSameContentWritesNothing) {
    TempDir dir;
    AtomicPublisher publisher(dir / "publish");
    const auto staged = writeStaged(dir / "ready", "v1");
    const auto published = publisher.publish(kKey, staged);
    const auto before = std::filesystem::last_write_time(published.sequence);

    PublishStats stats;
    const auto again = publisher.publish(kKey, staged, &stats);

    EXPECT_EQ(again, published);
    EXPECT_FALSE(stats.generationCreated);
    EXPECT_EQ(stats.filesWritten, 0u);
    EXPECT_EQ(stats.filesUnchanged, 5u);
    EXPECT_EQ(std::filesystem::last_write_time(published.sequence), before);
    EXPECT_EQ(generationCount(publisher.destinationDir(kKey)), 1u);
}

TEST(AtomicPublisherTest, ChangedSetGoesLiveAsNewGeneration) {
    TempDir dir;
    AtomicPublisher publisher(dir / "publish");
    auto staged = writeStaged(dir / "ready", "v1");
    const auto first = publisher.publish(kKey, staged);

    writeText(staged.sequence, "sequence v2");
    PublishStats stats;
    const auto second = publisher.publish(kKey, staged, &stats);

    const auto dest = publisher.destinationDir(kKey);
    EXPECT_TRUE(stats.generationCreated);
    EXPECT_EQ(stats.generation, 2u);
    EXPECT_EQ(stats.filesWritten, 1u);
    EXPECT_EQ(stats.filesUnchanged, 4u);
    EXPECT_EQ(std::filesystem::path(second.sequence), dest / "v2" / "genome.fa.gz");
    EXPECT_EQ(readText(second.sequence), "sequence v2");
    EXPECT_EQ(readText(second.sequenceFai), "fai v1");

    // The replaced generation stays intact for readers that already resolved it
    EXPECT_EQ(readText(first.sequence), "sequence v1");
    EXPECT_EQ(publisher.currentGeneration(kKey), dest / "v2");
}

TEST(AtomicPublisherTest, OnlyTheReplacedGenerationIsKept) {
    TempDir dir;
    AtomicPublisher publisher(dir / "publish");
    auto staged = writeStaged(dir / "ready", "v1");
    (void)publisher.publish(kKey, staged);
    writeText(staged.sequence, "sequence v2");
    (void)publisher.publish(kKey, staged);
    writeText(staged.sequence, "sequence v3");

    PublishStats stats;
    (void)publisher.publish(kKey, staged, &stats);

    const auto dest = publisher.destinationDir(kKey);
    EXPECT_EQ(stats.generationsRemoved, 1u);
    EXPECT_FALSE(std::filesystem::exists(dest / "v1"));
    EXPECT_TRUE(std::filesystem::exists(dest / "v2"));
    EXPECT_TRUE(std::filesystem::exists(dest / "v3"));
    EXPECT_EQ(generationCount(dest), 2u);
}

TEST(AtomicPublisherTest, SwitchingIndexKindPublishesOnlyNewIndex) {
    TempDir dir;
    AtomicPublisher publisher(dir / "publish");
    (void)publisher.publish(kKey, writeStaged(dir / "ready-tbi", "v1"));

    PublishStats stats;
    const auto published =
        publisher.publish(kKey, writeStaged(dir / "ready-csi", "v1", true, ".csi"), &stats);

    const auto live = *publisher.currentGeneration(kKey);
    EXPECT_TRUE(stats.generationCreated);
    EXPECT_EQ(std::filesystem::path(*published.annotationIndex), live / "genes.gff3.gz.csi");
    EXPECT_FALSE(std::filesystem::exists(live / "genes.gff3.gz.tbi"));
}

TEST(AtomicPublisherTest, DroppedAnnotationIsNotInNewGeneration) {
    TempDir dir;
    AtomicPublisher publisher(dir / "publish");
    (void)publisher.publish(kKey, writeStaged(dir / "ready", "v1"));

    PublishStats stats;
    const auto published =
        publisher.publish(kKey, writeStaged(dir / "ready2", "v1", false), &stats);

    const auto live = *publisher.currentGeneration(kKey);
    EXPECT_TRUE(stats.generationCreated);
    EXPECT_EQ(stats.filesWritten, 0u);
    EXPECT_FALSE(published.hasAnnotation());
    EXPECT_FALSE(std::filesystem::exists(live / "genes.gff3.gz"));
    EXPECT_FALSE(std::filesystem::exists(live / "genes.gff3.gz.tbi"));
}

TEST(AtomicPublisherTest, MissingSourceLeavesLiveGenerationUntouched) {
    TempDir dir;
    AtomicPublisher publisher(dir / "publish");
    auto staged = writeStaged(dir / "ready", "v1");
    const auto published = publisher.publish(kKey, staged);

    // The sequence changes but its index vanished before the copy
    writeText(staged.sequence, "sequence v2");
    writeText(staged.sequenceFai, "fai v2");
    std::filesystem::remove(staged.sequenceGzi);

    EXPECT_THROW((void)publisher.publish(kKey, staged), IOError);
    EXPECT_EQ(publisher.currentGeneration(kKey), publisher.destinationDir(kKey) / "v1");
    EXPECT_EQ(readText(published.sequence), "sequence v1");
    EXPECT_EQ(readText(published.sequenceFai), "fai v1");
    EXPECT_EQ(generationCount(publisher.destinationDir(kKey)), 1u);
    EXPECT_FALSE(hasTempFiles(publisher.destinationDir(kKey)));
}

TEST(AtomicPublisherTest, AbandonedPartialGenerationIsSkippedAndRemoved) {
    TempDir dir;
    AtomicPublisher publisher(dir / "publish");
    auto staged = writeStaged(dir / "ready", "v1");
    (void)publisher.publish(kKey, staged);

    // A publisher that died mid-copy, and one that died before switching the link
    const auto dest = publisher.destinationDir(kKey);
    writeText(dest / "v2.part-999-0" / "genome.fa.gz", "partial");
    writeText(dest / "v2" / "genome.fa.gz", "orphan");

    writeText(staged.sequence, "sequence v2");
    PublishStats stats;
    const auto published = publisher.publish(kKey, staged, &stats);

    EXPECT_EQ(stats.generation, 3u);
    EXPECT_EQ(std::filesystem::path(published.sequence), dest / "v3" / "genome.fa.gz");
    EXPECT_FALSE(std::filesystem::exists(dest / "v2"));
    EXPECT_TRUE(std::filesystem::exists(dest / "v1"));
    EXPECT_FALSE(hasTempFiles(dest));
}

TEST(AtomicPublisherTest, ConcurrentReaderNeverSeesMixedSet) {
    TempDir dir;
    AtomicPublisher publisher(dir / "publish");
    auto staged = writeStaged(dir / "ready", "0");
    (void)publisher.publish(kKey, staged);

    std::atomic<bool> done{false};
    std::atomic<int> consistentReads{0};
    std::atomic<int> mixedReads{0};
    std::thread reader([&] {
        do {
            const auto live = publisher.currentGeneration(kKey);
            if (!live) {
                ++mixedReads;
                continue;
            }
            std::ifstream sequence(*live / "genome.fa.gz");
            std::ifstream fai(*live / "genome.fa.gz.fai");
            std::ifstream gzi(*live / "genome.fa.gz.gzi");
            std::string s;
            std::string f;
            std::string g;
            // A generation pruned between resolve and open is read again on the next loop
            if (!std::getline(sequence, s) || !std::getline(fai, f) || !std::getline(gzi, g)) {
                continue;
            }
            const auto version = s.substr(s.find(' ') + 1);
            if (f != "fai " + version || g != "gzi " + version) {
                ++mixedReads;
            } else {
                ++consistentReads;
            }
        } while (!done.load());
    });

    for (int round = 1; round <= 50; ++round) {
        const auto version = std::to_string(round);
        writeText(staged.sequence, "sequence " + version);
        writeText(staged.sequenceFai, "fai " + version);
        writeText(staged.sequenceGzi, "gzi " + version);
        (void)publisher.publish(kKey, staged);
    }
    done = true;
    reader.join();

    EXPECT_EQ(mixedReads.load(), 0);
    EXPECT_GT(consistentReads.load(), 0);
}

TEST(AtomicPublisherTest, IncompleteStagedSetIsRejected) {
    TempDir dir;
    AtomicPublisher publisher(dir / "publish");
    StagedArtifacts staged;
    staged.sequence = (dir / "genome.fa.gz").string();
    EXPECT_THROW((void)publisher.publish(kKey, staged), IOError);
}

// =============================================================================
// Aggregate Index
// =============================================================================

TEST(AggregateIndexTest, RendersUsableRecordsOnly) {
    GenomeRecord usable;
    usable.key = kKey;
    usable.state = RecordState::kError;
    usable.published = PublishedArtifacts{"/p/genome.fa.gz", "/p/genome.fa.gz.fai",
                                          "/p/genome.fa.gz.gzi", std::nullopt, std::nullopt};
    usable.publishedAt = 1706702400;
    usable.sequenceChecksum = 0xabcULL;

    GenomeRecord pending;
    pending.key = GenomeKey{"ensemblplants", "Oryza_sativa", "IRGSP-1.0"};

    AggregateIndexWriter writer("/base/publish/index.json", "/base/publish");
    const auto document = writer.render({usable, pending}, 1706702400);

    EXPECT_EQ(document["version"], AggregateIndexWriter::kVersion);
    EXPECT_EQ(document["generated_at"], "2024-01-31T12:00:00Z");
    EXPECT_EQ(document["publish_root"], "/base/publish");
    ASSERT_EQ(document["entries"].size(), 1u);
    const auto& entry = document["entries"][0];
    EXPECT_EQ(entry["species"], "Arabidopsis_thaliana");
    EXPECT_EQ(entry["paths"]["sequence_gzi"], "/p/genome.fa.gz.gzi");
    EXPECT_TRUE(entry["paths"]["annotation"].is_null());
    EXPECT_EQ(entry["sequence_checksum"], "0000000000000abc");
}

TEST(AggregateIndexTest, WriteReplacesFile) {
    TempDir dir;
    AggregateIndexWriter writer(dir / "publish" / "index.json", dir / "publish");
    writer.write({});

    const auto document = nlohmann::json::parse(readText(writer.path()));
    EXPECT_TRUE(document["entries"].empty());
}

TEST(PublisherFormatTest, TimestampsAndChecksums) {
    EXPECT_EQ(formatTimestamp(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(formatChecksum(0xfedcba9876543210ULL), "fedcba9876543210");
}

}  // namespace
}  // namespace refcache::publish
