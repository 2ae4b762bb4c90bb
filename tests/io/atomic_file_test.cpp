// =============================================================================
// refcache - Atomic File Tests
// =============================================================================
// Unit tests for write-to-temp-then-rename helpers and content checksums.
// =============================================================================

#include "refcache/io/atomic_file.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "refcache/io/checksum.h"
#include "test_support.h"

namespace refcache::io {
namespace {

using refcache::test::TempDir;
using refcache::test::readText;
using refcache::test::writeText;

// =============================================================================
// Temp Paths
// =============================================================================

TEST(AtomicFileTest, TempPathsAreSiblingsAndUnique) {
    const std::filesystem::path target = "/data/publish/genome.fa.gz";
    const auto first = makeTempPath(target);
    const auto second = makeTempPath(target);

    EXPECT_EQ(first.parent_path(), target.parent_path());
    EXPECT_NE(first, second);
    EXPECT_TRUE(first.filename().string().starts_with("genome.fa.gz.part-"));
}

// =============================================================================
// AtomicFileWriter
// =============================================================================

TEST(AtomicFileWriterTest, TargetAppearsOnlyOnCommit) {
    TempDir dir;
    const auto target = dir / "sequence.src";

    AtomicFileWriter writer(target);
    writer.stream() << ">chr1\nACGT\n";
    EXPECT_FALSE(std::filesystem::exists(target));
    EXPECT_TRUE(std::filesystem::exists(writer.tempPath()));

    writer.commit();
    EXPECT_TRUE(writer.isCommitted());
    EXPECT_EQ(readText(target), ">chr1\nACGT\n");
    EXPECT_FALSE(std::filesystem::exists(writer.tempPath()));
}

TEST(AtomicFileWriterTest, AbortKeepsPreviousContent) {
    TempDir dir;
    const auto target = dir / "sequence.src";
    writeText(target, "old");

    std::filesystem::path temp;
    {
        AtomicFileWriter writer(target);
        temp = writer.tempPath();
        writer.stream() << "partial new content";
        // Destructor aborts
    }
    EXPECT_EQ(readText(target), "old");
    EXPECT_FALSE(std::filesystem::exists(temp));
}

TEST(AtomicFileWriterTest, FailsWhenDirectoryIsMissing) {
    TempDir dir;
    EXPECT_THROW(AtomicFileWriter(dir / "missing" / "file"), IOError);
}

// =============================================================================
// Helpers
// =============================================================================

TEST(AtomicFileTest, WriteFileAtomicReplacesContent) {
    TempDir dir;
    const auto target = dir / "index.json";
    writeFileAtomic(target, "{}\n");
    writeFileAtomic(target, "{\"version\": 1}\n");
    EXPECT_EQ(readText(target), "{\"version\": 1}\n");
}

TEST(AtomicFileTest, ReadTrimmedFile) {
    TempDir dir;
    writeText(dir / "etag", "  \"abc-123\"\n");
    EXPECT_EQ(readTrimmedFile(dir / "etag"), "\"abc-123\"");
    EXPECT_FALSE(readTrimmedFile(dir / "absent").has_value());
}

TEST(AtomicFileTest, RemoveIfExistsReportsRemoval) {
    TempDir dir;
    writeText(dir / "x", "1");
    EXPECT_TRUE(removeIfExists(dir / "x"));
    EXPECT_FALSE(removeIfExists(dir / "x"));
}

// =============================================================================
// Checksums
// =============================================================================

TEST(ChecksumTest, SameContentComparesBytes) {
    TempDir dir;
    writeText(dir / "a", "ACGTACGT");
    writeText(dir / "b", "ACGTACGT");
    writeText(dir / "c", "ACGTACGA");

    EXPECT_EQ(fileChecksum(dir / "a"), fileChecksum(dir / "b"));
    EXPECT_TRUE(sameContent(dir / "a", dir / "b"));
    EXPECT_FALSE(sameContent(dir / "a", dir / "c"));
    EXPECT_FALSE(sameContent(dir / "a", dir / "missing"));
}

TEST(ChecksumTest, FileChecksumMatchesBufferChecksum) {
    TempDir dir;
    const std::string data = ">chr1\nACGTNNNN\n";
    writeText(dir / "a", data);
    const auto* bytes = reinterpret_cast<const std::uint8_t*>(data.data());
    EXPECT_EQ(fileChecksum(dir / "a"), calculateXxHash64({bytes, data.size()}));
}

}  // namespace
}  // namespace refcache::io
