// =============================================================================
// refcache - Compressed Stream Property Tests
// =============================================================================
// Property-based tests for magic-byte sniffing and transparent decompression.
//
// *For any* text and any supported source compression, reading the file back
// through CompressedInputStream yields the original bytes, and transcoding
// into BGZF preserves them as well.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

#include "refcache/format/bgzf_writer.h"
#include "refcache/format/transcoder.h"
#include "refcache/io/compressed_stream.h"
#include "test_support.h"

namespace refcache::io::test {

using refcache::test::TempDir;
using refcache::test::bzip2String;
using refcache::test::gzipString;
using refcache::test::writeText;
using refcache::test::xzString;

// =============================================================================
// Helpers
// =============================================================================

[[nodiscard]] std::string encode(const std::string& data, CompressionFormat format) {
    switch (format) {
        case CompressionFormat::kGzip:
            return gzipString(data);
        case CompressionFormat::kBzip2:
            return bzip2String(data);
        case CompressionFormat::kXz:
            return xzString(data);
        default:
            return data;
    }
}

[[nodiscard]] std::string readAll(const std::filesystem::path& path) {
    CompressedInputStream in(path);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

namespace gen {

/// @brief FASTA-like text: a header and wrapped sequence lines.
[[nodiscard]] rc::Gen<std::string> fastaText() {
    return rc::gen::map(
        rc::gen::container<std::vector<std::string>>(
            rc::gen::container<std::string>(rc::gen::inRange<std::size_t>(1, 80),
                                            rc::gen::element('A', 'C', 'G', 'T', 'N'))),
        [](const std::vector<std::string>& lines) {
            std::string text = ">chr1 test\n";
            for (const auto& line : lines) {
                text += line;
                text += '\n';
            }
            return text;
        });
}

[[nodiscard]] rc::Gen<CompressionFormat> supportedFormat() {
    return rc::gen::element(CompressionFormat::kNone, CompressionFormat::kGzip,
                            CompressionFormat::kBzip2, CompressionFormat::kXz);
}

}  // namespace gen

// =============================================================================
// Magic Detection
// =============================================================================

TEST(CompressionDetectionTest, RecognizesMagicBytes) {
    const std::vector<std::uint8_t> gzip{0x1f, 0x8b, 0x08, 0x00};
    const std::vector<std::uint8_t> bzip2{'B', 'Z', 'h', '9'};
    const std::vector<std::uint8_t> xz{0xfd, '7', 'z', 'X', 'Z', 0x00};
    const std::vector<std::uint8_t> zstd{0x28, 0xb5, 0x2f, 0xfd};
    const std::vector<std::uint8_t> plain{'>', 'c', 'h', 'r', '1'};

    EXPECT_EQ(detectCompressionFormat(gzip), CompressionFormat::kGzip);
    EXPECT_EQ(detectCompressionFormat(bzip2), CompressionFormat::kBzip2);
    EXPECT_EQ(detectCompressionFormat(xz), CompressionFormat::kXz);
    EXPECT_EQ(detectCompressionFormat(zstd), CompressionFormat::kZstd);
    EXPECT_EQ(detectCompressionFormat(plain), CompressionFormat::kNone);
    EXPECT_EQ(detectCompressionFormat({}), CompressionFormat::kNone);
}

TEST(CompressionDetectionTest, ZstdIsRecognizedButUnsupported) {
    TempDir dir;
    const auto path = dir / "genome.fa.zst";
    writeText(path, std::string("\x28\xb5\x2f\xfd\x00\x00", 6));

    EXPECT_EQ(sniffFile(path), CompressionFormat::kZstd);
    EXPECT_THROW(format::transcodeToBgzf(path, dir / "out.fa.gz", 6), UnsupportedFormat);
    EXPECT_FALSE(std::filesystem::exists(dir / "out.fa.gz"));
}

TEST(CompressionDetectionTest, DetectionIgnoresFileExtension) {
    TempDir dir;
    const auto path = dir / "genome.fa";
    writeText(path, gzipString(">chr1\nACGT\n"));
    EXPECT_EQ(sniffFile(path), CompressionFormat::kGzip);
    EXPECT_EQ(readAll(path), ">chr1\nACGT\n");
}

TEST(CompressedStreamTest, ConcatenatedGzipMembersAreRead) {
    TempDir dir;
    const auto path = dir / "multi.gz";
    writeText(path, gzipString(">chr1\nAC\n") + gzipString("GT\n"));
    EXPECT_EQ(readAll(path), ">chr1\nAC\nGT\n");
}

TEST(CompressedStreamTest, TruncatedGzipIsAnError) {
    TempDir dir;
    const auto path = dir / "truncated.gz";
    auto data = gzipString(std::string(10000, 'A'));
    data.resize(data.size() / 2);
    writeText(path, data);

    EXPECT_THROW(format::transcodeToBgzf(path, dir / "out.fa.gz", 6), IOError);
    EXPECT_FALSE(std::filesystem::exists(dir / "out.fa.gz"));
}

// =============================================================================
// Round-Trip Properties
// =============================================================================

RC_GTEST_PROP(CompressedStreamProperty, DecompressionRestoresOriginal, ()) {
    const auto text = *gen::fastaText();
    const auto compression = *gen::supportedFormat();

    TempDir dir;
    const auto path = dir / "source";
    writeText(path, encode(text, compression));

    CompressedInputStream in(path);
    RC_ASSERT(in.format() == compression);
    std::ostringstream oss;
    oss << in.rdbuf();
    RC_ASSERT(oss.str() == text);
}

RC_GTEST_PROP(CompressedStreamProperty, TranscodeToBgzfPreservesContent, ()) {
    const auto text = *gen::fastaText();
    const auto compression = *gen::supportedFormat();

    TempDir dir;
    const auto source = dir / "source";
    const auto target = dir / "genome.fa.gz";
    writeText(source, encode(text, compression));

    const auto result = format::transcodeToBgzf(source, target, 6);
    RC_ASSERT(result.sourceFormat == compression);
    RC_ASSERT(result.uncompressedBytes == text.size());

    // BGZF is gzip-compatible: the output sniffs as gzip and inflates to the input
    RC_ASSERT(sniffFile(target) == CompressionFormat::kGzip);
    RC_ASSERT(readAll(target) == text);
}

// =============================================================================
// BGZF Writer
// =============================================================================

TEST(BgzfWriterTest, RejectsInvalidLevel) {
    TempDir dir;
    EXPECT_THROW(format::BgzfWriter(dir / "x.gz", 0), UsageError);
    EXPECT_THROW(format::BgzfWriter(dir / "x.gz", 10), UsageError);
}

TEST(BgzfWriterTest, AbortLeavesNoTarget) {
    TempDir dir;
    const auto target = dir / "genes.gff3.gz";
    {
        format::BgzfWriter writer(target, 6);
        writer.writeLine("chr1\t.\tgene\t1\t10\t.\t+\t.\tID=g1");
        // Destroyed without commit
    }
    EXPECT_FALSE(std::filesystem::exists(target));
    EXPECT_TRUE(std::filesystem::is_empty(dir.path()));
}

TEST(BgzfWriterTest, CommitPublishesReadableFile) {
    TempDir dir;
    const auto target = dir / "genes.gff3.gz";
    format::BgzfWriter writer(target, 1);
    writer.writeLine("##gff-version 3");
    writer.write("chr1\t.\tgene\t1\t10\t.\t+\t.\tID=g1\n");
    writer.commit();

    EXPECT_EQ(writer.bytesWritten(), 16u + 29u);
    EXPECT_EQ(readAll(target), "##gff-version 3\nchr1\t.\tgene\t1\t10\t.\t+\t.\tID=g1\n");
}

}  // namespace refcache::io::test
