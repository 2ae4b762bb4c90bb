// =============================================================================
// refcache - Annotation Sorter Tests
// =============================================================================
// Unit and property tests for annotation format gating and coordinate
// sorting of GFF feature lines.
// =============================================================================

#include "refcache/index/annotation_sorter.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <format>
#include <sstream>
#include <string>
#include <tuple>
#include <vector>

#include "refcache/io/compressed_stream.h"
#include "test_support.h"

namespace refcache::index {
namespace {

using refcache::test::TempDir;
using refcache::test::gzipString;
using refcache::test::writeText;

std::string featureLine(const std::string& seqid, std::uint64_t start, const std::string& id) {
    return std::format("{}\tsrc\tgene\t{}\t{}\t.\t+\t.\tID={}", seqid, start, start + 10, id);
}

std::vector<std::string> featureTexts(const SortedAnnotation& sorted) {
    std::vector<std::string> texts;
    for (const auto& feature : sorted.features) {
        texts.push_back(feature.text);
    }
    return texts;
}

// =============================================================================
// Format Gating
// =============================================================================

TEST(AnnotationFormatTest, DetectsFromUrlSuffix) {
    EXPECT_EQ(detectAnnotationFormat("https://x/genes.gff3.gz"), AnnotationFormat::kGff3);
    EXPECT_EQ(detectAnnotationFormat("https://x/Genes.GFF3"), AnnotationFormat::kGff3);
    EXPECT_EQ(detectAnnotationFormat("https://x/genes.gff.bz2"), AnnotationFormat::kGff);
    EXPECT_EQ(detectAnnotationFormat("https://x/genes.gtf.gz"), AnnotationFormat::kGtf);
    EXPECT_EQ(detectAnnotationFormat("https://x/genes.gff3.gz?download=1"),
              AnnotationFormat::kGff3);
    EXPECT_EQ(detectAnnotationFormat("https://x/genes.txt"), AnnotationFormat::kUnknown);
    EXPECT_EQ(detectAnnotationFormat(""), AnnotationFormat::kUnknown);
}

TEST(AnnotationFormatTest, GtfIsRejected) {
    try {
        (void)requireGffAnnotation("https://x/genes.gtf.gz", std::nullopt);
        FAIL() << "expected UnsupportedFormat";
    } catch (const UnsupportedFormat& e) {
        EXPECT_EQ(e.exitCode(), 5);
        EXPECT_NE(e.message().find("GTF"), std::string::npos);
    }
}

TEST(AnnotationFormatTest, UnknownSuffixIsRejected) {
    EXPECT_THROW((void)requireGffAnnotation("https://x/annotation", std::nullopt),
                 UnsupportedFormat);
}

TEST(AnnotationFormatTest, DeclaredFormatWinsOverUrl) {
    EXPECT_EQ(requireGffAnnotation("https://x/annotation?id=7", std::string("gff3")),
              AnnotationFormat::kGff3);
    EXPECT_THROW((void)requireGffAnnotation("https://x/genes.gff3", std::string("gtf")),
                 UnsupportedFormat);
    EXPECT_THROW((void)requireGffAnnotation("https://x/genes.gff3", std::string("bed")),
                 UnsupportedFormat);
}

// =============================================================================
// Feature Parsing
// =============================================================================

TEST(FeatureLineTest, ParsesSeqidAndStart) {
    auto feature = parseFeatureLine(featureLine("chr10", 12345, "g1"), 1);
    EXPECT_EQ(feature.seqid(), "chr10");
    EXPECT_EQ(feature.start, 12345u);
}

TEST(FeatureLineTest, TooFewColumnsIsFormatError) {
    EXPECT_THROW((void)parseFeatureLine("chr1\tsrc\tgene\t100", 3), FormatError);
}

TEST(FeatureLineTest, NonNumericStartIsFormatError) {
    EXPECT_THROW((void)parseFeatureLine("chr1\tsrc\tgene\tabc\t200\t.\t+\t.\tID=x", 1),
                 FormatError);
    EXPECT_THROW((void)parseFeatureLine("chr1\tsrc\tgene\t\t200\t.\t+\t.\tID=x", 1),
                 FormatError);
}

// =============================================================================
// Sorting
// =============================================================================

TEST(AnnotationSortTest, HeadersFirstThenSeqidAndStartOrder) {
    std::istringstream in("##gff-version 3\n" + featureLine("chr2", 500, "a") + "\n" +
                          featureLine("chr1", 100, "b") + "\n" + "#!genome-build TAIR10\n" +
                          featureLine("chr1", 50, "c") + "\n");

    auto sorted = sortAnnotation(in, "genes.gff3");

    ASSERT_EQ(sorted.headers.size(), 2u);
    EXPECT_EQ(sorted.headers[0], "##gff-version 3");
    EXPECT_EQ(sorted.headers[1], "#!genome-build TAIR10");
    EXPECT_EQ(featureTexts(sorted),
              (std::vector<std::string>{featureLine("chr1", 50, "c"),
                                        featureLine("chr1", 100, "b"),
                                        featureLine("chr2", 500, "a")}));
}

TEST(AnnotationSortTest, DropsEmbeddedFastaAndBlankLines) {
    std::istringstream in("##gff-version 3\r\n" + featureLine("chr1", 10, "a") + "\r\n\n" +
                          "##FASTA\n>chr1\nACGT\n");

    auto sorted = sortAnnotation(in, "genes.gff3");

    EXPECT_EQ(sorted.headers, std::vector<std::string>{"##gff-version 3"});
    ASSERT_EQ(sorted.features.size(), 1u);
    EXPECT_EQ(sorted.features[0].text, featureLine("chr1", 10, "a"));
    EXPECT_EQ(sorted.droppedFastaLines, 3u);
}

TEST(AnnotationSortTest, ErrorsNameSourceAndLine) {
    std::istringstream in("##gff-version 3\n" + featureLine("chr1", 10, "a") +
                          "\nchr1\tsrc\tgene\tx\t20\t.\t+\t.\tID=b\n");
    try {
        (void)sortAnnotation(in, "genes.gff3");
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        ASSERT_TRUE(e.context().has_value());
        EXPECT_EQ(e.context()->filePath, "genes.gff3");
        EXPECT_EQ(e.context()->lineNumber, 3u);
    }
}

TEST(AnnotationSortTest, SortFileWritesBgzf) {
    TempDir dir;
    const auto source = dir / "annotation.src";
    writeText(source, gzipString("##gff-version 3\n" + featureLine("chr2", 5, "a") + "\n" +
                                 featureLine("chr1", 7, "b") + "\n"));

    const auto stats = sortAnnotationFile(source, dir / "genes.gff3.gz", 6);
    EXPECT_EQ(stats.headerLines, 1u);
    EXPECT_EQ(stats.featureLines, 2u);

    io::CompressedInputStream in(dir / "genes.gff3.gz");
    std::ostringstream out;
    out << in.rdbuf();
    EXPECT_EQ(out.str(), "##gff-version 3\n" + featureLine("chr1", 7, "b") + "\n" +
                             featureLine("chr2", 5, "a") + "\n");
}

// =============================================================================
// Sorting Properties
// =============================================================================

RC_GTEST_PROP(AnnotationSortProperty, OutputIsSortedPermutationAndStable, ()) {
    const auto keys = *rc::gen::container<std::vector<std::pair<int, std::uint64_t>>>(
        rc::gen::pair(rc::gen::inRange(1, 4), rc::gen::inRange<std::uint64_t>(1, 50)));

    std::string text = "##gff-version 3\n";
    std::vector<std::tuple<std::string, std::uint64_t, std::size_t>> expected;
    for (std::size_t i = 0; i < keys.size(); ++i) {
        const auto seqid = std::format("chr{}", keys[i].first);
        text += featureLine(seqid, keys[i].second, std::to_string(i)) + "\n";
        expected.emplace_back(seqid, keys[i].second, i);
    }
    // Sorting by (seqid, start, input position) is what a stable sort produces
    std::sort(expected.begin(), expected.end());

    std::istringstream in(text);
    auto sorted = sortAnnotation(in, "generated");

    RC_ASSERT(sorted.headers.size() == 1u);
    RC_ASSERT(sorted.features.size() == keys.size());
    for (std::size_t i = 0; i < expected.size(); ++i) {
        const auto& [seqid, start, index] = expected[i];
        RC_ASSERT(sorted.features[i].text == featureLine(seqid, start, std::to_string(index)));
    }
}

}  // namespace
}  // namespace refcache::index
