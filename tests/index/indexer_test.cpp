// =============================================================================
// refcache - Indexer Tests
// =============================================================================
// Tests for the htslib indexer (sequence .fai/.gzi, annotation .tbi/.csi)
// and the subprocess runner behind the external-tool indexer.
// =============================================================================

#include "refcache/index/indexer.h"

#include <gtest/gtest.h>
#include <htslib/hts.h>
#include <htslib/kstring.h>
#include <htslib/tbx.h>

#include <cstdlib>
#include <format>
#include <string>

#include "refcache/format/bgzf_writer.h"
#include "refcache/index/annotation_sorter.h"
#include "test_support.h"

namespace refcache::index {
namespace {

using refcache::test::TempDir;
using refcache::test::readText;
using refcache::test::writeText;

void writeBgzf(const std::filesystem::path& path, const std::string& content) {
    format::BgzfWriter writer(path, 6);
    writer.write(content);
    writer.commit();
}

std::string gffLine(const std::string& seqid, int start, int end, const std::string& id) {
    return std::format("{}\tsrc\tgene\t{}\t{}\t.\t+\t.\tID={}\n", seqid, start, end, id);
}

/// @brief Count records overlapping `region` through the range index.
int countInRegion(const std::filesystem::path& gff, const char* region) {
    htsFile* fp = hts_open(gff.c_str(), "r");
    if (fp == nullptr) {
        return -1;
    }
    tbx_t* tbx = tbx_index_load(gff.c_str());
    if (tbx == nullptr) {
        hts_close(fp);
        return -1;
    }
    int count = 0;
    hts_itr_t* itr = tbx_itr_querys(tbx, region);
    if (itr != nullptr) {
        kstring_t line = {0, 0, nullptr};
        while (tbx_itr_next(fp, tbx, itr, &line) >= 0) {
            ++count;
        }
        std::free(line.s);
        tbx_itr_destroy(itr);
    }
    tbx_destroy(tbx);
    hts_close(fp);
    return count;
}

// =============================================================================
// Paths
// =============================================================================

TEST(IndexerTest, AnnotationIndexPathFollowsKind) {
    EXPECT_EQ(annotationIndexPath("/r/genes.gff3.gz", AnnotationIndexKind::kTbi),
              std::filesystem::path("/r/genes.gff3.gz.tbi"));
    EXPECT_EQ(annotationIndexPath("/r/genes.gff3.gz", AnnotationIndexKind::kCsi),
              std::filesystem::path("/r/genes.gff3.gz.csi"));
}

TEST(IndexerTest, FactoryHonorsBackend) {
    EXPECT_EQ(createIndexer(IndexerBackend::kHtslib)->name(), "htslib");
    EXPECT_EQ(createIndexer(IndexerBackend::kExternalTools)->name(), "tools");
}

// =============================================================================
// HtslibIndexer
// =============================================================================

TEST(HtslibIndexerTest, IndexesBgzfSequence) {
    TempDir dir;
    const auto fasta = dir / "genome.fa.gz";
    writeBgzf(fasta, ">chr1 first\nACGTACGT\nACGT\n>chr2\nGGGG\n");

    HtslibIndexer indexer;
    const auto files = indexer.indexSequence(fasta);

    EXPECT_EQ(files.fai, dir / "genome.fa.gz.fai");
    EXPECT_EQ(files.gzi, dir / "genome.fa.gz.gzi");
    ASSERT_TRUE(std::filesystem::exists(files.gzi));

    const auto fai = readText(files.fai);
    EXPECT_TRUE(fai.starts_with("chr1\t12\t12\t8\t9\n")) << fai;
    EXPECT_NE(fai.find("chr2\t4\t"), std::string::npos) << fai;
}

TEST(HtslibIndexerTest, PlainGzipSequenceIsToolFailure) {
    TempDir dir;
    const auto fasta = dir / "genome.fa.gz";
    writeText(fasta, refcache::test::gzipString(">chr1\nACGT\n"));

    HtslibIndexer indexer;
    EXPECT_THROW((void)indexer.indexSequence(fasta), ToolFailure);
}

TEST(HtslibIndexerTest, BuildsTabixIndexForSortedAnnotation) {
    TempDir dir;
    const auto gff = dir / "genes.gff3.gz";
    writeBgzf(gff, "##gff-version 3\n" + gffLine("chr1", 50, 80, "a") +
                       gffLine("chr1", 100, 200, "b") + gffLine("chr2", 10, 20, "c"));

    HtslibIndexer indexer;
    const auto index = indexer.indexAnnotation(gff, AnnotationIndexKind::kTbi);

    EXPECT_EQ(index, dir / "genes.gff3.gz.tbi");
    EXPECT_TRUE(std::filesystem::exists(index));
    EXPECT_EQ(countInRegion(gff, "chr1:1-90"), 1);
    EXPECT_EQ(countInRegion(gff, "chr1"), 2);
    EXPECT_EQ(countInRegion(gff, "chr2:1-100"), 1);
}

TEST(HtslibIndexerTest, BuildsCsiIndexWhenRequested) {
    TempDir dir;
    const auto gff = dir / "genes.gff3.gz";
    writeBgzf(gff, gffLine("chr1", 1, 10, "a") + gffLine("chr1", 300000000, 300000100, "big"));

    HtslibIndexer indexer;
    const auto index = indexer.indexAnnotation(gff, AnnotationIndexKind::kCsi);

    EXPECT_EQ(index, dir / "genes.gff3.gz.csi");
    EXPECT_TRUE(std::filesystem::exists(index));
    EXPECT_FALSE(std::filesystem::exists(dir / "genes.gff3.gz.tbi"));
    EXPECT_EQ(countInRegion(gff, "chr1:299999999-300000200"), 1);
}

TEST(HtslibIndexerTest, UnsortedAnnotationIsToolFailure) {
    TempDir dir;
    const auto gff = dir / "genes.gff3.gz";
    writeBgzf(gff, gffLine("chr1", 500, 600, "a") + gffLine("chr1", 10, 20, "b"));

    HtslibIndexer indexer;
    EXPECT_THROW((void)indexer.indexAnnotation(gff, AnnotationIndexKind::kTbi), ToolFailure);
}

TEST(HtslibIndexerTest, SorterOutputIsIndexable) {
    TempDir dir;
    writeText(dir / "annotation.src", "##gff-version 3\n" + gffLine("chr2", 5, 9, "a") +
                                          gffLine("chr1", 700, 900, "b") +
                                          gffLine("chr1", 7, 9, "c"));
    (void)sortAnnotationFile(dir / "annotation.src", dir / "genes.gff3.gz", 6);

    HtslibIndexer indexer;
    (void)indexer.indexAnnotation(dir / "genes.gff3.gz", AnnotationIndexKind::kTbi);
    EXPECT_EQ(countInRegion(dir / "genes.gff3.gz", "chr1"), 2);
}

// =============================================================================
// Subprocess Runner
// =============================================================================

TEST(RunToolTest, SuccessfulCommand) {
    EXPECT_NO_THROW(runTool({"true"}));
}

TEST(RunToolTest, NonZeroExitIsToolFailure) {
    try {
        runTool({"sh", "-c", "exit 3"});
        FAIL() << "expected ToolFailure";
    } catch (const ToolFailure& e) {
        ASSERT_TRUE(e.exitStatus().has_value());
        EXPECT_EQ(*e.exitStatus(), 3);
        EXPECT_EQ(e.exitCode(), 6);
    }
}

TEST(RunToolTest, MissingProgramIsToolFailure) {
    try {
        runTool({"/nonexistent/refcache-tool"});
        FAIL() << "expected ToolFailure";
    } catch (const ToolFailure& e) {
        EXPECT_EQ(e.exitStatus(), 127);
    }
}

TEST(ExternalToolIndexerTest, MissingSamtoolsIsToolFailure) {
    TempDir dir;
    writeBgzf(dir / "genome.fa.gz", ">chr1\nACGT\n");
    ExternalToolIndexer indexer("/nonexistent/samtools", "/nonexistent/tabix");
    EXPECT_THROW((void)indexer.indexSequence(dir / "genome.fa.gz"), ToolFailure);
    EXPECT_THROW((void)indexer.indexAnnotation(dir / "genome.fa.gz", AnnotationIndexKind::kTbi),
                 ToolFailure);
}

}  // namespace
}  // namespace refcache::index
