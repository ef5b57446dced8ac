#include <gtest/gtest.h>

// Standard
#include <stdexcept>
#include <string>

// zlib
#include <zlib.h>

// Internal
#include "GeneAnnotationParser.hpp"
#include "GeneModel.hpp"
#include "GenomicStrand.hpp"
#include "TestFixtures.hpp"

using namespace annotation;
using testing_helpers::TemporaryFile;

namespace {
const std::string annotationContent =
    "#!genome-build test\n"
    "chr1\ttest\tgene\t1000\t5000\t.\t+\t.\tgene_id \"G1\"; gene_name \"Alpha\";\n"
    "chr1\ttest\ttranscript\t1000\t3000\t.\t+\t.\tgene_id \"G1\"; transcript_id \"T1\";\n"
    "chr1\ttest\texon\t2500\t3000\t.\t+\t.\tgene_id \"G1\"; transcript_id \"T1\";\n"
    "chr1\ttest\texon\t1000\t1200\t.\t+\t.\tgene_id \"G1\"; transcript_id \"T1\";\n"
    "chr1\ttest\tCDS\t1100\t1200\t.\t+\t0\tgene_id \"G1\"; transcript_id \"T1\";\n"
    "chr1\ttest\texon\t4000\t4500\t.\t+\t.\tgene_id \"G1\"; transcript_id \"T2\";\n"
    "chr2\ttest\texon\t100\t200\t.\t-\t.\tgene_id \"G2\"; transcript_id \"T3\";\n"
    "chr2\ttest\texon\t400\t600\t.\t-\t.\tgene_id \"G2\"; transcript_id \"T3\";\n"
    "chr2\ttest\texon\t50\t80\t.\t.\t.\tgene_id \"G3\"; transcript_id \"T4\";\n"
    "chr2\ttest\texon\t90\n";
}  // namespace

TEST(GeneAnnotationParserTests, BuildsGeneModel) {
    const TemporaryFile gtf{".gtf", annotationContent};

    const auto annotation = GeneAnnotationParser{}.parse(gtf.path());

    EXPECT_EQ(annotation.geneCount(), 2U);
    ASSERT_EQ(annotation.chromosomeOrder.size(), 2U);
    EXPECT_EQ(annotation.chromosomeOrder[0], "chr1");

    const auto* chr1 = annotation.genes("chr1");
    ASSERT_NE(chr1, nullptr);
    ASSERT_EQ(chr1->size(), 1U);

    const auto& gene = chr1->front();
    EXPECT_EQ(gene.id, "G1");
    EXPECT_EQ(gene.strand, dataTypes::Strand::FORWARD);
    EXPECT_EQ(gene.startPosition, 1000);
    EXPECT_EQ(gene.endPosition, 5000);
    ASSERT_EQ(gene.transcripts.size(), 2U);

    const auto& first = gene.transcripts[0];
    EXPECT_EQ(first.id, "T1");
    EXPECT_EQ(first.startPosition, 1000);
    EXPECT_EQ(first.endPosition, 3000);
    ASSERT_EQ(first.exons.size(), 2U);
    EXPECT_EQ(first.exons[0].startPosition, 1000);
    EXPECT_EQ(first.exons[0].exonNumber, "1");
    EXPECT_EQ(first.exons[1].exonNumber, "2");

    const auto& second = gene.transcripts[1];
    EXPECT_EQ(second.startPosition, 4000);
    EXPECT_EQ(second.endPosition, 4500);

    EXPECT_EQ(annotation.maxLength("chr1"), 4000);
    EXPECT_EQ(annotation.genes("chrX"), nullptr);
}

TEST(GeneAnnotationParserTests, ReverseStrandExonsCountFromTheRight) {
    const TemporaryFile gtf{".gtf", annotationContent};

    const auto annotation = GeneAnnotationParser{}.parse(gtf.path());

    const auto* chr2 = annotation.genes("chr2");
    ASSERT_NE(chr2, nullptr);
    ASSERT_EQ(chr2->size(), 1U);

    const auto& transcript = chr2->front().transcripts.front();
    EXPECT_EQ(transcript.exons[0].exonNumber, "2");
    EXPECT_EQ(transcript.exons[1].exonNumber, "1");
    EXPECT_EQ(chr2->front().startPosition, 100);
    EXPECT_EQ(chr2->front().endPosition, 600);
}

TEST(GeneAnnotationParserTests, CustomAttributeKeys) {
    const TemporaryFile gtf{
        ".gtf",
        "chr1\ttest\texon\t10\t20\t.\t+\t.\tgene_name \"Alpha\"; tx \"A1\"; gene_id \"G1\";\n"};

    const auto annotation = GeneAnnotationParser{"gene_name", "tx"}.parse(gtf.path());

    ASSERT_NE(annotation.genes("chr1"), nullptr);
    EXPECT_EQ(annotation.genes("chr1")->front().id, "Alpha");
    EXPECT_EQ(annotation.genes("chr1")->front().transcripts.front().id, "A1");
}

TEST(GeneAnnotationParserTests, MissingTranscriptIdIsAnError) {
    const TemporaryFile gtf{".gtf", "chr1\ttest\texon\t10\t20\t.\t+\t.\tgene_id \"G1\";\n"};

    EXPECT_THROW(static_cast<void>(GeneAnnotationParser{}.parse(gtf.path())), std::runtime_error);
}

TEST(GeneAnnotationParserTests, MalformedCoordinatesAreAnError) {
    const TemporaryFile gtf{
        ".gtf", "chr1\ttest\texon\tten\t20\t.\t+\t.\tgene_id \"G1\"; transcript_id \"T1\";\n"};

    EXPECT_THROW(static_cast<void>(GeneAnnotationParser{}.parse(gtf.path())), std::runtime_error);
}

TEST(GeneAnnotationParserTests, MissingFileIsAnError) {
    EXPECT_THROW(static_cast<void>(GeneAnnotationParser{}.parse("/nonexistent/annotation.gtf")),
                 std::runtime_error);
}

TEST(GeneAnnotationParserTests, ReadsGzipCompressedAnnotation) {
    const TemporaryFile gtf{".gtf.gz"};
    gzFile compressed = gzopen(gtf.path().c_str(), "wb");
    ASSERT_NE(compressed, nullptr);
    gzputs(compressed, annotationContent.c_str());
    gzclose(compressed);

    const auto annotation = GeneAnnotationParser{}.parse(gtf.path());

    EXPECT_EQ(annotation.geneCount(), 2U);
}

TEST(GeneAnnotationParserTests, ExtractAttribute) {
    const std::string attributes = "gene_id \"G1\"; transcript_id \"T1\"; gene_name \"A\";";

    EXPECT_EQ(GeneAnnotationParser::extractAttribute(attributes, "transcript_id"), "T1");
    EXPECT_EQ(GeneAnnotationParser::extractAttribute(attributes, "gene_name"), "A");
    EXPECT_FALSE(GeneAnnotationParser::extractAttribute(attributes, "exon_id").has_value());
}
