#include <gtest/gtest.h>

// Standard
#include <algorithm>
#include <fstream>
#include <iterator>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// zlib
#include <zlib.h>

// Internal
#include "GeneAnnotationParser.hpp"
#include "MatchConfig.hpp"
#include "MatchScheduler.hpp"
#include "RegionReader.hpp"
#include "ResultWriter.hpp"
#include "TestFixtures.hpp"

using namespace pipelines::match;
using testing_helpers::TemporaryFile;

namespace {
auto syntheticAnnotation() -> std::string {
    std::mt19937 generator{42};
    std::uniform_int_distribution<int> gapDistribution{200, 4000};
    std::uniform_int_distribution<int> exonLengthDistribution{50, 600};
    std::uniform_int_distribution<int> exonCountDistribution{1, 5};

    std::ostringstream gtf;
    for (const std::string chromosome : {"chr1", "chr2"}) {
        int position = 500;
        for (int geneIndex = 0; geneIndex < 40; ++geneIndex) {
            const std::string geneID = chromosome + "_G" + std::to_string(geneIndex);
            const char strand = geneIndex % 3 == 0 ? '-' : '+';

            for (int transcriptIndex = 0; transcriptIndex < 2; ++transcriptIndex) {
                int exonStart = position + transcriptIndex * 100;
                const int exonCount = exonCountDistribution(generator);
                for (int exonIndex = 0; exonIndex < exonCount; ++exonIndex) {
                    const int exonEnd = exonStart + exonLengthDistribution(generator);
                    gtf << chromosome << "\ttest\texon\t" << exonStart << '\t' << exonEnd
                        << "\t.\t" << strand << "\t.\tgene_id \"" << geneID
                        << "\"; transcript_id \"" << geneID << ".t" << transcriptIndex
                        << "\";\n";
                    exonStart = exonEnd + gapDistribution(generator) / 4;
                }
            }
            // Some genes overlap their predecessor
            position += geneIndex % 4 == 0 ? 300 : gapDistribution(generator) * 2;
        }
    }
    return gtf.str();
}

auto syntheticRegions() -> std::string {
    std::mt19937 generator{7};
    std::uniform_int_distribution<int> positionDistribution{0, 120000};
    std::uniform_int_distribution<int> lengthDistribution{1, 3000};

    std::ostringstream bed;
    bed << "track name=synthetic\n";
    for (int i = 0; i < 400; ++i) {
        // Mostly sorted with occasional jumps back and chromosomes without genes
        const std::string chromosome = i % 50 == 49 ? "chrUn" : (i < 250 ? "chr1" : "chr2");
        const int start = i % 17 == 0 ? positionDistribution(generator) : (i % 250) * 450;
        bed << chromosome << '\t' << start << '\t' << start + lengthDistribution(generator);
        if (i % 5 == 0) {
            bed << "\tpeak" << i << '\t' << i % 1000;
        }
        bed << '\n';
    }
    return bed.str();
}

auto runMatch(const dataTypes::GeneAnnotation& geneAnnotation, const MatchConfig& config,
              const std::filesystem::path& regionsPath, size_t threadCount, size_t batchSize,
              MatchStatistics& statistics) -> std::string {
    const TemporaryFile output{".tsv"};
    {
        annotation::RegionReader reader{regionsPath};
        annotation::ResultWriter writer{output.path()};
        const MatchScheduler scheduler{geneAnnotation, config, threadCount, batchSize};
        statistics = scheduler.run(reader, writer);
    }
    return output.read();
}

auto lineCount(const std::string& text) -> size_t {
    return static_cast<size_t>(std::ranges::count(text, '\n'));
}
}  // namespace

class MatchSchedulerTest : public testing::TestWithParam<ReportLevel> {
   protected:
    void SetUp() override {
        geneAnnotation = annotation::GeneAnnotationParser{}.parse(gtf.path());
        geneAnnotation.sortGenes();
    }

    const TemporaryFile gtf{".gtf", syntheticAnnotation()};
    const TemporaryFile bed{".bed", syntheticRegions()};
    dataTypes::GeneAnnotation geneAnnotation;
};

TEST_P(MatchSchedulerTest, ParallelOutputEqualsSequentialOutput) {
    MatchConfig config;
    config.level = GetParam();
    config.tts = 150;
    config.distance = 5000;

    MatchStatistics sequentialStatistics;
    const std::string sequential =
        runMatch(geneAnnotation, config, bed.path(), 1, 7, sequentialStatistics);

    ASSERT_GT(lineCount(sequential), 1U);
    EXPECT_EQ(sequentialStatistics.regionCount, 400U);
    EXPECT_EQ(sequentialStatistics.lineCount + 1, lineCount(sequential));

    for (const size_t threadCount : {2U, 4U, 8U}) {
        for (const size_t batchSize : {1U, 7U, 5000U}) {
            MatchStatistics parallelStatistics;
            const std::string parallel = runMatch(geneAnnotation, config, bed.path(), threadCount,
                                                  batchSize, parallelStatistics);

            EXPECT_EQ(parallel, sequential)
                << threadCount << " threads, batch size " << batchSize;
            EXPECT_EQ(parallelStatistics.regionCount, sequentialStatistics.regionCount);
            EXPECT_EQ(parallelStatistics.lineCount, sequentialStatistics.lineCount);
        }
    }
}

INSTANTIATE_TEST_SUITE_P(MatchSchedulerTests, MatchSchedulerTest,
                         testing::Values(ReportLevel::EXON, ReportLevel::TRANSCRIPT,
                                         ReportLevel::GENE));

TEST(MatchSchedulerTests, EmptyRegionsWriteHeaderOnly) {
    const TemporaryFile gtf{
        ".gtf", "chr1\ttest\texon\t100\t200\t.\t+\t.\tgene_id \"G1\"; transcript_id \"T1\";\n"};
    const TemporaryFile bed{".bed", "track name=empty\n"};

    auto geneAnnotation = annotation::GeneAnnotationParser{}.parse(gtf.path());
    geneAnnotation.sortGenes();

    for (const size_t threadCount : {1U, 3U}) {
        MatchStatistics statistics;
        const std::string output =
            runMatch(geneAnnotation, MatchConfig{}, bed.path(), threadCount, 10, statistics);

        EXPECT_EQ(output, annotation::ResultWriter::formatHeader(0) + "\n");
        EXPECT_EQ(statistics.regionCount, 0U);
    }
}

TEST(MatchSchedulerTests, RegionsWithoutGenesProduceNoLines) {
    const TemporaryFile gtf{
        ".gtf", "chr1\ttest\texon\t100\t200\t.\t+\t.\tgene_id \"G1\"; transcript_id \"T1\";\n"};
    const TemporaryFile bed{".bed", "chr5\t100\t200\tpeak\nchr1\t150\t160\n"};

    auto geneAnnotation = annotation::GeneAnnotationParser{}.parse(gtf.path());
    geneAnnotation.sortGenes();

    MatchStatistics statistics;
    const std::string output =
        runMatch(geneAnnotation, MatchConfig{}, bed.path(), 1, 10, statistics);

    EXPECT_EQ(output, annotation::ResultWriter::formatHeader(1) + "\n" +
                          "chr1_150_160\t155\tG1\tT1\t1\t1st_EXON\t0\t55\t100.00\t10.89\n");
    EXPECT_EQ(statistics.regionCount, 2U);
    EXPECT_EQ(statistics.lineCount, 1U);
}

TEST(MatchSchedulerTests, ReadFailureReachesCaller) {
    const TemporaryFile gtf{
        ".gtf", "chr1\ttest\texon\t100\t200\t.\t+\t.\tgene_id \"G1\"; transcript_id \"T1\";\n"};
    const TemporaryFile bed{".bed.gz"};
    {
        gzFile compressed = gzopen(bed.path().c_str(), "wb");
        ASSERT_NE(compressed, nullptr);
        const std::string regions = syntheticRegions();
        for (int i = 0; i < 20; ++i) {
            gzputs(compressed, regions.c_str());
        }
        gzclose(compressed);
    }
    {
        std::ifstream in{bed.path(), std::ios::binary};
        std::string bytes{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
        in.close();
        std::ofstream out{bed.path(), std::ios::binary | std::ios::trunc};
        out << bytes.substr(0, bytes.size() / 2);
    }

    auto geneAnnotation = annotation::GeneAnnotationParser{}.parse(gtf.path());
    geneAnnotation.sortGenes();

    for (const size_t threadCount : {1U, 4U}) {
        MatchStatistics statistics;
        EXPECT_THROW(
            runMatch(geneAnnotation, MatchConfig{}, bed.path(), threadCount, 3, statistics),
            std::runtime_error)
            << threadCount << " threads";
    }
}
