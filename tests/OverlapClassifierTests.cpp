#include <gtest/gtest.h>

// Standard
#include <algorithm>
#include <map>
#include <string>
#include <utility>
#include <vector>

// Internal
#include "Candidate.hpp"
#include "GeneModel.hpp"
#include "GenomicRegion.hpp"
#include "MatchConfig.hpp"
#include "OverlapClassifier.hpp"
#include "TestFixtures.hpp"

using namespace pipelines::match;
using dataTypes::Area;
using dataTypes::Candidate;
using dataTypes::GenomicRegion;
using dataTypes::Strand;
using testing_helpers::makeGene;

namespace {
auto countArea(const std::vector<Candidate>& candidates, Area area) -> size_t {
    return static_cast<size_t>(std::ranges::count_if(
        candidates, [area](const Candidate& candidate) { return candidate.area == area; }));
}
}  // namespace

class OverlapClassifierTest : public testing::Test {
   protected:
    const MatchConfig config{};
    const OverlapClassifier classifier{config};
};

TEST_F(OverlapClassifierTest, RegionPastSingleExonGeneIsDownstreamOnce) {
    const std::vector genes{makeGene("GENE001", Strand::FORWARD, {{{51, 150}}})};
    const GenomicRegion region{"chr1", 100, 200};

    const auto candidates = classifier.classify(region, genes, 0);

    EXPECT_EQ(countArea(candidates, Area::DOWNSTREAM), 1U);
    EXPECT_EQ(countArea(candidates, Area::FIRST_EXON), 1U);
    for (const auto& candidate : candidates) {
        EXPECT_EQ(candidate.geneID, "GENE001");
    }
}

TEST_F(OverlapClassifierTest, ContainedExonWithTailIsDownstreamOnce) {
    const std::vector genes{makeGene("GENE002", Strand::FORWARD, {{{1050, 1200}}})};
    const GenomicRegion region{"chr1", 1000, 1300};

    const auto candidates = classifier.classify(region, genes, 0);

    EXPECT_EQ(countArea(candidates, Area::DOWNSTREAM), 1U);
    EXPECT_EQ(countArea(candidates, Area::FIRST_EXON), 1U);
}

TEST_F(OverlapClassifierTest, RegionBetweenExonsIsIntron) {
    const std::vector genes{
        makeGene("GENE003", Strand::FORWARD, {{{1000, 1200}, {1400, 1600}}})};
    const GenomicRegion region{"chr1", 1250, 1350};

    const auto candidates = classifier.classify(region, genes, 0);

    ASSERT_EQ(candidates.size(), 1U);
    EXPECT_EQ(candidates[0].area, Area::INTRON);
    EXPECT_EQ(candidates[0].exonNumber, "1");
    EXPECT_DOUBLE_EQ(candidates[0].regionPercentage, 100.0);
    EXPECT_DOUBLE_EQ(candidates[0].areaPercentage, 101.0 / 199.0 * 100.0);
}

TEST_F(OverlapClassifierTest, ReverseStrandIntronNumbering) {
    const std::vector genes{
        makeGene("GENE004", Strand::REVERSE, {{{1000, 1200}, {1400, 1600}, {1800, 2000}}})};
    const GenomicRegion region{"chr1", 1250, 1350};

    const auto candidates = classifier.classify(region, genes, 0);

    ASSERT_EQ(candidates.size(), 1U);
    EXPECT_EQ(candidates[0].area, Area::INTRON);
    EXPECT_EQ(candidates[0].exonNumber, "2");
}

TEST_F(OverlapClassifierTest, FragmentsAreAggregatedPerTranscript) {
    const std::vector genes{makeGene(
        "GENE005", Strand::FORWARD, {{{100, 200}, {300, 400}, {500, 600}, {700, 800}}})};
    const GenomicRegion region{"chr1", 250, 650};

    const auto candidates = classifier.classify(region, genes, 0);

    ASSERT_EQ(countArea(candidates, Area::GENE_BODY), 1U);
    ASSERT_EQ(countArea(candidates, Area::INTRON), 1U);

    const auto geneBody = std::ranges::find(candidates, Area::GENE_BODY, &Candidate::area);
    EXPECT_EQ(geneBody->exonNumber, "2,3");
    EXPECT_DOUBLE_EQ(geneBody->regionPercentage, 202.0 / 401.0 * 100.0);
    EXPECT_DOUBLE_EQ(geneBody->areaPercentage, 100.0);

    const auto intron = std::ranges::find(candidates, Area::INTRON, &Candidate::area);
    EXPECT_EQ(intron->exonNumber, "1,2,3");
    EXPECT_DOUBLE_EQ(intron->regionPercentage, 199.0 / 401.0 * 100.0);
    EXPECT_DOUBLE_EQ(intron->areaPercentage, 199.0 / 297.0 * 100.0);

    // Every base of the region is accounted for by exactly one fragment
    EXPECT_NEAR(geneBody->regionPercentage + intron->regionPercentage, 100.0, 1e-9);
}

TEST_F(OverlapClassifierTest, NearestFlankingGeneWins) {
    const std::vector genes{makeGene("GENE006", Strand::FORWARD, {{{1000, 2000}}}),
                            makeGene("GENE007", Strand::FORWARD, {{{8000, 9000}}})};
    const GenomicRegion region{"chr1", 5000, 5100};

    const auto candidates = classifier.classify(region, genes, 0);

    ASSERT_EQ(candidates.size(), 1U);
    EXPECT_EQ(candidates[0].geneID, "GENE007");
    EXPECT_EQ(candidates[0].area, Area::UPSTREAM);
    EXPECT_EQ(candidates[0].distance, 2950);
    EXPECT_DOUBLE_EQ(candidates[0].areaPercentage, -1.0);
}

TEST_F(OverlapClassifierTest, DownstreamGeneWithinDistance) {
    const std::vector genes{makeGene("GENE008", Strand::FORWARD, {{{1000, 2000}}}),
                            makeGene("GENE009", Strand::FORWARD, {{{9000, 9500}}})};
    const GenomicRegion region{"chr1", 3000, 3100};

    const auto candidates = classifier.classify(region, genes, 0);

    ASSERT_EQ(candidates.size(), 1U);
    EXPECT_EQ(candidates[0].geneID, "GENE008");
    EXPECT_EQ(candidates[0].area, Area::DOWNSTREAM);
    EXPECT_EQ(candidates[0].distance, 1050);
}

TEST_F(OverlapClassifierTest, GenesBeyondDistanceAreNotReported) {
    MatchConfig shortRange;
    shortRange.distance = 1000;
    const OverlapClassifier shortClassifier{shortRange};

    const std::vector genes{makeGene("GENE010", Strand::FORWARD, {{{8000, 9000}}})};
    const GenomicRegion region{"chr1", 5000, 5100};

    EXPECT_TRUE(shortClassifier.classify(region, genes, 0).empty());
}

TEST_F(OverlapClassifierTest, RegionInsideFirstExon) {
    const std::vector genes{makeGene("GENE011", Strand::REVERSE, {{{100, 200}, {400, 600}}})};
    const GenomicRegion region{"chr1", 450, 500};

    const auto candidates = classifier.classify(region, genes, 0);

    ASSERT_EQ(candidates.size(), 1U);
    EXPECT_EQ(candidates[0].area, Area::FIRST_EXON);
    EXPECT_EQ(candidates[0].exonNumber, "1");
    EXPECT_DOUBLE_EQ(candidates[0].regionPercentage, 100.0);
    EXPECT_EQ(candidates[0].tssDistance, 600 - 475);
}

TEST_F(OverlapClassifierTest, NoDuplicateFlankAreaPerTranscript) {
    const std::vector genes{
        makeGene("GENE012", Strand::FORWARD, {{{51, 150}}, {{60, 120}, {130, 150}}}),
        makeGene("GENE013", Strand::REVERSE, {{{300, 400}}, {{320, 380}}})};
    const GenomicRegion region{"chr1", 100, 250};

    const auto candidates = classifier.classify(region, genes, 0);

    std::map<std::pair<std::string, std::string>, std::map<Area, size_t>> areaCounts;
    for (const auto& candidate : candidates) {
        ++areaCounts[{candidate.geneID, candidate.transcriptID}][candidate.area];
    }

    for (const auto& [key, counts] : areaCounts) {
        for (const Area area : {Area::UPSTREAM, Area::DOWNSTREAM}) {
            const auto count = counts.contains(area) ? counts.at(area) : 0U;
            EXPECT_LE(count, 1U) << key.first << " " << key.second;
        }
    }
}

TEST_F(OverlapClassifierTest, TranscriptsWithoutExonsAreSkipped) {
    dataTypes::Gene gene{"GENE014", Strand::FORWARD};
    gene.transcripts.emplace_back("GENE014.t1");
    gene.setBoundaries(100, 200);

    const std::vector genes{gene};
    const GenomicRegion region{"chr1", 120, 180};

    EXPECT_TRUE(classifier.classify(region, genes, 0).empty());
}

TEST_F(OverlapClassifierTest, GeneBodyOverlapDoesNotHideLaterFlankingGene) {
    const auto overlapped = makeGene("GENE015", Strand::FORWARD, {{{900, 1200}}});
    const auto flanking = makeGene("GENE016", Strand::FORWARD, {{{1150, 1300}}});
    const std::vector genes{overlapped, flanking};
    const GenomicRegion region{"chr1", 1000, 1100};

    const auto candidates = classifier.classify(region, genes, 0);

    ASSERT_EQ(candidates.size(), 2U);

    const auto findGene = [&candidates](const std::string& geneID) {
        return std::ranges::find_if(candidates, [&geneID](const Candidate& candidate) {
            return candidate.geneID == geneID;
        });
    };

    const auto exonHit = findGene("GENE015");
    ASSERT_NE(exonHit, candidates.end());
    EXPECT_EQ(exonHit->area, Area::FIRST_EXON);
    EXPECT_DOUBLE_EQ(exonHit->regionPercentage, 100.0);
    EXPECT_DOUBLE_EQ(exonHit->areaPercentage, 101.0 / 301.0 * 100.0);

    const auto tssHit = findGene("GENE016");
    ASSERT_NE(tssHit, candidates.end());
    EXPECT_EQ(tssHit->area, Area::TSS);
    EXPECT_EQ(tssHit->distance, 100);
    EXPECT_DOUBLE_EQ(tssHit->regionPercentage, 100.0);
    EXPECT_DOUBLE_EQ(tssHit->areaPercentage, 101.0 / 200.0 * 100.0);

    // Each gene scanned on its own yields the same association as the joint scan
    for (const auto& gene : genes) {
        const auto alone = classifier.classify(region, std::vector{gene}, 0);
        ASSERT_EQ(alone.size(), 1U);
        const auto joint = findGene(gene.id);
        EXPECT_EQ(alone[0].area, joint->area);
        EXPECT_EQ(alone[0].distance, joint->distance);
        EXPECT_DOUBLE_EQ(alone[0].areaPercentage, joint->areaPercentage);
    }
}
