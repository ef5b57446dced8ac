#pragma once
// Standard
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace constants::pipelines {
const std::string GENERAL_DESCRIPTION =
    "RegionMatch associates genomic regions with the genes they overlap or lie near.\n\nMinimum "
    "call: RegionMatch -g <annotation-gtf> -b <regions-bed> -o <output-file>\nOr run "
    "RegionMatch with a config file: RegionMatch -c <config-file>\n\nGeneral Options";
const std::string MATCH_DESCRIPTION = "Matching Options";

const std::string DEFAULT_RULES = "TSS,1st_EXON,PROMOTER,TTS,INTRON,GENE_BODY,UPSTREAM,DOWNSTREAM";

// Match defaults
constexpr int64_t basesPerKb = 1000;
// Upper bound for every configured distance, keeps coordinate sums far from overflow
constexpr int64_t maxDistanceBp = 1'000'000'000'000;
constexpr int64_t maxDistanceKb = maxDistanceBp / basesPerKb;
constexpr int64_t defaultDistanceKb = 10;
constexpr int64_t defaultTssDistance = 200;
constexpr int64_t defaultTtsDistance = 0;
constexpr int64_t defaultPromoterDistance = 1300;
constexpr double defaultPercArea = 90.0;
constexpr double defaultPercRegion = 50.0;

// Scheduling defaults
constexpr size_t defaultThreadCount = 8;
constexpr size_t defaultBatchSize = 5000;
constexpr size_t workQueueCapacity = 100;
constexpr size_t resultQueueCapacity = 2000;
}  // namespace constants::pipelines

namespace constants::annotation {
constexpr size_t expectedGtfFileTokenCount = 9;
constexpr size_t featureTypeTokenColumn = 2;
constexpr size_t startTokenColumn = 3;
constexpr size_t endTokenColumn = 4;
constexpr size_t strandTokenColumn = 6;
constexpr size_t attributeTokenColumn = 8;

const std::string DEFAULT_GENE_ID_KEY = "gene_id";
const std::string DEFAULT_TRANSCRIPT_ID_KEY = "transcript_id";

constexpr size_t minimumBedTokenCount = 3;
constexpr size_t maximumBedMetadataColumns = 9;
const std::array<std::string, maximumBedMetadataColumns> bedMetadataHeaders{
    "name",     "score",      "strand",     "thickStart", "thickEnd",
    "itemRgb",  "blockCount", "blockSizes", "blockStarts"};
}  // namespace constants::annotation

namespace constants::output {
const std::string BASE_HEADER =
    "Region\tMidpoint\tGene\tTranscript\tExon/Intron\tArea\tDistance\tTSSDistance\tPercRegion\t"
    "PercArea";
constexpr int percentagePrecision = 2;
}  // namespace constants::output
