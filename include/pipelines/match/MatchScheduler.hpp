#pragma once

// Standard
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

// Internal
#include "Candidate.hpp"
#include "GeneModel.hpp"
#include "GenomicRegion.hpp"
#include "MatchConfig.hpp"
#include "OverlapClassifier.hpp"
#include "RegionReader.hpp"
#include "ResultWriter.hpp"
#include "RuleEngine.hpp"
#include "SearchCursor.hpp"

namespace pipelines::match {

struct RegionResult {
    dataTypes::GenomicRegion region;
    std::vector<dataTypes::Candidate> candidates;
};

struct WorkChunk {
    size_t sequenceNumber{0};
    std::vector<dataTypes::GenomicRegion> regions;
};

struct MatchedChunk {
    size_t sequenceNumber{0};
    size_t regionCount{0};
    std::vector<RegionResult> results;
    double matchingMilliseconds{0.0};
};

struct MatchStatistics {
    size_t regionCount{0};
    size_t lineCount{0};
    double matchingMilliseconds{0.0};
    size_t maxPendingChunks{0};

    void operator+=(const MatchStatistics &other) {
        regionCount += other.regionCount;
        lineCount += other.lineCount;
        matchingMilliseconds += other.matchingMilliseconds;
        maxPendingChunks = std::max(maxPendingChunks, other.maxPendingChunks);
    }
};

/**
 * @brief Streams regions through the matcher and writes the results in input order.
 *
 * With a single thread chunks are matched and written in turn. Otherwise a producer hands chunks
 * to a pool of workers through a bounded queue and a writer reorders the matched chunks by their
 * sequence number, so the output is identical for every thread count.
 */
class MatchScheduler {
   public:
    MatchScheduler(const dataTypes::GeneAnnotation &annotation, const MatchConfig &config,
                   size_t threadCount, size_t batchSize)
        : geneAnnotation(annotation),
          lookbackDistance(config.maxLookbackDistance()),
          classifier(config),
          ruleEngine(config),
          threadCount(std::max<size_t>(threadCount, 1)),
          batchSize(std::max<size_t>(batchSize, 1)) {};
    MatchScheduler(const MatchScheduler &) = delete;
    MatchScheduler(MatchScheduler &&) = delete;
    auto operator=(const MatchScheduler &) -> MatchScheduler & = delete;
    auto operator=(MatchScheduler &&) -> MatchScheduler & = delete;
    ~MatchScheduler() = default;

    /**
     * @brief Matches every region of the reader and writes the associations.
     * @throws std::runtime_error on the first read, match or write failure of any thread.
     */
    auto run(annotation::RegionReader &reader, annotation::ResultWriter &writer) const
        -> MatchStatistics;

    /** @brief Matches a single region, moving the cursor along. */
    [[nodiscard]] auto matchRegion(const dataTypes::GenomicRegion &region,
                                   SearchCursor &cursor) const -> std::vector<dataTypes::Candidate>;

   private:
    const dataTypes::GeneAnnotation &geneAnnotation;
    const int64_t lookbackDistance;
    const OverlapClassifier classifier;
    const RuleEngine ruleEngine;
    const size_t threadCount;
    const size_t batchSize;

    auto runSequential(annotation::RegionReader &reader, annotation::ResultWriter &writer) const
        -> MatchStatistics;
    auto runParallel(annotation::RegionReader &reader, annotation::ResultWriter &writer) const
        -> MatchStatistics;

    auto matchChunk(std::vector<dataTypes::GenomicRegion> regions, SearchCursor &cursor) const
        -> MatchedChunk;

    static auto writeChunk(annotation::ResultWriter &writer, const MatchedChunk &chunk) -> size_t;
};

}  // namespace pipelines::match
