#pragma once

// Standard
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// Internal
#include "Candidate.hpp"
#include "GeneModel.hpp"
#include "GenomicRegion.hpp"
#include "MatchConfig.hpp"
#include "ZoneChecker.hpp"

namespace pipelines::match {

/**
 * @brief Part of a region that falls into one intron or gene body exon of a transcript.
 */
struct Fragment {
    dataTypes::Candidate candidate;
    int64_t areaLength;
    int64_t overlap;
};

/**
 * @brief Collects fragments per gene/transcript key, keeping the order in which keys appear.
 */
class FragmentMap {
   public:
    void add(const std::string &key, Fragment fragment);

    /**
     * @brief Merges the fragments of every key into one candidate.
     *
     * Overlaps and area lengths are summed and the exon/intron labels comma joined. A key with a
     * single fragment yields that fragment's candidate unchanged.
     */
    [[nodiscard]] auto aggregate(int64_t regionLength) const -> std::vector<dataTypes::Candidate>;

    [[nodiscard]] auto empty() const -> bool { return groups.empty(); }

   private:
    std::vector<std::pair<std::string, std::vector<Fragment>>> groups;
    std::unordered_map<std::string, size_t> groupIndex;
};

/**
 * @brief Associates a region with the genes of its chromosome.
 *
 * Genes must be sorted by (start, id). Only genes from the given start index on are inspected.
 */
class OverlapClassifier {
   public:
    explicit OverlapClassifier(MatchConfig config)
        : config(std::move(config)),
          zoneChecker(this->config.tss, this->config.tts, this->config.promoter) {};
    OverlapClassifier(const OverlapClassifier &) = default;
    OverlapClassifier(OverlapClassifier &&) = delete;
    auto operator=(const OverlapClassifier &) -> OverlapClassifier & = delete;
    auto operator=(OverlapClassifier &&) -> OverlapClassifier & = delete;
    ~OverlapClassifier() = default;

    [[nodiscard]] auto classify(const dataTypes::GenomicRegion &region,
                                const std::vector<dataTypes::Gene> &genes,
                                size_t startIndex) const -> std::vector<dataTypes::Candidate>;

   private:
    const MatchConfig config;
    const ZoneChecker zoneChecker;

    void addTssZones(std::vector<dataTypes::Candidate> &candidates,
                     const dataTypes::GenomicRegion &region,
                     const dataTypes::Candidate &base) const;
    void addTtsZones(std::vector<dataTypes::Candidate> &candidates,
                     const dataTypes::GenomicRegion &region,
                     const dataTypes::Candidate &base) const;
};

}  // namespace pipelines::match
