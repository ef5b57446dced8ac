#pragma once

// Standard
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

// Internal
#include "Candidate.hpp"
#include "GenomicArea.hpp"
#include "MatchConfig.hpp"

namespace pipelines::match {

// Group key to candidate positions
using CandidateGroups = std::unordered_map<std::string, std::vector<size_t>>;

/**
 * @brief Resolves ties between the candidates of a region.
 */
class RuleEngine {
   public:
    explicit RuleEngine(const MatchConfig &config)
        : percRegion(config.percRegion),
          percArea(config.percArea),
          rules(config.rules),
          level(config.level) {};
    RuleEngine(const RuleEngine &) = default;
    RuleEngine(RuleEngine &&) = default;
    auto operator=(const RuleEngine &) -> RuleEngine & = delete;
    auto operator=(RuleEngine &&) -> RuleEngine & = delete;
    ~RuleEngine() = default;

    /**
     * @brief Reduces the candidates of one region to the configured report level.
     *
     * Exon level keeps every candidate, transcript level keeps the best candidates per
     * transcript and gene level additionally merges the best transcripts per gene.
     */
    [[nodiscard]] auto reduce(std::vector<dataTypes::Candidate> candidates) const
        -> std::vector<dataTypes::Candidate>;

    /**
     * @brief Selects the best candidates of every group.
     *
     * A group is narrowed down by the region percentage threshold, the area percentage threshold
     * and the maximum region percentage. A threshold that removes every candidate is ignored.
     * Remaining ties are decided by the first rule any candidate matches; all candidates matching
     * that rule are kept.
     */
    [[nodiscard]] auto applyRules(const std::vector<dataTypes::Candidate> &candidates,
                                  const CandidateGroups &groups) const
        -> std::vector<dataTypes::Candidate>;

    /**
     * @brief Merges the candidates of every gene group into the best area.
     *
     * Falls back to the area of the first candidate if no rule matches. Several candidates of the
     * winning area are merged into one.
     */
    [[nodiscard]] auto selectTranscript(const std::vector<dataTypes::Candidate> &candidates,
                                        const CandidateGroups &groups) const
        -> std::vector<dataTypes::Candidate>;

    [[nodiscard]] static auto groupByTranscript(const std::vector<dataTypes::Candidate> &candidates)
        -> CandidateGroups;
    [[nodiscard]] static auto groupByGene(const std::vector<dataTypes::Candidate> &candidates)
        -> CandidateGroups;

   private:
    const double percRegion;
    const double percArea;
    const std::vector<dataTypes::Area> rules;
    const ReportLevel level;

    /**
     * @brief Group keys in order of their first appearance, followed by the remaining keys in
     * lexicographic order.
     */
    template <typename KeyProjection>
    [[nodiscard]] static auto orderGroupKeys(const std::vector<dataTypes::Candidate> &candidates,
                                             const CandidateGroups &groups,
                                             KeyProjection keyOf) -> std::vector<std::string>;
};

}  // namespace pipelines::match
