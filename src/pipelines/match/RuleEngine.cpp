#include "RuleEngine.hpp"

// Standard
#include <algorithm>
#include <iterator>
#include <map>
#include <unordered_set>

namespace pipelines::match {

using dataTypes::Area;
using dataTypes::Candidate;

template <typename KeyProjection>
auto RuleEngine::orderGroupKeys(const std::vector<Candidate> &candidates,
                                const CandidateGroups &groups,
                                KeyProjection keyOf) -> std::vector<std::string> {
    std::vector<std::string> keyOrder;
    std::unordered_set<std::string> seenKeys;

    for (const auto &candidate : candidates) {
        const std::string &key = keyOf(candidate);
        if (groups.contains(key) && !seenKeys.contains(key)) {
            seenKeys.insert(key);
            keyOrder.push_back(key);
        }
    }

    std::vector<std::string> remainingKeys;
    for (const auto &[key, positions] : groups) {
        if (!seenKeys.contains(key)) {
            remainingKeys.push_back(key);
        }
    }
    std::ranges::sort(remainingKeys);
    keyOrder.insert(keyOrder.end(), remainingKeys.begin(), remainingKeys.end());

    return keyOrder;
}

auto RuleEngine::reduce(std::vector<Candidate> candidates) const -> std::vector<Candidate> {
    if (candidates.empty() || level == ReportLevel::EXON) {
        return candidates;
    }

    auto bestPerTranscript = applyRules(candidates, groupByTranscript(candidates));

    if (level == ReportLevel::TRANSCRIPT) {
        return bestPerTranscript;
    }

    return selectTranscript(bestPerTranscript, groupByGene(bestPerTranscript));
}

auto RuleEngine::applyRules(const std::vector<Candidate> &candidates,
                            const CandidateGroups &groups) const -> std::vector<Candidate> {
    std::vector<Candidate> selected;

    const auto keyOrder = orderGroupKeys(
        candidates, groups,
        [](const Candidate &candidate) -> const std::string & { return candidate.transcriptID; });

    for (const auto &key : keyOrder) {
        const auto &positions = groups.at(key);

        if (positions.size() == 1) {
            selected.push_back(candidates[positions.front()]);
            continue;
        }

        std::vector<const Candidate *> regionSurvivors;
        for (const size_t position : positions) {
            if (candidates[position].regionPercentage >= percRegion) {
                regionSurvivors.push_back(&candidates[position]);
            }
        }

        if (regionSurvivors.size() == 1) {
            selected.push_back(*regionSurvivors.front());
            continue;
        }

        if (regionSurvivors.empty()) {
            for (const size_t position : positions) {
                regionSurvivors.push_back(&candidates[position]);
            }
        }

        std::vector<const Candidate *> areaSurvivors;
        std::ranges::copy_if(regionSurvivors, std::back_inserter(areaSurvivors),
                             [this](const Candidate *candidate) {
                                 return candidate->areaPercentage >= percArea;
                             });

        if (areaSurvivors.size() == 1) {
            selected.push_back(*areaSurvivors.front());
            continue;
        }

        if (areaSurvivors.empty()) {
            areaSurvivors = regionSurvivors;
        }

        double maximumRegionPercentage = 0.0;
        for (const Candidate *candidate : areaSurvivors) {
            maximumRegionPercentage =
                std::max(maximumRegionPercentage, candidate->regionPercentage);
        }

        std::vector<const Candidate *> bestCovering;
        std::ranges::copy_if(areaSurvivors, std::back_inserter(bestCovering),
                             [maximumRegionPercentage](const Candidate *candidate) {
                                 return candidate->regionPercentage == maximumRegionPercentage;
                             });

        if (bestCovering.size() == 1) {
            selected.push_back(*bestCovering.front());
            continue;
        }

        // True ties at the first matching rule are all reported
        for (const Area rule : rules) {
            bool ruleMatched = false;
            for (const Candidate *candidate : bestCovering) {
                if (candidate->area == rule) {
                    selected.push_back(*candidate);
                    ruleMatched = true;
                }
            }
            if (ruleMatched) {
                break;
            }
        }
    }

    return selected;
}

auto RuleEngine::selectTranscript(const std::vector<Candidate> &candidates,
                                  const CandidateGroups &groups) const -> std::vector<Candidate> {
    std::vector<Candidate> selected;

    const auto keyOrder = orderGroupKeys(
        candidates, groups,
        [](const Candidate &candidate) -> const std::string & { return candidate.geneID; });

    for (const auto &key : keyOrder) {
        const auto &positions = groups.at(key);

        if (positions.empty()) [[unlikely]] {
            continue;
        }

        if (positions.size() == 1) {
            selected.push_back(candidates[positions.front()]);
            continue;
        }

        std::map<Area, std::vector<size_t>> positionsByArea;
        for (const size_t position : positions) {
            positionsByArea[candidates[position].area].push_back(position);
        }

        Area winningArea = candidates[positions.front()].area;
        for (const Area rule : rules) {
            if (positionsByArea.contains(rule)) {
                winningArea = rule;
                break;
            }
        }

        const auto &winners = positionsByArea.at(winningArea);

        if (winners.size() == 1) {
            selected.push_back(candidates[winners.front()]);
            continue;
        }

        std::string transcriptIDs;
        std::string exonNumbers;
        // Open zones keep the -1 area sentinel
        double maximumRegionPercentage = candidates[winners.front()].regionPercentage;
        double maximumAreaPercentage = candidates[winners.front()].areaPercentage;

        for (size_t i = 0; i < winners.size(); ++i) {
            const Candidate &candidate = candidates[winners[i]];
            if (i > 0) {
                transcriptIDs += ',';
                exonNumbers += ',';
            }
            transcriptIDs += candidate.transcriptID;
            exonNumbers += candidate.exonNumber;
            maximumRegionPercentage =
                std::max(maximumRegionPercentage, candidate.regionPercentage);
            maximumAreaPercentage = std::max(maximumAreaPercentage, candidate.areaPercentage);
        }

        Candidate merged = candidates[winners.front()];
        merged.transcriptID = std::move(transcriptIDs);
        merged.exonNumber = std::move(exonNumbers);
        merged.regionPercentage = maximumRegionPercentage;
        merged.areaPercentage = maximumAreaPercentage;
        selected.push_back(std::move(merged));
    }

    return selected;
}

auto RuleEngine::groupByTranscript(const std::vector<Candidate> &candidates) -> CandidateGroups {
    CandidateGroups groups;
    for (size_t i = 0; i < candidates.size(); ++i) {
        groups[candidates[i].transcriptID].push_back(i);
    }
    return groups;
}

auto RuleEngine::groupByGene(const std::vector<Candidate> &candidates) -> CandidateGroups {
    CandidateGroups groups;
    for (size_t i = 0; i < candidates.size(); ++i) {
        groups[candidates[i].geneID].push_back(i);
    }
    return groups;
}

}  // namespace pipelines::match
