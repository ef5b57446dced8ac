#pragma once

// Standard
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Internal
#include "Constants.hpp"
#include "GenomicArea.hpp"
#include "ReportLevel.hpp"

namespace pipelines::match {

/**
 * @brief Parameters of the region to gene association.
 *
 * All distances are in base pairs.
 */
struct MatchConfig {
    std::vector<dataTypes::Area> rules{dataTypes::allAreas.begin(), dataTypes::allAreas.end()};
    double percArea = constants::pipelines::defaultPercArea;
    double percRegion = constants::pipelines::defaultPercRegion;
    int64_t tss = constants::pipelines::defaultTssDistance;
    int64_t tts = constants::pipelines::defaultTtsDistance;
    int64_t promoter = constants::pipelines::defaultPromoterDistance;
    int64_t distance = constants::pipelines::defaultDistanceKb * constants::pipelines::basesPerKb;
    ReportLevel level = ReportLevel::EXON;

    /** @brief Upper bound of how far before a region an associated feature can end. */
    [[nodiscard]] auto maxLookbackDistance() const -> int64_t;

    /**
     * @brief Parses a comma separated priority list of all eight area tags.
     *
     * Tags are case sensitive and must each appear exactly once.
     * @return The ordered areas or std::nullopt if the list is not a permutation of all areas.
     */
    [[nodiscard]] static auto parseRules(const std::string &rulesString)
        -> std::optional<std::vector<dataTypes::Area>>;
};

}  // namespace pipelines::match
