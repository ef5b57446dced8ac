#pragma once

// Standard
#include <cstdint>
#include <string>

// Internal
#include "GenomicArea.hpp"
#include "GenomicStrand.hpp"

namespace dataTypes {

// Area percentage of zones without a finite width
constexpr double notApplicablePercentage = -1.0;

/**
 * @brief A classified association between a region and one exon or intron of a transcript.
 */
struct Candidate {
    int64_t exonStart;
    int64_t exonEnd;
    Strand strand;
    std::string exonNumber;
    Area area;
    std::string transcriptID;
    std::string geneID;
    int64_t distance;
    double regionPercentage;
    double areaPercentage;
    int64_t tssDistance;

    [[nodiscard]] auto withZone(Area zoneArea, double zoneRegionPercentage,
                                double zoneAreaPercentage) const -> Candidate {
        Candidate zoneCandidate = *this;
        zoneCandidate.area = zoneArea;
        zoneCandidate.regionPercentage = zoneRegionPercentage;
        zoneCandidate.areaPercentage = zoneAreaPercentage;
        return zoneCandidate;
    }
};

}  // namespace dataTypes
