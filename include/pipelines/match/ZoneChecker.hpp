#pragma once

// Standard
#include <cstdint>
#include <vector>

// Internal
#include "GenomicArea.hpp"
#include "GenomicStrand.hpp"

namespace pipelines::match {

/**
 * @brief Boundary exon a region is measured against.
 *
 * The distance is the distance of the region to the exon (0 when the region overlaps it).
 */
struct ZoneAnchor {
    int64_t startPosition;
    int64_t endPosition;
    dataTypes::Strand strand;
    int64_t distance;
};

struct ZoneHit {
    dataTypes::Area area;
    double regionPercentage;
    double areaPercentage;

    auto operator==(const ZoneHit &other) const -> bool = default;
};

/**
 * @brief Splits a region into the TSS/promoter/upstream or TTS/downstream zones of a transcript.
 *
 * Reverse strand anchors are handled by reflecting the region around the anchor coordinate, so
 * that all zone arithmetic is done as if on the forward strand.
 */
class ZoneChecker {
   public:
    ZoneChecker(int64_t tssDistance, int64_t ttsDistance, int64_t promoterDistance)
        : tssDistance(tssDistance), ttsDistance(ttsDistance), promoterDistance(promoterDistance) {};
    ZoneChecker(const ZoneChecker &) = default;
    ZoneChecker(ZoneChecker &&) = default;
    auto operator=(const ZoneChecker &) -> ZoneChecker & = delete;
    auto operator=(ZoneChecker &&) -> ZoneChecker & = delete;
    ~ZoneChecker() = default;

    /**
     * @brief Zones upstream of the first exon.
     * @param queryStart Start of the region.
     * @param queryEnd End of the region (inclusive).
     * @param anchor First exon of the transcript. Its TSS is the start on the forward strand and
     * the end on the reverse strand.
     * @return Up to three hits in the order TSS, PROMOTER, UPSTREAM. Empty for an empty region.
     */
    [[nodiscard]] auto checkTss(int64_t queryStart, int64_t queryEnd,
                                const ZoneAnchor &anchor) const -> std::vector<ZoneHit>;

    /**
     * @brief Zones downstream of the last exon.
     * @return Up to two hits in the order TTS, DOWNSTREAM. Empty for an empty region.
     */
    [[nodiscard]] auto checkTts(int64_t queryStart, int64_t queryEnd,
                                const ZoneAnchor &anchor) const -> std::vector<ZoneHit>;

   private:
    const int64_t tssDistance;
    const int64_t ttsDistance;
    const int64_t promoterDistance;

    static void addZoneHit(std::vector<ZoneHit> &hits, dataTypes::Area area, int64_t overlap,
                           int64_t queryLength, int64_t zoneWidth);
};

}  // namespace pipelines::match
