#include "ZoneChecker.hpp"

// Standard
#include <algorithm>

// Internal
#include "Candidate.hpp"
#include "Utility.hpp"

namespace pipelines::match {

using dataTypes::Area;

auto ZoneChecker::checkTss(int64_t queryStart, int64_t queryEnd,
                           const ZoneAnchor &anchor) const -> std::vector<ZoneHit> {
    int64_t tssPosition = anchor.startPosition;

    if (anchor.strand == dataTypes::Strand::REVERSE) {
        tssPosition = anchor.endPosition;
        const int64_t reflectedStart = 2 * tssPosition - queryEnd;
        queryEnd = 2 * tssPosition - queryStart;
        queryStart = reflectedStart;
    }

    const int64_t queryLength = queryEnd - queryStart + 1;
    if (queryLength <= 0) [[unlikely]] {
        return {};
    }

    const int64_t tssZoneStart = tssPosition - tssDistance;
    const int64_t promoterZoneStart = tssZoneStart - promoterDistance;
    const int64_t upstreamReach = tssPosition - queryStart;

    std::vector<ZoneHit> hits;

    if (anchor.distance <= tssDistance) {
        if (upstreamReach <= tssDistance) {
            const int64_t overlap = std::min(tssPosition - 1, queryEnd) - queryStart + 1;
            addZoneHit(hits, Area::TSS, overlap, queryLength, tssDistance);
        } else {
            const int64_t tssOverlap = std::min(tssPosition - 1, queryEnd) - tssZoneStart + 1;
            addZoneHit(hits, Area::TSS, tssOverlap, queryLength, tssDistance);

            if (upstreamReach <= tssDistance + promoterDistance) {
                addZoneHit(hits, Area::PROMOTER, tssZoneStart - queryStart, queryLength,
                           promoterDistance);
            } else {
                addZoneHit(hits, Area::PROMOTER, promoterDistance, queryLength, promoterDistance);
                hits.push_back({Area::UPSTREAM,
                                helper::percentage(promoterZoneStart - queryStart, queryLength),
                                dataTypes::notApplicablePercentage});
            }
        }
    } else if (anchor.distance <= tssDistance + promoterDistance) {
        if (upstreamReach <= tssDistance + promoterDistance) {
            addZoneHit(hits, Area::PROMOTER, queryLength, queryLength, promoterDistance);
        } else {
            addZoneHit(hits, Area::PROMOTER, queryEnd - promoterZoneStart + 1, queryLength,
                       promoterDistance);
            hits.push_back({Area::UPSTREAM,
                            helper::percentage(promoterZoneStart - queryStart, queryLength),
                            dataTypes::notApplicablePercentage});
        }
    } else {
        hits.push_back({Area::UPSTREAM, 100.0, dataTypes::notApplicablePercentage});
    }

    return hits;
}

auto ZoneChecker::checkTts(int64_t queryStart, int64_t queryEnd,
                           const ZoneAnchor &anchor) const -> std::vector<ZoneHit> {
    int64_t ttsPosition = anchor.endPosition;

    if (anchor.strand == dataTypes::Strand::REVERSE) {
        ttsPosition = anchor.startPosition;
        const int64_t reflectedStart = 2 * ttsPosition - queryEnd;
        queryEnd = 2 * ttsPosition - queryStart;
        queryStart = reflectedStart;
    }

    const int64_t queryLength = queryEnd - queryStart + 1;
    if (queryLength <= 0) [[unlikely]] {
        return {};
    }

    std::vector<ZoneHit> hits;

    if (anchor.distance <= ttsDistance) {
        const int64_t overlapStart = std::max(ttsPosition + 1, queryStart);

        if (queryEnd - ttsPosition <= ttsDistance) {
            addZoneHit(hits, Area::TTS, queryEnd - overlapStart + 1, queryLength, ttsDistance);
        } else {
            const int64_t ttsZoneEnd = ttsPosition + ttsDistance;
            addZoneHit(hits, Area::TTS, ttsZoneEnd - overlapStart + 1, queryLength, ttsDistance);
            hits.push_back({Area::DOWNSTREAM,
                            helper::percentage(queryEnd - ttsZoneEnd, queryLength),
                            dataTypes::notApplicablePercentage});
        }
    } else {
        hits.push_back({Area::DOWNSTREAM, 100.0, dataTypes::notApplicablePercentage});
    }

    return hits;
}

// Zones of zero width are never reported
void ZoneChecker::addZoneHit(std::vector<ZoneHit> &hits, dataTypes::Area area, int64_t overlap,
                             int64_t queryLength, int64_t zoneWidth) {
    if (zoneWidth <= 0) {
        return;
    }
    hits.push_back({area, helper::percentage(overlap, queryLength),
                    helper::percentage(overlap, zoneWidth)});
}

}  // namespace pipelines::match
