#include "OverlapClassifier.hpp"

// Standard
#include <cstdlib>
#include <limits>
#include <optional>

// Internal
#include "Utility.hpp"

namespace pipelines::match {

using dataTypes::Area;
using dataTypes::Candidate;
using dataTypes::Exon;
using dataTypes::Gene;
using dataTypes::GenomicRegion;
using dataTypes::Strand;
using dataTypes::Transcript;

namespace {
auto anchorOf(const Candidate &candidate) -> ZoneAnchor {
    return {candidate.exonStart, candidate.exonEnd, candidate.strand, candidate.distance};
}
}  // namespace

void FragmentMap::add(const std::string &key, Fragment fragment) {
    const auto [iterator, inserted] = groupIndex.try_emplace(key, groups.size());
    if (inserted) {
        groups.emplace_back(key, std::vector<Fragment>{});
    }
    groups[iterator->second].second.push_back(std::move(fragment));
}

auto FragmentMap::aggregate(int64_t regionLength) const -> std::vector<Candidate> {
    std::vector<Candidate> merged;
    merged.reserve(groups.size());

    for (const auto &[key, fragments] : groups) {
        if (fragments.size() == 1) {
            merged.push_back(fragments.front().candidate);
            continue;
        }

        int64_t totalArea = 0;
        int64_t totalOverlap = 0;
        std::string labels;

        for (size_t i = 0; i < fragments.size(); ++i) {
            totalArea += fragments[i].areaLength;
            totalOverlap += fragments[i].overlap;
            if (i > 0) {
                labels += ',';
            }
            labels += fragments[i].candidate.exonNumber;
        }

        Candidate candidate = fragments.front().candidate;
        candidate.exonNumber = std::move(labels);
        candidate.regionPercentage = helper::percentage(totalOverlap, regionLength);
        candidate.areaPercentage = helper::percentage(totalOverlap, totalArea);
        merged.push_back(std::move(candidate));
    }

    return merged;
}

void OverlapClassifier::addTssZones(std::vector<Candidate> &candidates,
                                    const GenomicRegion &region, const Candidate &base) const {
    for (const auto &hit :
         zoneChecker.checkTss(region.startPosition, region.endPosition, anchorOf(base))) {
        candidates.push_back(base.withZone(hit.area, hit.regionPercentage, hit.areaPercentage));
    }
}

void OverlapClassifier::addTtsZones(std::vector<Candidate> &candidates,
                                    const GenomicRegion &region, const Candidate &base) const {
    if (config.tts <= 0) {
        candidates.push_back(base);
        return;
    }
    for (const auto &hit :
         zoneChecker.checkTts(region.startPosition, region.endPosition, anchorOf(base))) {
        candidates.push_back(base.withZone(hit.area, hit.regionPercentage, hit.areaPercentage));
    }
}

auto OverlapClassifier::classify(const GenomicRegion &region, const std::vector<Gene> &genes,
                                 size_t startIndex) const -> std::vector<Candidate> {
    const int64_t start = region.startPosition;
    const int64_t end = region.endPosition;
    const int64_t midpoint = region.midpoint();
    const int64_t regionLength = region.length();

    // Nearest transcript end (downstream) and transcript start (upstream) outside the region
    int64_t downstreamDistance = std::numeric_limits<int64_t>::max();
    std::optional<Candidate> nearestDownstream;
    int64_t upstreamDistance = std::numeric_limits<int64_t>::max();
    std::optional<Candidate> nearestUpstream;

    bool overlapsGeneBody = false;

    std::vector<Candidate> candidates;
    FragmentMap geneBodies;
    FragmentMap introns;

    for (size_t geneIndex = startIndex; geneIndex < genes.size(); ++geneIndex) {
        const Gene &gene = genes[geneIndex];
        const int64_t distanceToGeneStart = std::abs(gene.startPosition - midpoint);

        // Later genes start even further away and cannot beat the reported flank
        if (gene.startPosition > end && (downstreamDistance < distanceToGeneStart ||
                                         upstreamDistance < distanceToGeneStart)) {
            break;
        }

        const bool isForward = gene.strand == Strand::FORWARD;

        for (const Transcript &transcript : gene.transcripts) {
            const auto &exons = transcript.exons;
            if (exons.empty()) [[unlikely]] {
                continue;
            }

            const size_t exonCount = exons.size();
            const std::string fragmentKey = gene.id + "_" + transcript.id;
            const int64_t tssDistance = exons.front().exonNumber == "1"
                                            ? midpoint - exons.front().startPosition
                                            : exons.back().endPosition - midpoint;

            auto makeCandidate = [&](const Exon &exon, Area area, std::string label,
                                     int64_t distance, double regionPercentage,
                                     double areaPercentage) -> Candidate {
                return Candidate{.exonStart = exon.startPosition,
                                 .exonEnd = exon.endPosition,
                                 .strand = gene.strand,
                                 .exonNumber = std::move(label),
                                 .area = area,
                                 .transcriptID = transcript.id,
                                 .geneID = gene.id,
                                 .distance = distance,
                                 .regionPercentage = regionPercentage,
                                 .areaPercentage = areaPercentage,
                                 .tssDistance = tssDistance};
            };

            auto addIntron = [&](const Exon &exon, size_t exonIndex, int64_t intronLength,
                                 int64_t overlap) {
                const size_t intronNumber = isForward ? exonIndex + 1 : exonCount - 1 - exonIndex;
                introns.add(fragmentKey,
                            {makeCandidate(exon, Area::INTRON, std::to_string(intronNumber), 0,
                                           helper::percentage(overlap, regionLength),
                                           helper::percentage(overlap, intronLength)),
                             intronLength, overlap});
            };

            // The exon holding the TSS is reported directly, all others accumulate as gene body
            auto addExonOverlap = [&](const Exon &exon, size_t exonIndex, int64_t overlap) {
                const bool holdsTss = (exonIndex == 0 && isForward) ||
                                      (exonIndex == exonCount - 1 && !isForward);
                Candidate candidate = makeCandidate(
                    exon, holdsTss ? Area::FIRST_EXON : Area::GENE_BODY,
                    exon.exonNumber.value_or(""), 0, helper::percentage(overlap, regionLength),
                    helper::percentage(overlap, exon.length()));

                if (holdsTss) {
                    candidates.push_back(std::move(candidate));
                } else {
                    geneBodies.add(fragmentKey, {std::move(candidate), exon.length(), overlap});
                }
            };

            // Part of the region left of the lowest exon
            auto addRegionHead = [&](const Exon &exon) {
                const double headPercentage =
                    helper::percentage(exon.startPosition - start, regionLength);
                const Candidate base =
                    makeCandidate(exon, isForward ? Area::UPSTREAM : Area::DOWNSTREAM,
                                  exon.exonNumber.value_or(""), 0, headPercentage,
                                  dataTypes::notApplicablePercentage);
                if (isForward) {
                    addTssZones(candidates, region, base);
                } else {
                    addTtsZones(candidates, region, base);
                }
            };

            // Part of the region right of the exon. Returns true if the region ends in the
            // following intron.
            auto addRegionTail = [&](const Exon &exon, size_t exonIndex) -> bool {
                if (exonIndex == exonCount - 1) {
                    const double tailPercentage =
                        helper::percentage(end - exon.endPosition, regionLength);
                    const Candidate base =
                        makeCandidate(exon, isForward ? Area::DOWNSTREAM : Area::UPSTREAM,
                                      exon.exonNumber.value_or(""), 0, tailPercentage,
                                      dataTypes::notApplicablePercentage);
                    if (isForward) {
                        addTtsZones(candidates, region, base);
                    } else {
                        addTssZones(candidates, region, base);
                    }
                    return false;
                }

                const Exon &nextExon = exons[exonIndex + 1];
                const int64_t intronLength = nextExon.startPosition - exon.endPosition - 1;

                if (nextExon.startPosition > end) {
                    addIntron(exon, exonIndex, intronLength, end - exon.endPosition);
                    return true;
                }
                addIntron(exon, exonIndex, intronLength,
                          nextExon.startPosition - exon.endPosition - 1);
                return false;
            };

            for (size_t j = 0; j < exonCount; ++j) {
                const Exon &exon = exons[j];
                const bool isFirstExon = j == 0;
                const bool isLastExon = j == exonCount - 1;

                //  <----->
                //           |-------|
                if (exon.endPosition < start) {
                    if (isLastExon) {
                        const int64_t proximity = midpoint - exon.endPosition;
                        if (isForward && proximity < downstreamDistance) {
                            downstreamDistance = proximity;
                            nearestDownstream = makeCandidate(
                                exon, Area::DOWNSTREAM, exon.exonNumber.value_or(""), proximity,
                                100.0, dataTypes::notApplicablePercentage);
                        } else if (!isForward && proximity < upstreamDistance) {
                            upstreamDistance = proximity;
                            nearestUpstream = makeCandidate(
                                exon, Area::UPSTREAM, exon.exonNumber.value_or(""), proximity,
                                100.0, dataTypes::notApplicablePercentage);
                        }
                        continue;
                    }

                    const Exon &nextExon = exons[j + 1];
                    if (nextExon.startPosition > start) {
                        overlapsGeneBody = true;
                        const int64_t intronLength = nextExon.startPosition - exon.endPosition - 1;

                        if (nextExon.startPosition > end) {
                            addIntron(exon, j, intronLength, regionLength);
                            break;
                        }
                        addIntron(exon, j, intronLength, nextExon.startPosition - start);
                    }
                }
                //  <----->
                //     |-------|
                else if (start <= exon.endPosition && exon.endPosition <= end &&
                         exon.startPosition < start) {
                    overlapsGeneBody = true;
                    addExonOverlap(exon, j, exon.endPosition - start + 1);

                    if (exon.endPosition < end && addRegionTail(exon, j)) {
                        break;
                    }
                }
                //    <----->
                //  |---------|
                else if (start <= exon.startPosition && end >= exon.endPosition) {
                    overlapsGeneBody = true;
                    if (start < exon.startPosition && isFirstExon) {
                        addRegionHead(exon);
                    }
                    addExonOverlap(exon, j, exon.length());

                    if (end > exon.endPosition && addRegionTail(exon, j)) {
                        break;
                    }
                }
                //       <----->
                //  |-------|
                else if (start <= exon.startPosition && exon.startPosition <= end &&
                         end < exon.endPosition) {
                    overlapsGeneBody = true;
                    if (start < exon.startPosition && isFirstExon) {
                        addRegionHead(exon);
                    }
                    addExonOverlap(exon, j, end - exon.startPosition + 1);
                }
                //  <----------->
                //     |-----|
                else if (exon.startPosition <= start && start <= exon.endPosition &&
                         end < exon.endPosition) {
                    overlapsGeneBody = true;
                    addExonOverlap(exon, j, regionLength);
                }
                //             <----->
                //  |-----|
                else if (exon.startPosition > end && isFirstExon) {
                    const int64_t proximity = exon.startPosition - midpoint;
                    if (!isForward && proximity < downstreamDistance) {
                        downstreamDistance = proximity;
                        nearestDownstream = makeCandidate(
                            exon, Area::DOWNSTREAM, exon.exonNumber.value_or(""), proximity,
                            100.0, dataTypes::notApplicablePercentage);
                    } else if (isForward && proximity < upstreamDistance) {
                        upstreamDistance = proximity;
                        nearestUpstream = makeCandidate(
                            exon, Area::UPSTREAM, exon.exonNumber.value_or(""), proximity, 100.0,
                            dataTypes::notApplicablePercentage);
                    }

                    if (downstreamDistance <= proximity && upstreamDistance <= proximity) {
                        break;
                    }
                }
            }
        }
    }

    if (nearestDownstream.has_value() && downstreamDistance <= upstreamDistance &&
        nearestDownstream->distance <= config.distance) {
        addTtsZones(candidates, region, nearestDownstream.value());
    }

    if (nearestUpstream.has_value() && upstreamDistance <= downstreamDistance &&
        nearestUpstream->distance <= config.distance) {
        addTssZones(candidates, region, nearestUpstream.value());
    }

    if (overlapsGeneBody) {
        for (auto &candidate : geneBodies.aggregate(regionLength)) {
            candidates.push_back(std::move(candidate));
        }
        for (auto &candidate : introns.aggregate(regionLength)) {
            candidates.push_back(std::move(candidate));
        }
    }

    return candidates;
}

}  // namespace pipelines::match
