#include "SearchCursor.hpp"

// Standard
#include <algorithm>
#include <iterator>
#include <limits>

namespace pipelines::match {

auto findSearchStartIndex(const std::vector<dataTypes::Gene> &genes, int64_t searchStart)
    -> size_t {
    const auto iterator = std::ranges::partition_point(
        genes, [searchStart](const dataTypes::Gene &gene) {
            return gene.startPosition < searchStart;
        });
    return static_cast<size_t>(std::distance(genes.begin(), iterator));
}

auto SearchCursor::startIndex(const dataTypes::GenomicRegion &region,
                              const std::vector<dataTypes::Gene> &genes, int64_t maxGeneLength,
                              int64_t lookbackDistance) -> size_t {
    const int64_t maxLookback =
        maxGeneLength > std::numeric_limits<int64_t>::max() - lookbackDistance
            ? std::numeric_limits<int64_t>::max()
            : maxGeneLength + lookbackDistance;
    const int64_t searchStart =
        region.startPosition < std::numeric_limits<int64_t>::min() + maxLookback
            ? std::numeric_limits<int64_t>::min()
            : region.startPosition - maxLookback;

    size_t index = 0;
    if (region.referenceID == lastChromosome && region.startPosition >= lastStart) {
        index = lastIndex;
        while (index < genes.size() && genes[index].endPosition < searchStart) {
            ++index;
        }
    } else {
        index = findSearchStartIndex(genes, searchStart);
    }

    lastChromosome = region.referenceID;
    lastStart = region.startPosition;
    lastIndex = index;

    return index;
}

}  // namespace pipelines::match
