#pragma once

// Standard
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Internal
#include "GeneModel.hpp"
#include "GenomicRegion.hpp"

namespace pipelines::match {

/**
 * @brief Index of the first gene that can matter for a region.
 *
 * Genes must be sorted by start position.
 */
auto findSearchStartIndex(const std::vector<dataTypes::Gene> &genes, int64_t searchStart)
    -> size_t;

/**
 * @brief Position of the last matched region within its chromosome's genes.
 *
 * Regions that follow on the same chromosome at a greater or equal start advance the gene index
 * linearly, all others fall back to a binary search. Every execution context owns its own cursor.
 */
struct SearchCursor {
    std::string lastChromosome;
    int64_t lastStart = -1;
    size_t lastIndex = 0;

    /**
     * @brief First gene index to scan for the region and moves the cursor to it.
     * @param maxGeneLength Longest gene of the region's chromosome.
     * @param lookbackDistance Largest distance at which a gene can still be associated.
     */
    auto startIndex(const dataTypes::GenomicRegion &region,
                    const std::vector<dataTypes::Gene> &genes, int64_t maxGeneLength,
                    int64_t lookbackDistance) -> size_t;

    /** @brief Records a region whose chromosome has no genes. */
    void skipChromosome(const std::string &chromosome) { lastChromosome = chromosome; }
};

}  // namespace pipelines::match
