#include "GeneModel.hpp"

// Standard
#include <algorithm>
#include <ranges>

namespace dataTypes {

void Transcript::setBoundaries(int64_t start, int64_t end) {
    startPosition = start;
    endPosition = end;
}

void Transcript::calculateSize() {
    for (const auto &exon : exons) {
        startPosition = std::min(startPosition, exon.startPosition);
        endPosition = std::max(endPosition, exon.endPosition);
    }
}

void Transcript::renumberExons(Strand strand) {
    std::ranges::stable_sort(exons, {}, &Exon::startPosition);

    const size_t exonCount = exons.size();
    for (size_t i = 0; i < exonCount; ++i) {
        const size_t number = strand == Strand::FORWARD ? i + 1 : exonCount - i;
        exons[i].exonNumber = std::to_string(number);
    }
}

void Gene::setBoundaries(int64_t start, int64_t end) {
    startPosition = start;
    endPosition = end;
}

void Gene::calculateSize() {
    for (const auto &transcript : transcripts) {
        startPosition = std::min(startPosition, transcript.startPosition);
        endPosition = std::max(endPosition, transcript.endPosition);
    }
}

void GeneAnnotation::sortGenes() {
    for (auto &[chromosome, genes] : genesByChromosome) {
        std::ranges::sort(genes, [](const Gene &lhs, const Gene &rhs) {
            if (lhs.startPosition != rhs.startPosition) {
                return lhs.startPosition < rhs.startPosition;
            }
            return lhs.id < rhs.id;
        });
    }
}

void GeneAnnotation::computeMaxGeneLengths() {
    maxGeneLength.clear();
    for (const auto &[chromosome, genes] : genesByChromosome) {
        int64_t maxLength = 0;
        for (const auto &gene : genes) {
            maxLength = std::max(maxLength, gene.endPosition - gene.startPosition);
        }
        maxGeneLength[chromosome] = maxLength;
    }
}

auto GeneAnnotation::genes(const std::string &chromosome) const -> const std::vector<Gene> * {
    const auto iterator = genesByChromosome.find(chromosome);
    if (iterator == genesByChromosome.end()) {
        return nullptr;
    }
    return &iterator->second;
}

auto GeneAnnotation::maxLength(const std::string &chromosome) const -> int64_t {
    const auto iterator = maxGeneLength.find(chromosome);
    return iterator == maxGeneLength.end() ? 0 : iterator->second;
}

auto GeneAnnotation::geneCount() const -> size_t {
    size_t count = 0;
    for (const auto &[chromosome, genes] : genesByChromosome) {
        count += genes.size();
    }
    return count;
}

}  // namespace dataTypes
