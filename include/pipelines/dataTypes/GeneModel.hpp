#pragma once

// Standard
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// Internal
#include "GenomicStrand.hpp"

namespace dataTypes {

struct Exon {
    int64_t startPosition;
    int64_t endPosition;
    std::optional<std::string> exonNumber;

    [[nodiscard]] auto length() const -> int64_t { return endPosition - startPosition + 1; }
};

struct Transcript {
    std::string id;
    std::vector<Exon> exons;
    int64_t startPosition = std::numeric_limits<int64_t>::max();
    int64_t endPosition = 0;

    explicit Transcript(std::string id) : id(std::move(id)) {};

    void setBoundaries(int64_t start, int64_t end);
    void calculateSize();

    /**
     * @brief Sorts the exons by start position and labels them in transcription order.
     *
     * Forward strand transcripts are numbered 1..N from the lowest coordinate, reverse strand
     * transcripts N..1 so that exon "1" always holds the transcription start site.
     */
    void renumberExons(Strand strand);
};

struct Gene {
    std::string id;
    Strand strand;
    std::vector<Transcript> transcripts;
    int64_t startPosition = std::numeric_limits<int64_t>::max();
    int64_t endPosition = 0;

    Gene(std::string id, Strand strand) : id(std::move(id)), strand(strand) {};

    void setBoundaries(int64_t start, int64_t end);
    void calculateSize();
};

using GeneMap = std::unordered_map<std::string, std::vector<Gene>>;

/**
 * @brief Genes of an annotation grouped by chromosome.
 *
 * Read only once constructed and shared by all matching workers.
 */
struct GeneAnnotation {
    GeneMap genesByChromosome;
    std::unordered_map<std::string, int64_t> maxGeneLength;
    std::vector<std::string> chromosomeOrder;

    /** @brief Sorts the genes of every chromosome by (start, id). */
    void sortGenes();

    void computeMaxGeneLengths();

    [[nodiscard]] auto genes(const std::string &chromosome) const -> const std::vector<Gene> *;
    [[nodiscard]] auto maxLength(const std::string &chromosome) const -> int64_t;
    [[nodiscard]] auto geneCount() const -> size_t;
};

}  // namespace dataTypes
