#include "GeneAnnotationParser.hpp"

// Standard
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

// Internal
#include "LineReader.hpp"
#include "Logger.hpp"
#include "Utility.hpp"

using namespace constants::annotation;

namespace annotation {

namespace {
// Position of a transcript within the genes being built
struct TranscriptLocation {
    std::string geneID;
    size_t index;
};
}  // namespace

GeneAnnotationParser::GeneAnnotationParser(std::string geneIDKey, std::string transcriptIDKey)
    : geneIDKey(std::move(geneIDKey)), transcriptIDKey(std::move(transcriptIDKey)) {}

auto GeneAnnotationParser::parse(const fs::path &annotationPath) const
    -> dataTypes::GeneAnnotation {
    LineReader reader(annotationPath);

    std::unordered_map<std::string, dataTypes::Gene> genes;
    std::unordered_map<std::string, std::string> geneChromosomes;
    std::unordered_map<std::string, TranscriptLocation> transcriptLocations;
    std::unordered_map<std::string, std::vector<std::string>> geneIDsByChromosome;
    std::vector<std::string> chromosomeOrder;

    std::unordered_set<std::string> boundedTranscripts;
    std::unordered_set<std::string> boundedGenes;

    auto lineError = [&](const std::string &message) {
        return std::runtime_error(annotationPath.string() + ":" +
                                  std::to_string(reader.lineNumber()) + ": " + message);
    };

    auto requireAttribute = [&](std::string_view attributes, const std::string &key,
                                std::string_view featureType) -> std::string {
        auto value = extractAttribute(attributes, key);
        if (!value.has_value()) {
            throw lineError("Failed to extract " + key + " from " + std::string(featureType));
        }
        return std::move(value.value());
    };

    auto getOrCreateGene = [&](const std::string &geneID, const std::string &chromosome,
                               dataTypes::Strand strand) -> dataTypes::Gene & {
        auto [iterator, inserted] = genes.try_emplace(geneID, geneID, strand);
        if (inserted) {
            geneChromosomes.emplace(geneID, chromosome);
            auto [chromosomeIterator, newChromosome] = geneIDsByChromosome.try_emplace(chromosome);
            if (newChromosome) {
                chromosomeOrder.push_back(chromosome);
            }
            chromosomeIterator->second.push_back(geneID);
        }
        return iterator->second;
    };

    auto getOrCreateTranscript = [&](dataTypes::Gene &gene,
                                     const std::string &transcriptID) -> dataTypes::Transcript & {
        const auto iterator = transcriptLocations.find(transcriptID);
        if (iterator != transcriptLocations.end()) {
            return genes.at(iterator->second.geneID).transcripts[iterator->second.index];
        }
        transcriptLocations.emplace(transcriptID,
                                    TranscriptLocation{gene.id, gene.transcripts.size()});
        gene.transcripts.emplace_back(transcriptID);
        return gene.transcripts.back();
    };

    size_t exonCount = 0;

    for (std::string line; reader.nextLine(line);) {
        if (line.empty() || line.starts_with('#')) {
            continue;
        }

        const auto tokens = helper::splitTokens(line, '\t');
        if (tokens.size() < expectedGtfFileTokenCount) {
            continue;
        }

        const auto startPosition = helper::parseInteger(tokens[startTokenColumn]);
        const auto endPosition = helper::parseInteger(tokens[endTokenColumn]);
        if (!startPosition.has_value() || !endPosition.has_value()) {
            throw lineError("Failed to parse feature coordinates");
        }

        const auto strand = dataTypes::parseStrand(tokens[strandTokenColumn]);
        if (!strand.has_value()) {
            continue;
        }

        const std::string chromosome{tokens[0]};
        const std::string_view featureType = tokens[featureTypeTokenColumn];
        const std::string_view attributes = tokens[attributeTokenColumn];

        if (featureType == "exon" || featureType == "transcript") {
            const std::string geneID = requireAttribute(attributes, geneIDKey, featureType);
            const std::string transcriptID =
                requireAttribute(attributes, transcriptIDKey, featureType);

            dataTypes::Gene &gene = getOrCreateGene(geneID, chromosome, strand.value());
            dataTypes::Transcript &transcript = getOrCreateTranscript(gene, transcriptID);

            if (featureType == "exon") {
                transcript.exons.push_back({startPosition.value(), endPosition.value(), {}});
                ++exonCount;
            } else {
                transcript.setBoundaries(startPosition.value(), endPosition.value());
                boundedTranscripts.insert(transcriptID);
            }
        } else if (featureType == "gene") {
            const std::string geneID = requireAttribute(attributes, geneIDKey, featureType);
            dataTypes::Gene &gene = getOrCreateGene(geneID, chromosome, strand.value());
            gene.setBoundaries(startPosition.value(), endPosition.value());
            boundedGenes.insert(geneID);
        }
    }

    dataTypes::GeneAnnotation annotation;
    annotation.chromosomeOrder = chromosomeOrder;

    for (const auto &chromosome : chromosomeOrder) {
        auto &chromosomeGenes = annotation.genesByChromosome[chromosome];
        for (const auto &geneID : geneIDsByChromosome.at(chromosome)) {
            dataTypes::Gene &gene = genes.at(geneID);

            for (auto &transcript : gene.transcripts) {
                if (!boundedTranscripts.contains(transcript.id)) {
                    transcript.calculateSize();
                }
                transcript.renumberExons(gene.strand);
            }
            if (!boundedGenes.contains(gene.id)) {
                gene.calculateSize();
            }

            chromosomeGenes.push_back(std::move(gene));
        }
    }

    annotation.computeMaxGeneLengths();

    Logger::log(LogLevel::INFO, "Parsed ", annotation.geneCount(), " genes with ", exonCount,
                " exons on ", chromosomeOrder.size(), " chromosomes from ",
                annotationPath.string());

    return annotation;
}

auto GeneAnnotationParser::extractAttribute(std::string_view attributes, const std::string &key)
    -> std::optional<std::string> {
    const std::string keyPattern = key + " ";
    const auto keyPosition = attributes.find(keyPattern);
    if (keyPosition == std::string_view::npos) {
        return std::nullopt;
    }

    const std::string_view afterKey = attributes.substr(keyPosition + keyPattern.size());
    const auto openingQuote = afterKey.find('"');
    if (openingQuote == std::string_view::npos) {
        return std::nullopt;
    }

    const std::string_view quoted = afterKey.substr(openingQuote + 1);
    const auto closingQuote = quoted.find('"');
    if (closingQuote == std::string_view::npos) {
        return std::nullopt;
    }

    return std::string(quoted.substr(0, closingQuote));
}

}  // namespace annotation
