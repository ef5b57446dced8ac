#pragma once

// Standard
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

// Internal
#include "Constants.hpp"
#include "GeneModel.hpp"

namespace annotation {

namespace fs = std::filesystem;

/**
 * @brief Builds the gene model from the exon, transcript and gene records of a GTF file.
 */
class GeneAnnotationParser {
   public:
    explicit GeneAnnotationParser(
        std::string geneIDKey = constants::annotation::DEFAULT_GENE_ID_KEY,
        std::string transcriptIDKey = constants::annotation::DEFAULT_TRANSCRIPT_ID_KEY);
    GeneAnnotationParser(const GeneAnnotationParser &) = default;
    GeneAnnotationParser(GeneAnnotationParser &&) = delete;
    auto operator=(const GeneAnnotationParser &) -> GeneAnnotationParser & = delete;
    auto operator=(GeneAnnotationParser &&) -> GeneAnnotationParser & = delete;
    ~GeneAnnotationParser() = default;

    /**
     * @brief Parses a plain or gzip compressed GTF file.
     *
     * Exons are renumbered in transcription order. Genes are kept in the order they appear; sort
     * them with GeneAnnotation::sortGenes before matching.
     * @throws std::runtime_error on unreadable files, malformed coordinates or missing ids.
     */
    [[nodiscard]] auto parse(const fs::path &annotationPath) const -> dataTypes::GeneAnnotation;

    /**
     * @brief Value of a GTF attribute in the form `key "value"`.
     */
    [[nodiscard]] static auto extractAttribute(std::string_view attributes,
                                               const std::string &key)
        -> std::optional<std::string>;

   private:
    std::string geneIDKey;
    std::string transcriptIDKey;
};

}  // namespace annotation
