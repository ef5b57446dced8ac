#pragma once

// Standard
#include <filesystem>
#include <utility>

// Internal
#include "GeneAnnotationParser.hpp"
#include "GeneModel.hpp"
#include "MatchParameters.hpp"
#include "MatchScheduler.hpp"

namespace pipelines::match {
namespace fs = std::filesystem;

class Match {
   public:
    Match(const Match &) = delete;
    Match(Match &&) = delete;
    auto operator=(const Match &) -> Match & = delete;
    auto operator=(Match &&) -> Match & = delete;
    explicit Match(MatchParameters params)
        : params(std::move(params)),
          annotationParser(this->params.geneIDKey, this->params.transcriptIDKey) {};
    ~Match() = default;

    /**
     * @brief Loads the annotation and writes the gene associations of every region.
     * @throws std::runtime_error on unreadable or malformed input and failed writes.
     */
    auto process() const -> MatchStatistics;

   private:
    MatchParameters params;
    annotation::GeneAnnotationParser annotationParser;

    [[nodiscard]] auto loadAnnotation() const -> dataTypes::GeneAnnotation;
};

}  // namespace pipelines::match
