#include "Match.hpp"

// Internal
#include "Logger.hpp"
#include "RegionReader.hpp"
#include "ResultWriter.hpp"
#include "Utility.hpp"

namespace pipelines::match {

auto Match::process() const -> MatchStatistics {
    const dataTypes::GeneAnnotation geneAnnotation = loadAnnotation();

    Logger::log(LogLevel::INFO, "Processing regions: ", params.regionsPath);
    annotation::RegionReader regionReader{params.regionsPath};

    Logger::log(LogLevel::INFO, "Writing associations to: ", params.outputPath);
    annotation::ResultWriter resultWriter{params.outputPath};

    const MatchScheduler scheduler{geneAnnotation, params.config, params.threadCount,
                                   params.batchSize};

    const helper::Timer timer;
    const MatchStatistics statistics = scheduler.run(regionReader, resultWriter);

    Logger::log(LogLevel::DEBUG, "Cumulative matching time: ", statistics.matchingMilliseconds,
                " ms");
    Logger::log(LogLevel::INFO, "Matched ", statistics.regionCount, " regions and wrote ",
                statistics.lineCount, " associations in ", timer.elapsedMilliseconds(), " ms");

    return statistics;
}

auto Match::loadAnnotation() const -> dataTypes::GeneAnnotation {
    Logger::log(LogLevel::INFO, "Parsing gene annotation: ", params.annotationPath);

    dataTypes::GeneAnnotation geneAnnotation = annotationParser.parse(params.annotationPath);
    geneAnnotation.sortGenes();

    return geneAnnotation;
}

}  // namespace pipelines::match
