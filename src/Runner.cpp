#include "Runner.hpp"

#include <exception>
#include <string>

#include "Logger.hpp"
#include "Match.hpp"
#include "ParameterParser.hpp"

void Runner::runPipeline(int argc, const char *const argv[]) {  // NOLINT
    const auto parameters = pipelines::ParameterParser::getParameters(argc, argv);

    try {
        runMatchPipeline(parameters);
    } catch (const std::exception &e) {
        Logger::log(LogLevel::ERROR, "Matching failed: ", std::string(e.what()));
    }
}

void Runner::runMatchPipeline(const pipelines::match::MatchParameters &parameters) {
    Logger::log(LogLevel::INFO, "Running match pipeline with ", parameters.threadCount,
                parameters.threadCount == 1 ? " thread" : " threads");

    const auto pipeline = pipelines::match::Match(parameters);
    pipeline.process();

    Logger::log(LogLevel::INFO, "Done");
}
