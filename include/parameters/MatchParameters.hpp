#pragma once

// Standard
#include <cstdint>
#include <sstream>
#include <string>

// Boost
#include <boost/program_options.hpp>
#include <boost/program_options/variables_map.hpp>

// Internal
#include "Constants.hpp"
#include "GeneralParameters.hpp"
#include "MatchConfig.hpp"
#include "ParameterValidator.hpp"
#include "ReportLevel.hpp"

namespace po = boost::program_options;

namespace pipelines::match {

struct MatchParameters : public GeneralParameters {
   public:
    std::string geneIDKey;
    std::string transcriptIDKey;
    MatchConfig config;

    MatchParameters(const po::variables_map& params)
        : GeneralParameters(params),
          geneIDKey(ParameterValidator::getValue<std::string>(params, "gene")),
          transcriptIDKey(ParameterValidator::getValue<std::string>(params, "transcript")),
          config(validateConfig(params)) {};

   private:
    static auto validateConfig(const po::variables_map& params) -> MatchConfig {
        MatchConfig config;

        config.level = validateReportLevel(params);

        if (ParameterValidator::getValue<int64_t>(params, "distance") < 0) {
            Logger::log(LogLevel::ERROR, "The distance cannot be lower than 0 kb.");
        }
        const auto distanceKb = ParameterValidator::validateArithmetic<int64_t>(
            params, "distance", 0, constants::pipelines::maxDistanceKb);
        config.distance = distanceKb * constants::pipelines::basesPerKb;

        config.tss = validateZoneDistance(params, "tss", "TSS");
        config.tts = validateZoneDistance(params, "tts", "TTS");
        config.promoter = validateZoneDistance(params, "promoter", "promoter");

        config.percArea = validatePercentage(params, "perc_area", "area");
        config.percRegion = validatePercentage(params, "perc_region", "region");

        const auto rules =
            MatchConfig::parseRules(ParameterValidator::getValue<std::string>(params, "rules"));
        if (!rules) {
            Logger::log(LogLevel::ERROR, "Rules not properly passed.");
        }
        config.rules = rules.value();

        return config;
    }

    static auto validateReportLevel(const po::variables_map& params) -> ReportLevel {
        std::istringstream levelStream{ParameterValidator::getValue<std::string>(params, "report")};

        ReportLevel level{ReportLevel::EXON};
        if (!(levelStream >> level)) {
            Logger::log(LogLevel::ERROR,
                        "Report can only be one of the following: exon, transcript or gene");
        }

        return level;
    }

    static auto validateZoneDistance(const po::variables_map& params, const std::string& paramName,
                                     const std::string& zoneName) -> int64_t {
        if (ParameterValidator::getValue<int64_t>(params, paramName) < 0) {
            Logger::log(LogLevel::ERROR, "The ", zoneName, " distance cannot be lower than 0 bps.");
        }

        return ParameterValidator::validateArithmetic<int64_t>(
            params, paramName, 0, constants::pipelines::maxDistanceBp);
    }

    static auto validatePercentage(const po::variables_map& params, const std::string& paramName,
                                   const std::string& subject) -> double {
        const auto percentage = ParameterValidator::getValue<double>(params, paramName);

        if (percentage < 0.0 || percentage > 100.0) {
            Logger::log(LogLevel::ERROR, "The percentage of ", subject,
                        " defined was wrong. It should range between 0 and 100.");
        }

        return percentage;
    }
};

}  // namespace pipelines::match
