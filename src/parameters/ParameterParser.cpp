#include "ParameterParser.hpp"

#include <fstream>
#include <iostream>
#include <string>

#include "Constants.hpp"
#include "Logger.hpp"
#include "ParameterOptions.hpp"

namespace pipelines {
auto ParameterParser::getParameters(int argc, const char *const argv[])  // NOLINT
    -> match::MatchParameters {
    const auto params = parseParameters(argc, argv);

    return match::MatchParameters{params};
}

auto ParameterParser::parseParameters(int argc,
                                      const char *const argv[]) -> po::variables_map {  // NOLINT
    const po::options_description commandLineOptions{getCommandLineOptions()};

    po::variables_map params;
    try {
        store(po::command_line_parser(argc, argv).options(commandLineOptions).run(), params);
        notify(params);
    } catch (const po::error &e) {
        Logger::log(LogLevel::ERROR, "Invalid command line: ", std::string(e.what()));
    }

    if (params.count("help") != 0U) {
        std::cout << commandLineOptions << std::endl;
        exit(EXIT_SUCCESS);
    }

    if (params.count("version") != 0U) {
        printVersion();
        exit(EXIT_SUCCESS);
    }

    Logger::setLogLevel(params["loglevel"].as<std::string>());

    printVersion();

    insertConfigFileParameters(params);

    return params;
}

void ParameterParser::insertConfigFileParameters(po::variables_map &params) {
    if (params.count("config") == 0) {
        return;
    }

    const po::options_description configFileOptions{getConfigFileOptions()};

    const std::string configFilePath{params["config"].as<std::string>()};

    std::ifstream configIn{configFilePath};

    if (!configIn) {
        Logger::log(LogLevel::ERROR, "Configuration file could not be opened: ", configFilePath);
    }

    try {
        po::store(po::parse_config_file(configIn, configFileOptions), params);
        notify(params);
    } catch (const po::error &e) {
        Logger::log(LogLevel::ERROR, "Invalid configuration file ", configFilePath, ": ",
                    std::string(e.what()));
    }

    Logger::setLogLevel(params["loglevel"].as<std::string>());
}

auto ParameterParser::getCommandLineOptions() -> po::options_description {
    po::options_description commandLineOptions{"Command line options"};

    commandLineOptions.add(getConfigFileOptions()).add(ParameterOptions::getOtherOptions());

    return commandLineOptions;
}

auto ParameterParser::getConfigFileOptions() -> po::options_description {
    po::options_description configFileOptions{"Config file options"};

    configFileOptions.add(ParameterOptions::getGeneralOptions())
        .add(ParameterOptions::getMatchOptions());

    return configFileOptions;
}

void ParameterParser::printVersion() {
    const std::string versionString =
        "RegionMatch v" + std::to_string(RegionMatch_VERSION_MAJOR) + "." +
        std::to_string(RegionMatch_VERSION_MINOR) + "." +
        std::to_string(RegionMatch_VERSION_PATCH) + " - " +
        "Associate genomic regions with nearby and overlapping genes.";

    Logger::log(LogLevel::INFO, versionString);
}

}  // namespace pipelines
