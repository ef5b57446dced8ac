#pragma once

// Standard
#include <cstdlib>

// Boost
#include <boost/program_options.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

// Internal
#include "Config.hpp"
#include "MatchParameters.hpp"

namespace po = boost::program_options;

namespace pipelines {
class ParameterParser {
   public:
    ParameterParser() = delete;

    /**
     * @brief Reads the command line and an optional config file into validated parameters.
     *
     * Exits after printing the help or version. Invalid parameters are logged as errors.
     */
    static auto getParameters(int argc, const char* const argv[])  // NOLINT
        -> match::MatchParameters;

    static auto parseParameters(int argc, const char* const argv[])  // NOLINT
        -> po::variables_map;

   private:
    static void insertConfigFileParameters(po::variables_map& params);

    static auto getCommandLineOptions() -> po::options_description;
    static auto getConfigFileOptions() -> po::options_description;

    static void printVersion();
};

}  // namespace pipelines
