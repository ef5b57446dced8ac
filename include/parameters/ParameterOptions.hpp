#pragma once

// Boost
#include <boost/program_options/options_description.hpp>

namespace po = boost::program_options;

class ParameterOptions {
   public:
    ParameterOptions() = delete;
    ParameterOptions(const ParameterOptions &) = delete;
    ParameterOptions(ParameterOptions &&) = delete;
    auto operator=(const ParameterOptions &) -> ParameterOptions & = delete;
    auto operator=(ParameterOptions &&) -> ParameterOptions & = delete;
    ~ParameterOptions() = delete;

    // Input files, output, logging and threading.
    static auto getGeneralOptions() -> po::options_description;
    // Report level, distances, thresholds, tie-break rules and attribute keys.
    static auto getMatchOptions() -> po::options_description;
    // Options that are only valid on the command line.
    static auto getOtherOptions() -> po::options_description;
};
