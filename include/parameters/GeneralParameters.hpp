#pragma once

// Standard
#include <climits>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <thread>

// Boost
#include <boost/program_options.hpp>
#include <boost/program_options/variables_map.hpp>

// Internal
#include "Logger.hpp"
#include "ParameterValidator.hpp"

namespace po = boost::program_options;
class GeneralParameters {
   public:
    std::filesystem::path annotationPath;
    std::filesystem::path regionsPath;
    std::filesystem::path outputPath;

    LogLevel logLevel;

    size_t threadCount;
    size_t batchSize;

    GeneralParameters(const po::variables_map& params)
        : annotationPath(ParameterValidator::validateFilePath(params, "gtf")),
          regionsPath(ParameterValidator::validateFilePath(params, "bed")),
          outputPath(ParameterValidator::validateOutputPath(params, "output")),
          logLevel(validateLogLevel(params)),
          threadCount(validateThreadCount(params)),
          batchSize(validateBatchSize(params)) {};

   private:
    static auto validateLogLevel(const po::variables_map& params) -> LogLevel {
        const auto logLevel =
            Logger::parseLogLevel(ParameterValidator::getValue<std::string>(params, "loglevel"));

        if (!logLevel) {
            Logger::log(LogLevel::ERROR, "Invalid log level specified.");
        }

        return logLevel.value();
    }

    static auto validateThreadCount(const po::variables_map& params) -> size_t {
        const int requested = ParameterValidator::validateArithmetic(params, "threads", 0, INT_MAX);

        if (requested != 0) {
            return static_cast<size_t>(requested);
        }

        const unsigned int hardwareThreads = std::thread::hardware_concurrency();
        Logger::log(LogLevel::DEBUG, "Detected ", hardwareThreads, " hardware threads");
        return hardwareThreads == 0 ? 1 : hardwareThreads;
    }

    static auto validateBatchSize(const po::variables_map& params) -> size_t {
        const auto batchSize = ParameterValidator::getValue<size_t>(params, "batch-size");

        if (batchSize == 0) {
            Logger::log(LogLevel::ERROR, "Batch size must be greater than 0");
        }

        return batchSize;
    }
};
