#pragma once

// Standard
#include <concepts>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <string>

// Boost
#include <boost/any.hpp>
#include <boost/program_options.hpp>
#include <boost/program_options/errors.hpp>
#include <boost/program_options/variables_map.hpp>

// Internal
#include "Logger.hpp"

namespace po = boost::program_options;

template <typename T>
concept arithmetic = std::integral<T> or std::floating_point<T>;

struct ParameterValidator {
    template <typename T>
        requires arithmetic<T>
    static auto validateArithmetic(const po::variables_map& params, const std::string& paramName,
                                   const T lowerLimit, const T upperLimit) -> T {
        Logger::log(LogLevel::DEBUG, "Validating ", paramName, " parameter. Lower limit: ",
                    lowerLimit, ". Upper limit: ", upperLimit, ".");

        const T value = getValue<T>(params, paramName);

        if (value < lowerLimit || value > upperLimit) {
            Logger::log(LogLevel::ERROR, paramName, " must be a value between ",
                        std::to_string(lowerLimit), " and ", std::to_string(upperLimit));
        }

        return value;
    }

    template <typename T>
    static auto getValue(const po::variables_map& params, const std::string& paramName) -> T {
        if (params.count(paramName) == 0U) {
            Logger::log(LogLevel::ERROR, paramName, " is a required parameter.");
        }

        try {
            return params[paramName].as<T>();
        } catch (const boost::bad_any_cast& e) {
            Logger::log(LogLevel::ERROR, "Check parameter '", paramName,
                        "': value has the wrong type. ", std::string(e.what()));
        }
        exit(EXIT_FAILURE);
    }

    static auto validateFilePath(const po::variables_map& params,
                                 const std::string& paramName) -> std::filesystem::path {
        const std::filesystem::path filePath{getValue<std::string>(params, paramName)};

        if (!std::filesystem::exists(filePath) || std::filesystem::is_directory(filePath)) {
            Logger::log(LogLevel::ERROR, "Check parameter '", paramName, "': ", filePath,
                        " is not a valid file path.");
        }

        return filePath;
    }

    static auto validateOutputPath(const po::variables_map& params,
                                   const std::string& paramName) -> std::filesystem::path {
        const std::filesystem::path filePath{getValue<std::string>(params, paramName)};
        const std::filesystem::path parentDir = filePath.parent_path();

        if (std::filesystem::is_directory(filePath) ||
            (!parentDir.empty() && !std::filesystem::is_directory(parentDir))) {
            Logger::log(LogLevel::ERROR, "Check parameter '", paramName, "': ", filePath,
                        " is not a writable file path.");
        }

        return filePath;
    }
};
