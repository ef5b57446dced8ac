#pragma once

// Standard
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

// seqan3
#include <seqan3/core/debug_stream.hpp>

enum class LogLevel { DEBUG, INFO, WARNING, ERROR };

/**
 * @brief Process wide logger writing to the seqan3 debug stream.
 *
 * Logging at ERROR level terminates the process.
 */
class Logger {
   public:
    Logger(Logger &&) = delete;
    auto operator=(Logger &&) -> Logger & = delete;
    Logger(const Logger &) = delete;
    auto operator=(const Logger &) -> Logger & = delete;
    ~Logger() = default;

    static auto getInstance() -> Logger & {
        static Logger instance;
        return instance;
    }

    // Case insensitive
    static auto parseLogLevel(std::string_view logLevelString) -> std::optional<LogLevel> {
        std::string lowered{logLevelString};
        std::ranges::transform(lowered, lowered.begin(),
                               [](unsigned char c) { return std::tolower(c); });

        if (lowered == "debug") {
            return LogLevel::DEBUG;
        }
        if (lowered == "info") {
            return LogLevel::INFO;
        }
        if (lowered == "warning") {
            return LogLevel::WARNING;
        }
        if (lowered == "error") {
            return LogLevel::ERROR;
        }
        return std::nullopt;
    }

    static void setLogLevel(const std::string &logLevelString) {
        const auto level = parseLogLevel(logLevelString);
        if (!level) {
            log(LogLevel::ERROR, "Invalid log level: ", logLevelString);
        }
        setLogLevel(level.value());
    }

    static void setLogLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(getInstance().logMutex);
        getInstance().logLevel = level;
    }

    template <typename... Args>
    static void log(LogLevel level, Args &&...args) {
        std::lock_guard<std::mutex> lock(getInstance().logMutex);
        if (level < getInstance().logLevel) {
            return;
        }

        seqan3::debug_stream << "[" << levelName(level) << "] " << getTime();
        (seqan3::debug_stream << ... << std::forward<Args>(args)) << "\n";

        if (level == LogLevel::ERROR) {
            exit(EXIT_FAILURE);
        }
    }

   private:
    Logger() = default;

    LogLevel logLevel{LogLevel::INFO};
    std::mutex logMutex;

    static constexpr auto levelName(LogLevel level) -> std::string_view {
        switch (level) {
            case LogLevel::DEBUG:
                return "DEBUG";
            case LogLevel::INFO:
                return "INFO";
            case LogLevel::WARNING:
                return "WARNING";
            case LogLevel::ERROR:
                return "ERROR";
        }
        return "INFO";
    }

    static auto getTime() -> std::string {
        const auto now = std::chrono::system_clock::now();
        const std::time_t currentTime = std::chrono::system_clock::to_time_t(now);

        std::ostringstream timeStream;
        timeStream << std::put_time(std::localtime(&currentTime), "[%Y-%m-%d %H:%M:%S]") << " ";

        return timeStream.str();
    };
};
