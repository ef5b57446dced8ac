#pragma once

// Standard
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace helper {

/**
 * @brief Share of part in whole in percent.
 * @return 0 if whole is not positive.
 */
inline auto percentage(int64_t part, int64_t whole) -> double {
    if (whole <= 0) [[unlikely]] {
        return 0.0;
    }
    return (static_cast<double>(part) / static_cast<double>(whole)) * 100.0;
}

inline auto trimRight(std::string_view text) -> std::string_view {
    const auto last = text.find_last_not_of(" \t\r\n\v\f");
    return last == std::string_view::npos ? std::string_view{} : text.substr(0, last + 1);
}

auto splitTokens(std::string_view line, char delimiter) -> std::vector<std::string_view>;

// Whole token must be a base 10 integer
auto parseInteger(std::string_view token) -> std::optional<int64_t>;

void crashHandler(int sig);

class Timer {
   public:
    Timer() : start(std::chrono::steady_clock::now()) {}
    Timer(const Timer &) = default;
    Timer(Timer &&) = delete;
    auto operator=(const Timer &) -> Timer & = default;
    auto operator=(Timer &&) -> Timer & = delete;
    ~Timer() = default;

    [[nodiscard]] auto elapsedMilliseconds() const -> double;

   private:
    std::chrono::time_point<std::chrono::steady_clock> start;
};
}  // namespace helper
