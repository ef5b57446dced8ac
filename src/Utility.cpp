#include "Utility.hpp"

// Standard
#include <execinfo.h>
#include <unistd.h>

#include <array>
#include <charconv>
#include <cstdlib>
#include <iostream>

namespace helper {

void crashHandler(int sig) {
    constexpr size_t MAX_FRAMES = 10;
    std::array<void*, MAX_FRAMES> array{};
    int size = backtrace(array.data(), MAX_FRAMES);

    // print out all the frames to stderr
    std::cerr << "Error: signal " << sig << ":" << '\n';
    backtrace_symbols_fd(array.data(), size, STDERR_FILENO);
    exit(1);
}

auto splitTokens(std::string_view line, char delimiter) -> std::vector<std::string_view> {
    std::vector<std::string_view> tokens;
    size_t tokenStart = 0;
    while (true) {
        const size_t tokenEnd = line.find(delimiter, tokenStart);
        if (tokenEnd == std::string_view::npos) {
            tokens.push_back(line.substr(tokenStart));
            break;
        }
        tokens.push_back(line.substr(tokenStart, tokenEnd - tokenStart));
        tokenStart = tokenEnd + 1;
    }
    return tokens;
}

auto parseInteger(std::string_view token) -> std::optional<int64_t> {
    if (!token.empty() && token.front() == '+') {
        token.remove_prefix(1);
        if (!token.empty() && token.front() == '-') {
            return std::nullopt;
        }
    }

    int64_t value = 0;
    const char* tokenEnd = token.data() + token.size();
    const auto [position, errorCode] = std::from_chars(token.data(), tokenEnd, value);

    if (errorCode != std::errc{} || position != tokenEnd || token.empty()) {
        return std::nullopt;
    }
    return value;
}

auto Timer::elapsedMilliseconds() const -> double {
    const auto end = std::chrono::steady_clock::now();
    const std::chrono::duration<double, std::milli> elapsed = end - start;
    return elapsed.count();
}

}  // namespace helper
