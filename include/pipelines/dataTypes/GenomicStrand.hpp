#pragma once

// Standard
#include <optional>
#include <string_view>

namespace dataTypes {
enum Strand : char { FORWARD = '+', REVERSE = '-' };

inline auto parseStrand(std::string_view token) -> std::optional<Strand> {
    if (token == "+") {
        return Strand::FORWARD;
    }
    if (token == "-") {
        return Strand::REVERSE;
    }
    return std::nullopt;
}

}  // namespace dataTypes
