#pragma once

// Standard
#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>

namespace dataTypes {

/**
 * @brief Genic context a region can be associated with.
 *
 * The declaration order carries no priority. Priorities are always given explicitly as an ordered
 * list of areas.
 */
enum class Area : uint8_t { TSS, FIRST_EXON, PROMOTER, TTS, INTRON, GENE_BODY, UPSTREAM, DOWNSTREAM };

constexpr std::array<Area, 8> allAreas{Area::TSS,    Area::FIRST_EXON, Area::PROMOTER,
                                       Area::TTS,    Area::INTRON,     Area::GENE_BODY,
                                       Area::UPSTREAM, Area::DOWNSTREAM};

constexpr auto areaTag(Area area) -> std::string_view {
    switch (area) {
        case Area::TSS:
            return "TSS";
        case Area::FIRST_EXON:
            return "1st_EXON";
        case Area::PROMOTER:
            return "PROMOTER";
        case Area::TTS:
            return "TTS";
        case Area::INTRON:
            return "INTRON";
        case Area::GENE_BODY:
            return "GENE_BODY";
        case Area::UPSTREAM:
            return "UPSTREAM";
        case Area::DOWNSTREAM:
            return "DOWNSTREAM";
    }
    return "";
}

// Case-sensitive
constexpr auto parseArea(std::string_view tag) -> std::optional<Area> {
    for (const Area area : allAreas) {
        if (areaTag(area) == tag) {
            return area;
        }
    }
    return std::nullopt;
}

inline auto operator<<(std::ostream &stream, Area area) -> std::ostream & {
    return stream << areaTag(area);
}

}  // namespace dataTypes
