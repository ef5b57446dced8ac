#include "MatchConfig.hpp"

// Standard
#include <algorithm>
#include <sstream>
#include <unordered_set>

namespace pipelines::match {

auto MatchConfig::maxLookbackDistance() const -> int64_t {
    return std::max({distance, tss, tts, promoter});
}

auto MatchConfig::parseRules(const std::string &rulesString)
    -> std::optional<std::vector<dataTypes::Area>> {
    std::vector<dataTypes::Area> parsedRules;
    std::unordered_set<dataTypes::Area> seenAreas;

    // getline drops a trailing empty token
    if (rulesString.ends_with(',')) {
        return std::nullopt;
    }

    std::stringstream ss(rulesString);
    for (std::string tag; std::getline(ss, tag, ',');) {
        const auto area = dataTypes::parseArea(tag);
        if (!area.has_value() || seenAreas.contains(area.value())) {
            return std::nullopt;
        }
        seenAreas.insert(area.value());
        parsedRules.push_back(area.value());
    }

    if (parsedRules.size() != dataTypes::allAreas.size()) {
        return std::nullopt;
    }

    return parsedRules;
}

}  // namespace pipelines::match
