#include "RegionReader.hpp"

// Standard
#include <algorithm>
#include <string>

// Internal
#include "Constants.hpp"
#include "Utility.hpp"

using namespace constants::annotation;

namespace annotation {

auto RegionReader::readChunk(size_t chunkSize)
    -> std::optional<std::vector<dataTypes::GenomicRegion>> {
    std::vector<dataTypes::GenomicRegion> regions;
    regions.reserve(chunkSize);

    std::string line;
    while (regions.size() < chunkSize && reader.nextLine(line)) {
        auto region = parseLine(line);
        if (region.has_value()) {
            regions.push_back(std::move(region.value()));
        }
    }

    if (regions.empty()) {
        return std::nullopt;
    }
    return regions;
}

auto RegionReader::parseLine(std::string_view line) -> std::optional<dataTypes::GenomicRegion> {
    line = helper::trimRight(line);
    if (line.empty()) {
        return std::nullopt;
    }

    const auto tokens = helper::splitTokens(line, '\t');
    if (tokens.size() < minimumBedTokenCount) {
        return std::nullopt;
    }

    const auto startPosition = helper::parseInteger(tokens[1]);
    const auto endPosition = helper::parseInteger(tokens[2]);
    if (!startPosition.has_value() || !endPosition.has_value()) {
        return std::nullopt;
    }

    const size_t metadataEnd =
        std::min(tokens.size(), minimumBedTokenCount + maximumBedMetadataColumns);
    std::vector<std::string> metadata;
    for (size_t i = minimumBedTokenCount; i < metadataEnd; ++i) {
        metadata.emplace_back(tokens[i]);
    }
    maxMetadataColumns = std::max(maxMetadataColumns, metadata.size());

    return dataTypes::GenomicRegion{std::string(tokens[0]), startPosition.value(),
                                    endPosition.value(), std::move(metadata)};
}

}  // namespace annotation
