#pragma once

// Standard
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace dataTypes {
/**
 * @brief Represents a genomic region read from a BED file.
 */
struct GenomicRegion {
    std::string referenceID;
    int64_t startPosition;
    int64_t endPosition;
    std::vector<std::string> metadata;

    /**
     * @brief Constructs a GenomicRegion object.
     * @param referenceID The chromosome of the region.
     * @param startPosition The start position of the region.
     * @param endPosition The end position of the region (inclusive).
     * @param metadata Additional BED columns in file order.
     */
    GenomicRegion(std::string referenceID, int64_t startPosition, int64_t endPosition,
                  std::vector<std::string> metadata = {})
        : referenceID(std::move(referenceID)),
          startPosition(startPosition),
          endPosition(endPosition),
          metadata(std::move(metadata)) {};

    [[nodiscard]] auto length() const -> int64_t { return endPosition - startPosition + 1; }

    // Truncating division
    [[nodiscard]] auto midpoint() const -> int64_t { return (startPosition + endPosition) / 2; }

    [[nodiscard]] auto id() const -> std::string {
        return referenceID + "_" + std::to_string(startPosition) + "_" +
               std::to_string(endPosition);
    }
};
}  // namespace dataTypes
