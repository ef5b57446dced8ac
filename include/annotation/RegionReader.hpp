#pragma once

// Standard
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

// Internal
#include "GenomicRegion.hpp"
#include "LineReader.hpp"

namespace annotation {

namespace fs = std::filesystem;

/**
 * @brief Streams the regions of a plain or gzip compressed BED file in chunks.
 *
 * Lines with fewer than three columns or non numeric coordinates (track, browser and header
 * lines) are skipped. Up to nine columns after the coordinates are kept as metadata.
 */
class RegionReader {
   public:
    explicit RegionReader(const fs::path &regionsPath) : reader(regionsPath) {};
    RegionReader(const RegionReader &) = delete;
    RegionReader(RegionReader &&) = delete;
    auto operator=(const RegionReader &) -> RegionReader & = delete;
    auto operator=(RegionReader &&) -> RegionReader & = delete;
    ~RegionReader() = default;

    /**
     * @brief Reads up to chunkSize regions in file order.
     * @return std::nullopt once no region is left.
     */
    auto readChunk(size_t chunkSize) -> std::optional<std::vector<dataTypes::GenomicRegion>>;

    /** @brief Largest number of metadata columns seen so far. */
    [[nodiscard]] auto metadataColumnCount() const -> size_t { return maxMetadataColumns; }

   private:
    LineReader reader;
    size_t maxMetadataColumns = 0;

    [[nodiscard]] auto parseLine(std::string_view line) -> std::optional<dataTypes::GenomicRegion>;
};

}  // namespace annotation
