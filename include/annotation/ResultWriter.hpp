#pragma once

// Standard
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

// Internal
#include "Candidate.hpp"
#include "GenomicRegion.hpp"

namespace annotation {

namespace fs = std::filesystem;

/**
 * @brief Writes region to gene associations as a tab separated table.
 */
class ResultWriter {
   public:
    explicit ResultWriter(const fs::path &outputPath);
    ResultWriter(const ResultWriter &) = delete;
    ResultWriter(ResultWriter &&) = delete;
    auto operator=(const ResultWriter &) -> ResultWriter & = delete;
    auto operator=(ResultWriter &&) -> ResultWriter & = delete;
    ~ResultWriter() = default;

    void writeHeader(size_t metadataColumns);

    /** @return Number of lines written. */
    auto writeRegion(const dataTypes::GenomicRegion &region,
                     const std::vector<dataTypes::Candidate> &candidates) -> size_t;

    /** @throws std::runtime_error if any write failed. */
    void flush();

    [[nodiscard]] static auto formatHeader(size_t metadataColumns) -> std::string;
    [[nodiscard]] static auto formatLine(const dataTypes::GenomicRegion &region,
                                         const dataTypes::Candidate &candidate) -> std::string;

   private:
    fs::path outputPath;
    std::ofstream outputFile;

    void checkStream();
};

}  // namespace annotation
