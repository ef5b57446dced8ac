#include "ResultWriter.hpp"

// Standard
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

// Internal
#include "Constants.hpp"
#include "Utility.hpp"

namespace annotation {

ResultWriter::ResultWriter(const fs::path &outputPath)
    : outputPath(outputPath), outputFile(outputPath) {
    if (!outputFile.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + outputPath.string());
    }
}

void ResultWriter::writeHeader(size_t metadataColumns) {
    outputFile << formatHeader(metadataColumns) << '\n';
    checkStream();
}

auto ResultWriter::writeRegion(const dataTypes::GenomicRegion &region,
                               const std::vector<dataTypes::Candidate> &candidates) -> size_t {
    for (const auto &candidate : candidates) {
        outputFile << formatLine(region, candidate) << '\n';
    }
    checkStream();
    return candidates.size();
}

void ResultWriter::flush() {
    outputFile.flush();
    checkStream();
}

void ResultWriter::checkStream() {
    if (!outputFile) [[unlikely]] {
        throw std::runtime_error("Could not write to file: " + outputPath.string());
    }
}

auto ResultWriter::formatHeader(size_t metadataColumns) -> std::string {
    const auto &metadataHeaders = constants::annotation::bedMetadataHeaders;
    std::string header = constants::output::BASE_HEADER;

    const size_t headerColumns = std::min(metadataColumns, metadataHeaders.size());
    for (size_t i = 0; i < headerColumns; ++i) {
        header += '\t';
        header += metadataHeaders[i];
    }
    return header;
}

auto ResultWriter::formatLine(const dataTypes::GenomicRegion &region,
                              const dataTypes::Candidate &candidate) -> std::string {
    std::ostringstream line;
    line << region.id() << '\t' << region.midpoint() << '\t' << candidate.geneID << '\t'
         << candidate.transcriptID << '\t' << candidate.exonNumber << '\t' << candidate.area
         << '\t' << candidate.distance << '\t' << candidate.tssDistance << '\t' << std::fixed
         << std::setprecision(constants::output::percentagePrecision)
         << candidate.regionPercentage << '\t' << candidate.areaPercentage;

    if (!region.metadata.empty()) {
        std::string metadata;
        for (size_t i = 0; i < region.metadata.size(); ++i) {
            if (i > 0) {
                metadata += '\t';
            }
            metadata += region.metadata[i];
        }
        line << '\t' << helper::trimRight(metadata);
    }

    return line.str();
}

}  // namespace annotation
