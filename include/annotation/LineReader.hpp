#pragma once

// Standard
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

// zlib
#include <zlib.h>

namespace annotation {

namespace fs = std::filesystem;

/**
 * @brief Reads a plain or gzip compressed text file line by line.
 *
 * Line terminators (\n and \r\n) are stripped.
 */
class LineReader {
   public:
    explicit LineReader(const fs::path &filePath);
    LineReader(const LineReader &) = delete;
    LineReader(LineReader &&) = delete;
    auto operator=(const LineReader &) -> LineReader & = delete;
    auto operator=(LineReader &&) -> LineReader & = delete;
    ~LineReader();

    /**
     * @brief Reads the next line.
     * @return false at the end of the file.
     * @throws std::runtime_error if the file can not be decompressed.
     */
    auto nextLine(std::string &line) -> bool;

    [[nodiscard]] auto lineNumber() const -> size_t { return currentLine; }

   private:
    static constexpr size_t bufferSize = 65536;

    fs::path filePath;
    gzFile file;
    std::vector<char> buffer;
    size_t currentLine = 0;
};

}  // namespace annotation
