#include "LineReader.hpp"

// Standard
#include <stdexcept>

namespace annotation {

LineReader::LineReader(const fs::path &filePath)
    : filePath(filePath), file(gzopen(filePath.c_str(), "rb")), buffer(bufferSize) {
    if (file == nullptr) {
        throw std::runtime_error("Could not open file: " + filePath.string());
    }
    gzbuffer(file, static_cast<unsigned>(bufferSize) * 2);
}

LineReader::~LineReader() { gzclose(file); }

auto LineReader::nextLine(std::string &line) -> bool {
    line.clear();

    while (gzgets(file, buffer.data(), static_cast<int>(buffer.size())) != nullptr) {
        line.append(buffer.data());
        if (!line.empty() && line.back() == '\n') {
            line.pop_back();
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            ++currentLine;
            return true;
        }
    }

    int errorCode = Z_OK;
    const char *message = gzerror(file, &errorCode);
    if (errorCode != Z_OK && errorCode != Z_STREAM_END) {
        throw std::runtime_error("Could not read " + filePath.string() + ": " + message);
    }

    // Last line without terminator
    if (!line.empty()) {
        if (line.back() == '\r') {
            line.pop_back();
        }
        ++currentLine;
        return true;
    }

    return false;
}

}  // namespace annotation
