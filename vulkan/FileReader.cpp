#include "FileReader.hpp"
#include <fstream>
#include <stdexcept>

#ifndef PAINTER_HOUSE_BUILD_DIR
#define PAINTER_HOUSE_BUILD_DIR "."
#endif

namespace {
    bool readInto(const std::string& path, std::vector<char>& buffer) {
        std::ifstream file(path, std::ios::ate | std::ios::binary);
        if (!file.is_open()) {
            return false;
        }
        size_t fileSize = (size_t)file.tellg();
        buffer.resize(fileSize);
        file.seekg(0);
        file.read(buffer.data(), fileSize);
        return static_cast<bool>(file);
    }
}

std::vector<char> FileReader::readFile(const std::string& filename) {
    std::vector<char> buffer;
    if (readInto(filename, buffer)) {
        return buffer;
    }
    std::string alt = std::string(PAINTER_HOUSE_BUILD_DIR) + "/" + filename;
    if (readInto(alt, buffer)) {
        return buffer;
    }
    throw std::runtime_error("failed to open file: " + filename);
}
