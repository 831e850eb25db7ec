#pragma once

#include <string>
#include <vector>

class FileReader {
public:
    // Reads a whole binary file. Relative paths that do not resolve from the
    // working directory are retried under the build's shader output directory.
    // Throws std::runtime_error when neither location can be opened.
    static std::vector<char> readFile(const std::string& filename);
};
