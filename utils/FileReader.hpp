#pragma once

#include <string>
#include <vector>

class FileReader {
public:
    // Reads a whole file as bytes. Relative paths are also looked up under
    // bin/ so the program runs from the source tree or the build tree.
    static std::vector<char> readFile(const std::string& filename);
};
