#include "FileReader.hpp"
#include <fstream>
#include <stdexcept>

namespace {

bool readInto(const std::string& path, std::vector<char>& buffer) {
    std::ifstream file(path, std::ios::ate | std::ios::binary);
    if (!file.is_open()) return false;

    size_t fileSize = static_cast<size_t>(file.tellg());
    buffer.resize(fileSize);
    file.seekg(0);
    file.read(buffer.data(), static_cast<std::streamsize>(fileSize));
    if (!file) {
        throw std::runtime_error("failed to read file: " + path);
    }
    return true;
}

}

std::vector<char> FileReader::readFile(const std::string& filename) {
    std::vector<char> buffer;
    if (readInto(filename, buffer)) return buffer;
    if (!filename.empty() && filename[0] != '/' && readInto("bin/" + filename, buffer)) return buffer;
    throw std::runtime_error("failed to open file: " + filename);
}
