// =================================================================
// src/Quill/SysInteraction.cpp
// =================================================================
// Implementation for system-level operations.

#include "Quill/SysInteraction.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

namespace Quill {

std::string SysInteraction::readFile(const std::string& file_path) const {
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream) {
        throw std::runtime_error("Failed to open file: " + file_path);
    }
    std::stringstream buffer;
    buffer << file_stream.rdbuf();
    if (file_stream.bad()) {
        throw std::runtime_error("Failed to read file: " + file_path);
    }
    return buffer.str();
}

bool SysInteraction::pathExists(const std::string& path) const {
    struct stat buffer;
    return stat(path.c_str(), &buffer) == 0;
}

bool SysInteraction::isInteractiveInput() const {
    return isatty(STDIN_FILENO) != 0;
}

std::vector<std::string> SysInteraction::readPathList(std::istream& input, bool use_null_separator) const {
    std::vector<std::string> paths;

    if (use_null_separator) {
        std::string entry;
        while (std::getline(input, entry, '\0')) {
            if (!entry.empty()) {
                paths.push_back(entry);
            }
        }
        return paths;
    }

    // operator>> splits on any whitespace and never yields empty tokens
    std::string entry;
    while (input >> entry) {
        paths.push_back(entry);
    }
    return paths;
}

} // namespace Quill
