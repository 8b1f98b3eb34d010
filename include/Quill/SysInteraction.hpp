// =================================================================
// include/Quill/SysInteraction.hpp
// =================================================================
// Defines the interface for system-level operations: whole-file reads,
// path checks and reading a path list from standard input.

#pragma once

#include <string>
#include <vector>
#include <istream>

namespace Quill {

class SysInteraction {
public:
    /**
     * @brief Reads the entire content of a file into a string, byte for byte.
     * @param file_path The path to the file.
     * @return The content of the file. Throws std::runtime_error on failure.
     */
    std::string readFile(const std::string& file_path) const;

    /**
     * @brief Checks if a path exists (file, directory or anything else).
     */
    bool pathExists(const std::string& path) const;

    /**
     * @brief True when standard input is attached to a terminal.
     */
    bool isInteractiveInput() const;

    /**
     * @brief Reads a path list from a stream.
     * @param input Stream to consume completely.
     * @param use_null_separator Split on NUL instead of whitespace.
     * @return Non-empty entries in input order.
     */
    std::vector<std::string> readPathList(std::istream& input, bool use_null_separator) const;
};

} // namespace Quill
