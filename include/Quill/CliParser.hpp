// =================================================================
// include/Quill/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Quill {

// A simple struct to hold parsed command information.
struct Commands {
    std::vector<std::string> paths;

    // Filters
    std::vector<std::string> extensions;
    std::vector<std::string> ignore_patterns;
    bool include_hidden = false;
    bool ignore_files_only = false;
    bool ignore_gitignore = false;
    bool no_ignore_default = false;

    // Output
    std::string output_file;
    bool line_numbers = false;
    bool extract_sqlite = false;
    bool stats = false;
    size_t top_files = 0;       // 0 keeps the configured value
    std::string cwd;

    // Input
    bool null_separator = false;

    // Ambient
    std::string config_path = ".quill/config.yml";
    bool verbose = false;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI options and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupFilterOptions(CLI::App& app);
    void setupOutputOptions(CLI::App& app);
    void setupInputOptions(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Quill
