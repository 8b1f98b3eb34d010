// =================================================================
// include/Quill/ScanConfig.hpp
// =================================================================
// Merged settings for one invocation: configuration file values first,
// command-line overrides on top.

#pragma once

#include "IgnoreFilter.hpp"
#include <string>
#include <vector>

namespace Quill {

class ConfigParser;
struct Commands;

/**
 * @brief Configuration settings for a scan
 */
struct ScanConfig {
    // Filter settings
    std::vector<std::string> extensions;
    std::vector<std::string> ignore_patterns;
    std::vector<std::string> default_ignore_patterns = getDefaultIgnorePatterns();
    bool use_default_ignore = true;
    bool include_hidden = false;
    bool ignore_files_only = false;
    bool ignore_gitignore = false;

    // Output settings
    bool line_numbers = false;
    bool extract_sqlite = false;
    bool stats = false;
    size_t top_files = 10;
    std::string root_path;
    std::string output_file;

    // Logging settings
    std::string log_level = "warning";
    std::string log_file;
    
    /**
     * @brief Load configuration from ConfigParser
     * @param config ConfigParser instance
     */
    void loadFromConfig(const ConfigParser& config);
    
    /**
     * @brief Apply command-line overrides
     * @param commands Command-line arguments
     */
    void applyCommandOverrides(const Commands& commands);
    
    /**
     * @brief Get merged ignore patterns (defaults when enabled, then user patterns)
     * @return Vector of glob patterns
     */
    std::vector<std::string> getMergedIgnorePatterns() const;

    /**
     * @brief Build the read-only filter context for the traversal
     * @param resolver Gitignore resolver, or nullptr
     */
    IgnoreContext toIgnoreContext(const IgnoreResolver* resolver) const;
    
    /**
     * @brief Get default ignore patterns
     * @return Common VCS, lockfile and license names
     */
    static std::vector<std::string> getDefaultIgnorePatterns();
};

} // namespace Quill
