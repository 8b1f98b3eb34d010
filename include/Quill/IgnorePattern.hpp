// =================================================================
// include/Quill/IgnorePattern.hpp
// =================================================================
// Header for gitignore-compatible pattern matching functionality.

#pragma once

#include <string>
#include <vector>
#include <regex>
#include <optional>

namespace Quill {

/**
 * @brief Gitignore-compatible pattern matching utility
 * 
 * Supports the gitignore pattern syntax:
 * - Wildcards: *, **, ?, [abc], [!abc]
 * - Negation: !pattern
 * - Directory-only patterns: pattern/
 * - Anchored patterns: /pattern or any pattern with an inner slash
 * - Comment lines: # comment
 * - Backslash escapes: \#, \!, "\ "
 *
 * Paths passed to matches() are relative to the directory holding the
 * .gitignore file and use forward slashes.
 */
class IgnorePattern {
public:
    /**
     * @brief Construct a pattern matcher from a gitignore-style pattern
     * @param pattern The pattern string
     */
    explicit IgnorePattern(const std::string& pattern);

    /**
     * @brief Check if a path matches this pattern
     * @param path Path relative to the .gitignore directory
     * @param is_directory True if the path is a directory
     * @return true if path matches the pattern (negation is not applied here)
     */
    bool matches(const std::string& path, bool is_directory = false) const;

    /**
     * @brief Check if this is a negation pattern (starts with !)
     * @return true if this pattern re-includes matches
     */
    bool isNegation() const { return m_is_negation; }

    /**
     * @brief Check if this pattern only matches directories
     * @return true if pattern ends with /
     */
    bool isDirectoryOnly() const { return m_directory_only; }

    /**
     * @brief Check if this pattern is anchored to its .gitignore directory
     */
    bool isAnchored() const { return m_is_anchored; }

    /**
     * @brief Check if pattern is empty or comment
     * @return true if pattern should be ignored
     */
    bool isEmpty() const { return m_is_empty; }

private:
    bool m_is_negation;
    bool m_directory_only;
    bool m_is_anchored;
    bool m_is_empty;
    std::regex m_regex;

    /**
     * @brief Process the raw pattern into internal representation
     * @param pattern Raw pattern string
     */
    void processPattern(const std::string& pattern);

    /**
     * @brief Convert gitignore glob pattern to regex
     * @param glob_pattern Glob pattern string
     * @return Equivalent ECMAScript regex
     */
    std::string globToRegex(const std::string& glob_pattern) const;
};

/**
 * @brief Ordered collection of patterns from one .gitignore file
 */
class IgnorePatternSet {
public:
    /**
     * @brief Add a pattern to the set
     * @param pattern Pattern string
     */
    void addPattern(const std::string& pattern);

    /**
     * @brief Load patterns from a file (e.g., .gitignore)
     * @param file_path Path to ignore file
     * @return Number of patterns loaded
     */
    size_t loadFromFile(const std::string& file_path);

    /**
     * @brief Evaluate the set against a path; the last matching pattern wins
     * @param path Path relative to the .gitignore directory
     * @param is_directory True if path is a directory
     * @return true (ignore), false (re-included by negation), or nullopt
     *         when no pattern matched
     */
    std::optional<bool> lastMatch(const std::string& path, bool is_directory = false) const;

    /**
     * @brief Check if a path should be ignored by this set alone
     */
    bool shouldIgnore(const std::string& path, bool is_directory = false) const {
        return lastMatch(path, is_directory).value_or(false);
    }

    /**
     * @brief Get number of patterns in the set
     * @return Pattern count
     */
    size_t size() const { return m_patterns.size(); }

    bool empty() const { return m_patterns.empty(); }

private:
    std::vector<IgnorePattern> m_patterns;
};

} // namespace Quill
