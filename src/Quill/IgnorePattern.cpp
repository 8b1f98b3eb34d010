// =================================================================
// src/Quill/IgnorePattern.cpp
// =================================================================
// Implementation for gitignore-compatible pattern matching.

#include "Quill/IgnorePattern.hpp"
#include "Quill/Logger.hpp"
#include <fstream>

namespace Quill {

IgnorePattern::IgnorePattern(const std::string& pattern) 
    : m_is_negation(false),
      m_directory_only(false),
      m_is_anchored(false),
      m_is_empty(false)
{
    processPattern(pattern);
}

bool IgnorePattern::matches(const std::string& path, bool is_directory) const {
    if (m_is_empty) {
        return false;
    }
    
    // Directory-only patterns only match directories
    if (m_directory_only && !is_directory) {
        return false;
    }
    
    return std::regex_match(path, m_regex);
}

void IgnorePattern::processPattern(const std::string& pattern) {
    std::string working_pattern = pattern;
    
    // Strip a trailing carriage return left by CRLF files
    if (!working_pattern.empty() && working_pattern.back() == '\r') {
        working_pattern.pop_back();
    }
    
    // Skip empty lines and comments
    if (working_pattern.empty() || working_pattern[0] == '#') {
        m_is_empty = true;
        return;
    }
    
    // Trailing spaces are dropped unless escaped with a backslash
    size_t end = working_pattern.size();
    while (end > 0 && working_pattern[end - 1] == ' ') {
        if (end >= 2 && working_pattern[end - 2] == '\\') {
            break;
        }
        --end;
    }
    working_pattern.erase(end);
    
    if (working_pattern.empty()) {
        m_is_empty = true;
        return;
    }
    
    // Handle negation patterns
    if (working_pattern[0] == '!') {
        m_is_negation = true;
        working_pattern = working_pattern.substr(1);
    }
    
    // Handle directory-only patterns
    if (!working_pattern.empty() && working_pattern.back() == '/') {
        m_directory_only = true;
        while (!working_pattern.empty() && working_pattern.back() == '/') {
            working_pattern.pop_back();
        }
    }
    
    // A leading slash or any inner slash anchors the pattern
    if (!working_pattern.empty() && working_pattern[0] == '/') {
        m_is_anchored = true;
        working_pattern = working_pattern.substr(1);
    } else if (working_pattern.find('/') != std::string::npos) {
        m_is_anchored = true;
    }
    
    if (working_pattern.empty()) {
        m_is_empty = true;
        return;
    }
    
    try {
        m_regex = std::regex(globToRegex(working_pattern), std::regex_constants::ECMAScript);
    } catch (const std::regex_error& e) {
        Logger::getInstance().warning("IgnorePattern",
            "Failed to compile pattern '" + pattern + "'", e.what());
        m_is_empty = true;
    }
}

std::string IgnorePattern::globToRegex(const std::string& glob_pattern) const {
    std::string regex_pattern;
    const size_t length = glob_pattern.length();
    
    for (size_t i = 0; i < length; ++i) {
        char c = glob_pattern[i];
        
        switch (c) {
            case '*': {
                bool double_star = i + 1 < length && glob_pattern[i + 1] == '*';
                bool at_segment_start = i == 0 || glob_pattern[i - 1] == '/';
                if (double_star && at_segment_start) {
                    if (i + 2 == length) {
                        // Trailing ** matches everything inside
                        regex_pattern += ".*";
                        i += 1;
                    } else if (glob_pattern[i + 2] == '/') {
                        // **/ matches zero or more directories
                        regex_pattern += "(?:.*/)?";
                        i += 2;
                    } else {
                        regex_pattern += "[^/]*";
                        i += 1;
                    }
                } else {
                    // * matches anything except /
                    regex_pattern += "[^/]*";
                    while (i + 1 < length && glob_pattern[i + 1] == '*') {
                        ++i;
                    }
                }
                break;
            }
                
            case '?':
                // ? matches any single character except /
                regex_pattern += "[^/]";
                break;
                
            case '[': {
                size_t close = glob_pattern.find(']', i + 2);
                if (close == std::string::npos) {
                    regex_pattern += "\\[";
                    break;
                }
                std::string body = glob_pattern.substr(i + 1, close - i - 1);
                regex_pattern += '[';
                size_t start = 0;
                if (!body.empty() && (body[0] == '!' || body[0] == '^')) {
                    regex_pattern += '^';
                    start = 1;
                }
                for (size_t k = start; k < body.size(); ++k) {
                    if (body[k] == '\\' || body[k] == '[' || body[k] == ']') {
                        regex_pattern += '\\';
                    }
                    regex_pattern += body[k];
                }
                regex_pattern += ']';
                i = close;
                break;
            }
                
            case '\\':
                // Escape the next character
                if (i + 1 < length) {
                    char next = glob_pattern[++i];
                    if (std::string("\\^$.|?*+()[]{}/").find(next) != std::string::npos) {
                        regex_pattern += '\\';
                    }
                    regex_pattern += next;
                } else {
                    regex_pattern += "\\\\";
                }
                break;
                
            default:
                // Escape special regex characters
                if (c == '.' || c == '^' || c == '$' || c == '+' || c == '{' ||
                    c == '}' || c == '|' || c == '(' || c == ')' || c == ']') {
                    regex_pattern += '\\';
                }
                regex_pattern += c;
                break;
        }
    }
    
    if (m_is_anchored) {
        return "^" + regex_pattern + "$";
    }
    // Unanchored patterns match a name at any depth
    return "^(?:.*/)?" + regex_pattern + "$";
}

// IgnorePatternSet implementation

void IgnorePatternSet::addPattern(const std::string& pattern) {
    IgnorePattern ignore_pattern(pattern);
    if (!ignore_pattern.isEmpty()) {
        m_patterns.push_back(std::move(ignore_pattern));
    }
}

size_t IgnorePatternSet::loadFromFile(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return 0;
    }
    
    size_t patterns_loaded = 0;
    std::string line;
    while (std::getline(file, line)) {
        IgnorePattern pattern(line);
        if (!pattern.isEmpty()) {
            m_patterns.push_back(std::move(pattern));
            patterns_loaded++;
        }
    }
    
    return patterns_loaded;
}

std::optional<bool> IgnorePatternSet::lastMatch(const std::string& path, bool is_directory) const {
    std::optional<bool> result;
    
    // Process patterns in order - later patterns override earlier ones
    for (const auto& pattern : m_patterns) {
        if (pattern.matches(path, is_directory)) {
            result = !pattern.isNegation();
        }
    }
    
    return result;
}

} // namespace Quill
