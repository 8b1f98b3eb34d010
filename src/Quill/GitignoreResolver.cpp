// =================================================================
// src/Quill/GitignoreResolver.cpp
// =================================================================
// Implementation for cascading .gitignore resolution.

#include "Quill/GitignoreResolver.hpp"
#include "Quill/Logger.hpp"
#include <system_error>

namespace fs = std::filesystem;

namespace Quill {

namespace {

fs::path normalizedAbsolute(const fs::path& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    absolute = absolute.lexically_normal();
    // Drop the empty trailing element left by "dir/"
    if (!absolute.has_filename() && absolute.has_parent_path() && absolute != absolute.root_path()) {
        absolute = absolute.parent_path();
    }
    return absolute;
}

bool isDirectory(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

/**
 * Returns the candidate relative to directory with forward slashes, or an
 * empty string when the candidate is not inside directory.
 */
std::string relativeTo(const fs::path& candidate, const fs::path& directory) {
    fs::path relative = candidate.lexically_relative(directory);
    if (relative.empty() || relative == "." || *relative.begin() == "..") {
        return "";
    }
    return relative.generic_string();
}

} // namespace

GitignoreResolver::GitignoreResolver(const fs::path& root)
    : m_root(normalizedAbsolute(root))
{
}

bool GitignoreResolver::allowed(const fs::path& base_dir, const fs::path& candidate) const {
    fs::path base = normalizedAbsolute(base_dir);
    fs::path target = normalizedAbsolute(candidate);
    bool is_dir = isDirectory(target);
    
    std::optional<bool> ignored;
    for (const auto& level : collectLevels(base)) {
        std::string relative = relativeTo(target, level.directory);
        if (relative.empty()) {
            continue;
        }
        auto verdict = level.patterns->lastMatch(relative, is_dir);
        if (verdict.has_value()) {
            ignored = verdict;
        }
    }
    
    if (ignored.value_or(false)) {
        Logger::getInstance().debug("GitignoreResolver", "Excluded by .gitignore", target.string());
        return false;
    }
    return true;
}

const std::vector<GitignoreResolver::RuleLevel>& GitignoreResolver::collectLevels(const fs::path& base_dir) const {
    const std::string key = base_dir.string();
    auto cached = m_levels.find(key);
    if (cached != m_levels.end()) {
        return cached->second;
    }
    
    // Chain of directories from base_dir up to the root, inclusive
    std::vector<fs::path> chain;
    bool reached_root = false;
    for (fs::path current = base_dir; ; current = current.parent_path()) {
        chain.push_back(current);
        if (current == m_root) {
            reached_root = true;
            break;
        }
        if (current.parent_path().empty() || current.parent_path() == current) {
            break;
        }
    }
    if (!reached_root) {
        // Outside the traversal root only the directory's own rules apply
        chain.resize(1);
    }
    
    std::vector<RuleLevel> levels;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        const IgnorePatternSet& patterns = patternsFor(*it);
        if (!patterns.empty()) {
            levels.push_back({*it, &patterns});
        }
    }
    
    auto inserted = m_levels.emplace(key, std::move(levels));
    return inserted.first->second;
}

const IgnorePatternSet& GitignoreResolver::patternsFor(const fs::path& directory) const {
    const std::string key = directory.string();
    auto it = m_cache.find(key);
    if (it != m_cache.end()) {
        return *it->second;
    }
    
    auto patterns = std::make_unique<IgnorePatternSet>();
    size_t loaded = patterns->loadFromFile((directory / ".gitignore").string());
    if (loaded > 0) {
        Logger::getInstance().debug("GitignoreResolver",
            "Loaded .gitignore with " + std::to_string(loaded) + " patterns", key);
    }
    
    auto inserted = m_cache.emplace(key, std::move(patterns));
    return *inserted.first->second;
}

// StaticIgnoreResolver implementation

void StaticIgnoreResolver::addRule(const fs::path& directory, const std::string& pattern) {
    m_rules[normalizedAbsolute(directory).string()].addPattern(pattern);
}

bool StaticIgnoreResolver::allowed(const fs::path& base_dir, const fs::path& candidate) const {
    fs::path target = normalizedAbsolute(candidate);
    bool is_dir = isDirectory(target);
    
    std::vector<fs::path> chain;
    for (fs::path current = normalizedAbsolute(base_dir); ; current = current.parent_path()) {
        chain.push_back(current);
        if (current.parent_path().empty() || current.parent_path() == current) {
            break;
        }
    }
    
    std::optional<bool> ignored;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        auto rules = m_rules.find(it->string());
        if (rules == m_rules.end()) {
            continue;
        }
        std::string relative = relativeTo(target, *it);
        if (relative.empty()) {
            continue;
        }
        auto verdict = rules->second.lastMatch(relative, is_dir);
        if (verdict.has_value()) {
            ignored = verdict;
        }
    }
    return !ignored.value_or(false);
}

} // namespace Quill
