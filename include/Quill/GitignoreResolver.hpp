// =================================================================
// include/Quill/GitignoreResolver.hpp
// =================================================================
// Header for cascading .gitignore resolution behind a one-method
// interface, so the traversal can run against substitute rule sets.

#pragma once

#include "IgnorePattern.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace Quill {

/**
 * @brief Decides whether a candidate path survives ignore rules
 */
class IgnoreResolver {
public:
    virtual ~IgnoreResolver() = default;

    /**
     * @brief Check whether a candidate is allowed
     * @param base_dir Directory currently being traversed
     * @param candidate Path of the entry inside base_dir
     * @return false if the rules exclude the candidate
     */
    virtual bool allowed(const std::filesystem::path& base_dir,
                         const std::filesystem::path& candidate) const = 0;
};

/**
 * @brief Resolves cascading .gitignore files found on disk
 *
 * Rules come from the .gitignore in each directory from the traversal
 * root down to base_dir. Files above the root are never read. Files are
 * evaluated outermost first, so rules closer to the candidate win.
 * Unmatched candidates are allowed. Parsed files and the per-directory
 * rule chains are cached for the lifetime of the resolver.
 */
class GitignoreResolver : public IgnoreResolver {
public:
    /**
     * @brief Create a resolver bounded at a traversal root
     * @param root Top-level input directory; no rules are read above it
     */
    explicit GitignoreResolver(const std::filesystem::path& root);

    bool allowed(const std::filesystem::path& base_dir,
                 const std::filesystem::path& candidate) const override;

    const std::filesystem::path& root() const { return m_root; }

    /**
     * @brief Number of directories whose .gitignore has been parsed
     */
    size_t cachedDirectoryCount() const { return m_cache.size(); }

    /**
     * @brief Number of base directories whose rule chain has been built
     */
    size_t cachedChainCount() const { return m_levels.size(); }

private:
    struct RuleLevel {
        std::filesystem::path directory;
        const IgnorePatternSet* patterns;
    };

    /**
     * @brief Rule sets applying inside a directory, outermost first
     */
    const std::vector<RuleLevel>& collectLevels(const std::filesystem::path& base_dir) const;

    const IgnorePatternSet& patternsFor(const std::filesystem::path& directory) const;

    std::filesystem::path m_root;
    mutable std::map<std::string, std::unique_ptr<IgnorePatternSet>> m_cache;
    mutable std::map<std::string, std::vector<RuleLevel>> m_levels;
};

/**
 * @brief In-memory rule set keyed by directory, for tests and embedding
 *
 * Each directory's rules behave like a .gitignore placed there; rules of
 * every registered ancestor directory of base_dir cascade the same way.
 */
class StaticIgnoreResolver : public IgnoreResolver {
public:
    /**
     * @brief Register a gitignore-style pattern for a directory
     */
    void addRule(const std::filesystem::path& directory, const std::string& pattern);

    bool allowed(const std::filesystem::path& base_dir,
                 const std::filesystem::path& candidate) const override;

private:
    std::map<std::string, IgnorePatternSet> m_rules;
};

} // namespace Quill
