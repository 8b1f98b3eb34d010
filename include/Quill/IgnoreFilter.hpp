// =================================================================
// include/Quill/IgnoreFilter.hpp
// =================================================================
// Header for the layered admit/reject filter applied at every
// directory level of a traversal.

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace Quill {

class IgnoreResolver;

/**
 * @brief Active filter inputs for one invocation; read-only once built
 */
struct IgnoreContext {
    bool include_hidden = false;
    bool use_gitignore = true;
    bool ignore_files_only = false;
    std::vector<std::string> patterns;     ///< shell-style globs
    std::vector<std::string> extensions;   ///< required literal suffixes
    const IgnoreResolver* resolver = nullptr; ///< not owned
};

/**
 * @brief Immediate children of one directory, split by kind
 */
struct DirectoryListing {
    std::vector<std::string> directories;
    std::vector<std::string> files;
};

/**
 * @brief Applies the hidden, gitignore, glob and extension layers
 *
 * Each layer narrows the output of the previous one. Directories dropped
 * here are never descended into.
 */
class IgnoreFilter {
public:
    explicit IgnoreFilter(const IgnoreContext& context);

    /**
     * @brief Filter the children of a directory
     * @param directory Directory being descended
     * @param input_root Top-level input path the traversal started from
     * @param listing Names of the directory's subdirectories and files
     * @return Surviving subdirectory and file names, in input order
     */
    DirectoryListing apply(const std::filesystem::path& directory,
                           const std::filesystem::path& input_root,
                           DirectoryListing listing) const;

    /**
     * @brief True if any glob pattern matches the name or relative path
     */
    bool matchesPattern(const std::string& name, const std::string& relative_path) const;

    /**
     * @brief True if no suffixes are required or the name ends with one
     */
    bool hasRequiredExtension(const std::string& name) const;

    const IgnoreContext& context() const { return m_context; }

private:
    IgnoreContext m_context;

    static bool isHidden(const std::string& name);
    static bool globMatch(const std::string& pattern, const std::string& text);
};

} // namespace Quill
