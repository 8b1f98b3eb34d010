// =================================================================
// include/Quill/PathScanner.hpp
// =================================================================
// Header for resolving one input path into the ordered list of files
// to process.

#pragma once

#include "IgnoreFilter.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace Quill {

class TraversalSession;

/**
 * @brief Walks input paths and yields deduplicated, sorted file lists
 * 
 * A file argument is its own sole candidate. A directory argument is
 * walked top-down; at each level the IgnoreFilter decides which
 * subdirectories are descended and which files are collected. Candidates
 * already recorded in the session are dropped, the rest are sorted by
 * path string and then marked as seen.
 */
class PathScanner {
public:
    /**
     * @brief Construct a new PathScanner
     * @param context Filter inputs for the invocation
     * @param session Session holding the seen-path set
     */
    PathScanner(const IgnoreContext& context, TraversalSession& session);

    /**
     * @brief Resolve an input path into the files to process
     * @param input_path File or directory as given by the user
     * @return File paths, sorted lexicographically
     */
    std::vector<std::string> resolve(const std::string& input_path);

private:
    IgnoreFilter m_filter;
    TraversalSession& m_session;

    /**
     * @brief Collect files below a directory, honouring the filter
     * @param directory Directory to list
     * @param input_root Top-level input path
     * @param out Accumulated candidate paths
     */
    void walkDirectory(const std::filesystem::path& directory,
                       const std::filesystem::path& input_root,
                       std::vector<std::string>& out) const;

    /**
     * @brief List a directory's immediate children
     * @return false if the directory could not be read
     */
    bool listDirectory(const std::filesystem::path& directory,
                       DirectoryListing& listing,
                       std::vector<std::string>& linked_directories) const;
};

} // namespace Quill
