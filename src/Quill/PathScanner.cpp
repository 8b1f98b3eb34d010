// =================================================================
// src/Quill/PathScanner.cpp
// =================================================================
// Implementation for input path traversal and candidate collection.

#include "Quill/PathScanner.hpp"
#include "Quill/TraversalSession.hpp"
#include "Quill/Logger.hpp"
#include <algorithm>
#include <unordered_set>
#include <system_error>

namespace fs = std::filesystem;

namespace Quill {

namespace {

// "dir/" and "dir" must produce identical child paths
fs::path stripTrailingSeparators(fs::path path) {
    while (!path.has_filename() && path.has_parent_path() && path != path.root_path()) {
        path = path.parent_path();
    }
    return path;
}

} // namespace

PathScanner::PathScanner(const IgnoreContext& context, TraversalSession& session)
    : m_filter(context), m_session(session)
{
}

std::vector<std::string> PathScanner::resolve(const std::string& input_path) {
    std::vector<std::string> candidates;
    
    std::error_code ec;
    if (fs::is_directory(input_path, ec)) {
        fs::path root = stripTrailingSeparators(fs::path(input_path));
        walkDirectory(root, root, candidates);
    } else if (fs::exists(input_path, ec)) {
        // Explicit file arguments bypass the directory-level filters
        candidates.push_back(input_path);
    } else {
        Logger::getInstance().warning("PathScanner", "Input path not found", input_path);
        return candidates;
    }
    
    // Drop anything an earlier input already produced
    std::unordered_set<std::string> local_keys;
    candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                         [&](const std::string& path) {
                             std::string key = TraversalSession::seenKey(path);
                             return m_session.isSeen(path) || !local_keys.insert(key).second;
                         }),
                     candidates.end());
    
    // Sort files to ensure consistent order
    std::sort(candidates.begin(), candidates.end());
    
    for (const auto& path : candidates) {
        m_session.markSeen(path);
    }
    
    Logger::getInstance().logPathResolution(input_path, candidates.size());
    return candidates;
}

void PathScanner::walkDirectory(const fs::path& directory,
                                const fs::path& input_root,
                                std::vector<std::string>& out) const {
    DirectoryListing listing;
    std::vector<std::string> linked_directories;
    if (!listDirectory(directory, listing, linked_directories)) {
        return;
    }
    
    DirectoryListing kept = m_filter.apply(directory, input_root, std::move(listing));
    
    for (const auto& file : kept.files) {
        out.push_back((directory / file).string());
    }
    
    for (const auto& subdirectory : kept.directories) {
        // Symlinked directories are listed but not followed
        if (std::find(linked_directories.begin(), linked_directories.end(), subdirectory)
                != linked_directories.end()) {
            continue;
        }
        walkDirectory(directory / subdirectory, input_root, out);
    }
}

bool PathScanner::listDirectory(const fs::path& directory,
                                DirectoryListing& listing,
                                std::vector<std::string>& linked_directories) const {
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        Logger::getInstance().warning("PathScanner",
            "Cannot read directory: " + directory.string(), ec.message());
        return false;
    }
    
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            Logger::getInstance().warning("PathScanner",
                "Error while listing " + directory.string(), ec.message());
            break;
        }
        
        const auto& entry = *it;
        std::string name = entry.path().filename().string();
        std::error_code type_ec;
        
        if (entry.is_directory(type_ec)) {
            listing.directories.push_back(name);
            if (entry.is_symlink(type_ec)) {
                linked_directories.push_back(name);
            }
        } else if (entry.is_regular_file(type_ec)) {
            listing.files.push_back(name);
        } else {
            Logger::getInstance().debug("PathScanner", "Skipping special file", entry.path().string());
        }
    }
    
    return true;
}

} // namespace Quill
