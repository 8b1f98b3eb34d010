// =================================================================
// src/Quill/IgnoreFilter.cpp
// =================================================================
// Implementation for the layered traversal filter.

#include "Quill/IgnoreFilter.hpp"
#include "Quill/GitignoreResolver.hpp"
#include <algorithm>
#include <fnmatch.h>

namespace fs = std::filesystem;

namespace Quill {

IgnoreFilter::IgnoreFilter(const IgnoreContext& context)
    : m_context(context)
{
}

DirectoryListing IgnoreFilter::apply(const fs::path& directory,
                                     const fs::path& input_root,
                                     DirectoryListing listing) const {
    auto& dirs = listing.directories;
    auto& files = listing.files;
    
    if (!m_context.include_hidden) {
        dirs.erase(std::remove_if(dirs.begin(), dirs.end(), isHidden), dirs.end());
        files.erase(std::remove_if(files.begin(), files.end(), isHidden), files.end());
    }
    
    if (m_context.use_gitignore && m_context.resolver != nullptr) {
        auto rejected = [&](const std::string& name) {
            return !m_context.resolver->allowed(directory, directory / name);
        };
        dirs.erase(std::remove_if(dirs.begin(), dirs.end(), rejected), dirs.end());
        files.erase(std::remove_if(files.begin(), files.end(), rejected), files.end());
    }
    
    if (!m_context.patterns.empty()) {
        auto matched = [&](const std::string& name) {
            std::string relative = (directory / name).lexically_relative(input_root).generic_string();
            return matchesPattern(name, relative);
        };
        if (!m_context.ignore_files_only) {
            dirs.erase(std::remove_if(dirs.begin(), dirs.end(), matched), dirs.end());
        }
        files.erase(std::remove_if(files.begin(), files.end(), matched), files.end());
    }
    
    if (!m_context.extensions.empty()) {
        files.erase(std::remove_if(files.begin(), files.end(),
                        [this](const std::string& name) { return !hasRequiredExtension(name); }),
                    files.end());
    }
    
    return listing;
}

bool IgnoreFilter::matchesPattern(const std::string& name, const std::string& relative_path) const {
    for (const auto& pattern : m_context.patterns) {
        if (globMatch(pattern, name) || globMatch(pattern, relative_path)) {
            return true;
        }
    }
    return false;
}

bool IgnoreFilter::hasRequiredExtension(const std::string& name) const {
    if (m_context.extensions.empty()) {
        return true;
    }
    for (const auto& suffix : m_context.extensions) {
        if (name.size() >= suffix.size() &&
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
            return true;
        }
    }
    return false;
}

bool IgnoreFilter::isHidden(const std::string& name) {
    return !name.empty() && name[0] == '.';
}

bool IgnoreFilter::globMatch(const std::string& pattern, const std::string& text) {
    // No flags: '*' crosses '/' and matches a leading '.', as shell fnmatch does
    return fnmatch(pattern.c_str(), text.c_str(), 0) == 0;
}

} // namespace Quill
