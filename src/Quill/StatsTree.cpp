// =================================================================
// src/Quill/StatsTree.cpp
// =================================================================
// Implementation for the stats aggregation tree and its report.

#include "Quill/StatsTree.hpp"
#include "Quill/TokenEncoder.hpp"
#include "Quill/Logger.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace Quill {

StatsTree::StatsTree(const TokenEncoder& encoder, const std::string& target_root, size_t top_count)
    : m_encoder(encoder),
      m_target_root(target_root),
      m_top_count(top_count),
      m_total_files(0)
{
}

void StatsTree::record(const std::string& path, const std::string& content, bool processed) {
    m_total_files++;
    if (!processed) {
        return;
    }
    
    std::vector<std::string> segments = segmentsFor(path);
    if (segments.empty()) {
        Logger::getInstance().warning("StatsTree", "Cannot place path in tree", path);
        return;
    }
    
    const size_t tokens = m_encoder.countTokens(content);
    const size_t size = content.size();
    
    // Walk to the leaf first so a path clash leaves the tree untouched
    std::vector<StatTreeNode*> ancestors{&m_root};
    StatTreeNode* node = &m_root;
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        auto& child = node->children[segments[i]];
        if (!child) {
            child = std::make_unique<StatTreeNode>();
            child->name = segments[i];
        } else if (child->is_file) {
            Logger::getInstance().warning("StatsTree", "Path segment already recorded as a file", path);
            return;
        }
        node = child.get();
        ancestors.push_back(node);
    }
    
    auto& leaf = node->children[segments.back()];
    bool replacing = false;
    size_t old_tokens = 0;
    if (!leaf) {
        leaf = std::make_unique<StatTreeNode>();
        leaf->name = segments.back();
        leaf->is_file = true;
    } else if (!leaf->is_file) {
        Logger::getInstance().warning("StatsTree", "Path already recorded as a directory", path);
        return;
    } else {
        replacing = true;
        old_tokens = leaf->tokens;
    }
    
    for (StatTreeNode* ancestor : ancestors) {
        if (replacing) {
            ancestor->tokens -= old_tokens;
        } else {
            ancestor->files++;
            ancestor->processed++;
        }
        ancestor->tokens += tokens;
    }
    
    leaf->files = 1;
    leaf->processed = 1;
    leaf->tokens = tokens;
    leaf->size = size;
    
    std::string joined;
    for (const auto& segment : segments) {
        if (!joined.empty()) {
            joined += '/';
        }
        joined += segment;
    }
    
    auto existing = std::find_if(m_files.begin(), m_files.end(),
                                 [&](const FileStat& stat) { return stat.path == joined; });
    if (existing != m_files.end()) {
        existing->tokens = tokens;
        existing->size = size;
    } else {
        m_files.push_back({joined, tokens, size});
    }
}

std::vector<std::string> StatsTree::segmentsFor(const std::string& path) const {
    fs::path target(path);
    
    if (!m_target_root.empty()) {
        std::error_code ec;
        fs::path absolute_path = fs::absolute(path, ec).lexically_normal();
        fs::path absolute_root = fs::absolute(m_target_root, ec).lexically_normal();
        if (!ec) {
            fs::path relative = absolute_path.lexically_relative(absolute_root);
            if (!relative.empty() && relative != "." && *relative.begin() != "..") {
                target = relative;
            }
        }
    }
    
    std::vector<std::string> segments;
    for (const auto& element : target.lexically_normal()) {
        std::string segment = element.string();
        if (segment.empty() || segment == "." || element == target.root_directory() ||
            element == target.root_name()) {
            continue;
        }
        segments.push_back(segment);
    }
    return segments;
}

StatsSummary StatsTree::summary() const {
    StatsSummary result;
    result.total_files = m_total_files;
    result.processed_files = m_root.processed;
    result.total_tokens = m_root.tokens;
    return result;
}

std::string StatsTree::render() const {
    StatsSummary totals = summary();
    std::ostringstream header;
    header << "Total files: " << totals.total_files << "\n";
    header << "Processed files: " << totals.processed_files << "\n";
    header << "Total tokens: " << totals.total_tokens << "\n";
    
    std::string out = header.str();
    out += "\nDirectory tree:\n";
    if (m_root.children.empty()) {
        out += "(no processed files)\n";
    } else {
        renderChildren(m_root, "", out);
    }
    
    // Stable sort keeps insertion order among equal counts
    std::vector<FileStat> ranked = m_files;
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const FileStat& a, const FileStat& b) { return a.tokens > b.tokens; });
    if (ranked.size() > m_top_count) {
        ranked.resize(m_top_count);
    }
    
    std::ostringstream top;
    top << "\nTop " << m_top_count << " files by tokens:\n";
    const int rank_width = static_cast<int>(std::to_string(std::max<size_t>(m_top_count, 1)).size());
    for (size_t i = 0; i < ranked.size(); ++i) {
        top << std::setw(rank_width) << (i + 1) << ". " << ranked[i].path
            << ": " << ranked[i].tokens << " tokens\n";
    }
    out += top.str();
    
    return out;
}

void StatsTree::renderChildren(const StatTreeNode& node, const std::string& prefix,
                               std::string& out) const {
    std::vector<const StatTreeNode*> children = orderedChildren(node);
    
    for (size_t i = 0; i < children.size(); ++i) {
        const StatTreeNode& child = *children[i];
        const bool last = i + 1 == children.size();
        
        std::ostringstream line;
        line << prefix << (last ? "└─ " : "├─ ");
        if (child.is_file) {
            line << child.name << " (" << child.tokens << " tokens, " << child.size << " bytes)";
        } else {
            line << child.name << "/ (" << child.files << (child.files == 1 ? " file, " : " files, ")
                 << child.tokens << " tokens)";
        }
        out += line.str();
        out += '\n';
        
        if (!child.is_file) {
            renderChildren(child, prefix + (last ? "   " : "│  "), out);
        }
    }
}

std::vector<const StatTreeNode*> StatsTree::orderedChildren(const StatTreeNode& node) {
    std::vector<const StatTreeNode*> directories;
    std::vector<const StatTreeNode*> files;
    
    // std::map already iterates names alphabetically
    for (const auto& entry : node.children) {
        if (entry.second->is_file) {
            files.push_back(entry.second.get());
        } else {
            directories.push_back(entry.second.get());
        }
    }
    
    directories.insert(directories.end(), files.begin(), files.end());
    return directories;
}

} // namespace Quill
