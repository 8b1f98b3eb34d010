// =================================================================
// include/Quill/StatsTree.hpp
// =================================================================
// Header for hierarchical token/size aggregation and the stats report.

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace Quill {

class TokenEncoder;

/**
 * @brief Directory or file node keyed by path segment
 *
 * Directory nodes hold rollups summed over every descendant file; file
 * nodes hold their own size and token count.
 */
struct StatTreeNode {
    std::string name;
    bool is_file = false;
    size_t files = 0;
    size_t tokens = 0;
    size_t processed = 0;
    size_t size = 0;
    std::map<std::string, std::unique_ptr<StatTreeNode>> children;
};

/**
 * @brief Totals printed in the report header
 */
struct StatsSummary {
    size_t total_files = 0;
    size_t processed_files = 0;
    size_t total_tokens = 0;
};

/**
 * @brief One processed file, kept in insertion order for the top-N list
 */
struct FileStat {
    std::string path;
    size_t tokens = 0;
    size_t size = 0;
};

/**
 * @brief Accumulates per-file statistics into a directory tree
 */
class StatsTree {
public:
    /**
     * @brief Construct a new StatsTree
     * @param encoder Token encoder used for processed files (not owned)
     * @param target_root Paths under this root are recorded relative to it;
     *        empty records paths as given
     * @param top_count Number of files listed in the ranking
     */
    explicit StatsTree(const TokenEncoder& encoder,
                       const std::string& target_root = "",
                       size_t top_count = 10);

    /**
     * @brief Record one file
     * @param path File path as resolved by the scanner
     * @param content File content (ignored when not processed)
     * @param processed False for binary or failed files; these only count
     *        toward the total-seen counter
     */
    void record(const std::string& path, const std::string& content, bool processed);

    /**
     * @brief Render the summary, the directory tree and the top-N ranking
     */
    std::string render() const;

    StatsSummary summary() const;

    const StatTreeNode& root() const { return m_root; }

    /**
     * @brief Path segments a file is filed under
     */
    std::vector<std::string> segmentsFor(const std::string& path) const;

private:
    const TokenEncoder& m_encoder;
    std::string m_target_root;
    size_t m_top_count;
    size_t m_total_files;
    StatTreeNode m_root;
    std::vector<FileStat> m_files;

    void renderChildren(const StatTreeNode& node, const std::string& prefix,
                        std::string& out) const;

    static std::vector<const StatTreeNode*> orderedChildren(const StatTreeNode& node);
};

} // namespace Quill
