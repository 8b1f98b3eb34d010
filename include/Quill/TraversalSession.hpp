// =================================================================
// include/Quill/TraversalSession.hpp
// =================================================================
// Per-invocation mutable state shared by the scanner and the emitter:
// the set of paths already yielded and the document sequence index.

#pragma once

#include <string>
#include <unordered_set>

namespace Quill {

/**
 * @brief Owns the seen-path set and the document index for one invocation
 *
 * Not thread-safe; one session is mutated by a single thread of control.
 * Call reset() before reusing a session for a new invocation.
 */
class TraversalSession {
public:
    TraversalSession() = default;

    /**
     * @brief Canonical key used for deduplication
     * @param path Path as discovered
     * @return Absolute, lexically normalized path string
     */
    static std::string seenKey(const std::string& path);

    /**
     * @brief Check whether a path has already been yielded
     */
    bool isSeen(const std::string& path) const;

    /**
     * @brief Record a path as yielded
     * @return true if the path was not seen before
     */
    bool markSeen(const std::string& path);

    size_t seenCount() const { return m_seen.size(); }

    /**
     * @brief Index the next document will carry (1-based)
     */
    size_t currentIndex() const { return m_next_index; }

    /**
     * @brief Return the current index and advance it by one
     */
    size_t takeIndex() { return m_next_index++; }

    /**
     * @brief Restore the initial state: nothing seen, index 1
     */
    void reset();

private:
    std::unordered_set<std::string> m_seen;
    size_t m_next_index = 1;
};

} // namespace Quill
