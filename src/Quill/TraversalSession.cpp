// =================================================================
// src/Quill/TraversalSession.cpp
// =================================================================

#include "Quill/TraversalSession.hpp"
#include <filesystem>
#include <system_error>

namespace Quill {

std::string TraversalSession::seenKey(const std::string& path) {
    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        return std::filesystem::path(path).lexically_normal().string();
    }
    return absolute.lexically_normal().string();
}

bool TraversalSession::isSeen(const std::string& path) const {
    return m_seen.count(seenKey(path)) > 0;
}

bool TraversalSession::markSeen(const std::string& path) {
    return m_seen.insert(seenKey(path)).second;
}

void TraversalSession::reset() {
    m_seen.clear();
    m_next_index = 1;
}

} // namespace Quill
