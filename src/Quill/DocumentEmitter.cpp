// =================================================================
// src/Quill/DocumentEmitter.cpp
// =================================================================
// Implementation for document record emission.

#include "Quill/DocumentEmitter.hpp"
#include "Quill/TraversalSession.hpp"
#include <filesystem>
#include <sstream>
#include <iomanip>
#include <vector>
#include <system_error>

namespace fs = std::filesystem;

namespace Quill {

namespace {

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;
    
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\n' || c == '\r') {
            lines.push_back(current);
            current.clear();
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            current += c;
        }
    }
    // A final line without terminator still counts
    if (!current.empty()) {
        lines.push_back(current);
    }
    return lines;
}

} // namespace

DocumentEmitter::DocumentEmitter(std::ostream& out, TraversalSession& session,
                                 bool line_numbers, const std::string& root_path)
    : m_out(out),
      m_session(session),
      m_line_numbers(line_numbers),
      m_root_path(root_path),
      m_opened(false),
      m_documents_written(0)
{
}

void DocumentEmitter::emit(const std::string& path, const std::string& content) {
    if (!m_opened) {
        m_out << "<documents>\n";
        m_opened = true;
    }
    
    const std::string& body = m_line_numbers ? addLineNumbers(content) : content;
    
    m_out << "<document path=\"" << displayPath(path, m_root_path)
          << "\" index=\"" << m_session.takeIndex() << "\">\n";
    m_out << body << '\n';
    m_out << "</document>\n";
    
    m_documents_written++;
}

void DocumentEmitter::finish() {
    if (m_opened) {
        m_out << "</documents>\n";
        m_opened = false;
    }
    m_out.flush();
}

std::string DocumentEmitter::displayPath(const std::string& path, const std::string& root_path) {
    if (root_path.empty()) {
        return path;
    }
    
    std::error_code ec;
    fs::path absolute_path = fs::absolute(path, ec).lexically_normal();
    if (ec) {
        return path;
    }
    fs::path absolute_root = fs::absolute(root_path, ec).lexically_normal();
    if (ec) {
        return path;
    }
    
    fs::path relative = absolute_path.lexically_relative(absolute_root);
    if (relative.empty() || relative == "." || *relative.begin() == "..") {
        return path;
    }
    return relative.string();
}

std::string DocumentEmitter::addLineNumbers(const std::string& content) {
    std::vector<std::string> lines = splitLines(content);
    size_t padding = std::to_string(lines.size()).size();
    
    std::ostringstream numbered;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            numbered << '\n';
        }
        numbered << std::setw(static_cast<int>(padding)) << (i + 1) << "  " << lines[i];
    }
    return numbered.str();
}

} // namespace Quill
