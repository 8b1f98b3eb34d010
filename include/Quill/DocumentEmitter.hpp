// =================================================================
// include/Quill/DocumentEmitter.hpp
// =================================================================
// Header for writing file contents as delimited, indexed document
// records.

#pragma once

#include <ostream>
#include <string>

namespace Quill {

class TraversalSession;

/**
 * @brief Writes one <document> record per file into an output stream
 *
 * The surrounding <documents> element is opened before the first record
 * and closed by finish(); an emitter that wrote nothing produces no
 * output. Indices come from the session and are never reused.
 */
class DocumentEmitter {
public:
    /**
     * @brief Construct a new DocumentEmitter
     * @param out Destination stream (not owned)
     * @param session Session providing the document index
     * @param line_numbers Prefix every content line with its number
     * @param root_path Display paths are made relative to this root when
     *        the file lives under it; empty disables rewriting
     */
    DocumentEmitter(std::ostream& out, TraversalSession& session,
                    bool line_numbers = false, const std::string& root_path = "");

    /**
     * @brief Write one record and advance the session index
     * @param path File path as resolved by the scanner
     * @param content File content
     */
    void emit(const std::string& path, const std::string& content);

    /**
     * @brief Close the <documents> element if any record was written
     */
    void finish();

    size_t documentsWritten() const { return m_documents_written; }

    /**
     * @brief Compute the path shown in the record
     * @param path File path as resolved
     * @param root_path Declared root, may be empty
     * @return Path relative to root_path when under it, else path unchanged
     */
    static std::string displayPath(const std::string& path, const std::string& root_path);

    /**
     * @brief Prefix each line with a right-aligned 1-based line number
     * @param content Text to number
     * @return Numbered lines joined with '\n', without a trailing newline
     */
    static std::string addLineNumbers(const std::string& content);

private:
    std::ostream& m_out;
    TraversalSession& m_session;
    bool m_line_numbers;
    std::string m_root_path;
    bool m_opened;
    size_t m_documents_written;
};

} // namespace Quill
