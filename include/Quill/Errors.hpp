// =================================================================
// include/Quill/Errors.hpp
// =================================================================
// Exception types raised by the scanning pipeline.

#pragma once

#include <stdexcept>
#include <string>

namespace Quill {

/**
 * @brief Fatal command usage problem (no paths, missing path, bad output).
 *
 * Raised before any output is produced; maps to exit code 2.
 */
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A file classified as text could not be decoded as UTF-8.
 */
class DecodeError : public std::runtime_error {
public:
    DecodeError(const std::string& path, size_t offset)
        : std::runtime_error("Invalid UTF-8 in " + path + " at byte " + std::to_string(offset)),
          m_path(path), m_offset(offset) {}

    const std::string& path() const { return m_path; }
    size_t offset() const { return m_offset; }

private:
    std::string m_path;
    size_t m_offset;
};

/**
 * @brief Schema extraction from a SQLite database failed.
 */
class SqliteError : public std::runtime_error {
public:
    explicit SqliteError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace Quill
