// =================================================================
// include/Quill/SqliteSchema.hpp
// =================================================================
// Header for recognizing SQLite databases and dumping their schema as
// text instead of treating them as binary.

#pragma once

#include <string>

namespace Quill {

class SqliteSchema {
public:
    /**
     * @brief Check for the "SQLite format 3" file header
     * @param path Path to the file
     * @return true if the header is present; false if absent or unreadable
     */
    static bool isSqliteFile(const std::string& path);

    /**
     * @brief Extract tables, views and indexes as SQL text
     * @param path Path to the database
     * @return Schema text starting with "-- SQLite3 Database Schema"
     * @throws SqliteError when the database cannot be opened or queried
     */
    static std::string extractSchema(const std::string& path);
};

} // namespace Quill
