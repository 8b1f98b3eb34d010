// =================================================================
// src/Quill/SqliteSchema.cpp
// =================================================================
// Implementation for SQLite schema extraction.

#include "Quill/SqliteSchema.hpp"
#include "Quill/Errors.hpp"
#include <sqlite3.h>
#include <cstring>
#include <fstream>
#include <memory>
#include <vector>

namespace Quill {

namespace {

struct DatabaseCloser {
    void operator()(sqlite3* db) const {
        if (db) {
            sqlite3_close(db);
        }
    }
};

struct StatementFinalizer {
    void operator()(sqlite3_stmt* stmt) const {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }
};

typedef std::unique_ptr<sqlite3, DatabaseCloser> Database_ptr;
typedef std::unique_ptr<sqlite3_stmt, StatementFinalizer> Statement_ptr;

/**
 * Runs a single-column query and returns the non-NULL values in order.
 */
std::vector<std::string> querySql(sqlite3* db, const std::string& path, const char* sql) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
        throw SqliteError("Error extracting schema from " + path + ": " + sqlite3_errmsg(db));
    }
    Statement_ptr stmt(raw);
    
    std::vector<std::string> rows;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        const unsigned char* text = sqlite3_column_text(stmt.get(), 0);
        if (text != nullptr) {
            rows.emplace_back(reinterpret_cast<const char*>(text));
        }
    }
    if (rc != SQLITE_DONE) {
        throw SqliteError("Error extracting schema from " + path + ": " + sqlite3_errmsg(db));
    }
    return rows;
}

} // namespace

bool SqliteSchema::isSqliteFile(const std::string& path) {
    static const char kHeader[] = "SQLite format 3";
    
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    char buffer[16] = {0};
    file.read(buffer, sizeof(buffer));
    if (file.gcount() < static_cast<std::streamsize>(sizeof(kHeader) - 1)) {
        return false;
    }
    return std::memcmp(buffer, kHeader, sizeof(kHeader) - 1) == 0;
}

std::string SqliteSchema::extractSchema(const std::string& path) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &raw, SQLITE_OPEN_READONLY, nullptr);
    Database_ptr db(raw);
    if (rc != SQLITE_OK) {
        std::string reason = db ? sqlite3_errmsg(db.get()) : sqlite3_errstr(rc);
        throw SqliteError("Cannot open SQLite database " + path + ": " + reason);
    }
    
    auto tables = querySql(db.get(), path,
        "SELECT sql FROM sqlite_master WHERE type='table' ORDER BY name");
    auto views = querySql(db.get(), path,
        "SELECT sql FROM sqlite_master WHERE type='view' ORDER BY name");
    auto indexes = querySql(db.get(), path,
        "SELECT sql FROM sqlite_master WHERE type='index' AND name NOT LIKE 'sqlite_%' ORDER BY name");
    
    std::vector<std::string> parts;
    if (!tables.empty()) {
        parts.push_back("-- Tables");
        for (const auto& sql : tables) {
            parts.push_back(sql + ";");
        }
    }
    if (!views.empty()) {
        parts.push_back("\n-- Views");
        for (const auto& sql : views) {
            parts.push_back(sql + ";");
        }
    }
    if (!indexes.empty()) {
        parts.push_back("\n-- Indexes");
        for (const auto& sql : indexes) {
            parts.push_back(sql + ";");
        }
    }
    
    std::string schema = "-- SQLite3 Database Schema\n";
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            schema += '\n';
        }
        schema += parts[i];
    }
    return schema;
}

} // namespace Quill
