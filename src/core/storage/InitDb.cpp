// src/core/storage/InitDb.cpp
#include "core/storage/InitDb.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "core/errors/FunctionError.hpp"

namespace cft {

namespace {

// Owns the connection used while initializing.
struct Connection {
    sqlite3* db = nullptr;
    ~Connection() { sqlite3_close(db); }
};

void execAll(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw DatabaseError("init exec failed: " + msg);
    }
}

int userVersion(sqlite3* db) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "PRAGMA user_version;", -1, &st, nullptr) != SQLITE_OK)
        throw DatabaseError(std::string("reading user_version failed: ") + sqlite3_errmsg(db));
    const int version = sqlite3_step(st) == SQLITE_ROW ? sqlite3_column_int(st, 0) : 0;
    sqlite3_finalize(st);
    return version;
}

std::string readSchema(const std::string& schemaPath) {
    std::ifstream in(schemaPath);
    if (!in) throw DatabaseError("cannot open schema file: " + schemaPath);
    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

} // namespace

bool initDatabase(const std::string& dbPath, const std::string& schemaPath) {
    const auto parent = std::filesystem::path(dbPath).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);

    Connection conn;
    if (sqlite3_open_v2(dbPath.c_str(), &conn.db,
                        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                        nullptr) != SQLITE_OK) {
        throw DatabaseError("failed to open db " + dbPath + ": " +
                            (conn.db ? sqlite3_errmsg(conn.db) : "out of memory"));
    }

    execAll(conn.db, "PRAGMA journal_mode=WAL;");
    execAll(conn.db, "PRAGMA synchronous=NORMAL;");
    execAll(conn.db, "PRAGMA busy_timeout=5000;");

    const int version = userVersion(conn.db);
    if (version > kSchemaVersion)
        throw DatabaseError("db " + dbPath + " has schema version " + std::to_string(version) +
                            ", this build knows " + std::to_string(kSchemaVersion));
    if (version == kSchemaVersion) return false;

    // schema.sql only uses CREATE ... IF NOT EXISTS
    execAll(conn.db, "BEGIN IMMEDIATE;");
    try {
        execAll(conn.db, readSchema(schemaPath));
        execAll(conn.db, "PRAGMA user_version=" + std::to_string(kSchemaVersion) + ";");
        execAll(conn.db, "COMMIT;");
    } catch (const DatabaseError&) {
        sqlite3_exec(conn.db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
    spdlog::info("schema version {} applied to {}", kSchemaVersion, dbPath);
    return true;
}

} // namespace cft
