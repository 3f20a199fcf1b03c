#pragma once
#include <string>

namespace cft {

// Version written to PRAGMA user_version once schema.sql is applied.
inline constexpr int kSchemaVersion = 1;

// Creates the database file if needed, applies pragmas and schema.sql.
// Returns true if the schema was applied, false if the file was already at
// kSchemaVersion. Throws DatabaseError, also for files of a newer version.
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);

} // namespace cft
