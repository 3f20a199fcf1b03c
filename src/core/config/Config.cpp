#include "core/config/Config.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace cft {

static std::string get_env_or(const char* key, const std::string& defval) {
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
}

// Look for schema.sql in CWD first, then in the source tree.
static std::string defaultSchemaPath() {
  namespace fs = std::filesystem;
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/storage/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  return candidates[1].string();
}

static DatabaseType parseDatabaseType(const std::string& value) {
  if (value == "production") return DatabaseType::Production;
  if (value == "testing") return DatabaseType::Testing;
  throw std::runtime_error("CFT_DATABASE_TYPE must be 'production' or 'testing', got '" + value + "'");
}

std::string_view toString(DatabaseType type) {
  switch (type) {
    case DatabaseType::Production: return "production";
    case DatabaseType::Testing:    return "testing";
  }
  return "production";
}

std::string clubComponent(DatabaseType type) {
  return type == DatabaseType::Testing ? "testableClubs" : "clubs";
}

Config Config::fromEnvironment() {
  Config config;
  config.db_path = get_env_or("CFT_DB_PATH", "data/club-fines.db");
  config.schema_path = get_env_or("CFT_SCHEMA_PATH", defaultSchemaPath());
  config.database_type = parseDatabaseType(get_env_or("CFT_DATABASE_TYPE", "production"));
  config.function_call_key = get_env_or("CFT_FUNCTION_CALL_KEY", "");
  const std::string level = get_env_or("CFT_LOG_LEVEL", "info");
  config.log_level = spdlog::level::from_str(level);
  if (config.log_level == spdlog::level::off && level != "off")
    throw std::runtime_error("CFT_LOG_LEVEL '" + level + "' is not a log level");
  return config;
}

} // namespace cft
