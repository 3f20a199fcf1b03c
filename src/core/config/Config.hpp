#pragma once
#include <string>
#include <string_view>

#include <spdlog/common.h>

namespace cft {

// Which tree of clubs the process works on. Chosen once at startup.
enum class DatabaseType {
  Production,
  Testing,
};

std::string_view toString(DatabaseType type);

// Root component of the club tree, "clubs" or "testableClubs".
std::string clubComponent(DatabaseType type);

struct Config {
  std::string db_path;
  std::string schema_path;
  DatabaseType database_type = DatabaseType::Production;
  std::string function_call_key;  // empty = key check disabled
  spdlog::level::level_enum log_level = spdlog::level::info;

  // CFT_DB_PATH, CFT_SCHEMA_PATH, CFT_DATABASE_TYPE, CFT_FUNCTION_CALL_KEY, CFT_LOG_LEVEL
  static Config fromEnvironment();
};

} // namespace cft
