#pragma once
#include <mutex>
#include <string>

#include "core/storage/Database.hpp"

namespace cft {

// Database stored in SQLite, one row per json leaf (see schema.sql).
// All statements of one instance are serialized, a transaction holds the
// connection for its whole body.
class SqliteDatabase : public Database {
public:
  // The schema must already be applied (initDatabase).
  explicit SqliteDatabase(const std::string& dbPath);
  ~SqliteDatabase() override;

  SqliteDatabase(const SqliteDatabase&) = delete;
  SqliteDatabase& operator=(const SqliteDatabase&) = delete;

  std::optional<nlohmann::json> get(const std::string& path) override;
  std::vector<std::string> childKeys(const std::string& path) override;
  void set(const std::string& path, const nlohmann::json& value) override;
  void remove(const std::string& path) override;
  void runTransaction(const std::function<void()>& body) override;

private:
  void exec(const char* sql);
  void removeSubtree(const std::string& path);
  void removeAncestorLeaves(const std::string& path);
  void insertLeaves(const std::string& path, const nlohmann::json& value);

  void* db_; // sqlite3*
  std::recursive_mutex mutex_;
  int transactionDepth_ = 0;
};

} // namespace cft
