#include "core/storage/SqliteDatabase.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include <optional>
#include <vector>

#include "core/errors/FunctionError.hpp"

namespace cft {

namespace {

// Prepared statement, finalized on scope exit.
class Statement {
public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      std::string err = sqlite3_errmsg(db);
      sqlite3_finalize(st_);
      throw DatabaseError("prepare failed: " + err);
    }
  }
  ~Statement() { sqlite3_finalize(st_); }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  Statement& bind(int index, const std::string& text) {
    sqlite3_bind_text(st_, index, text.c_str(), -1, SQLITE_TRANSIENT);
    return *this;
  }

  // true while rows are returned.
  bool step() {
    const int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw DatabaseError(std::string("step failed: ") + sqlite3_errmsg(db_));
  }

  void run() {
    while (step()) {}
  }

  std::string column(int index) const {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(st_, index));
    return text ? std::string(text) : std::string();
  }

private:
  sqlite3* db_;
  sqlite3_stmt* st_ = nullptr;
};

// Strips surrounding slashes and rejects empty segments.
std::string normalizePath(const std::string& path) {
  std::size_t begin = 0, end = path.size();
  while (begin < end && path[begin] == '/') ++begin;
  while (end > begin && path[end - 1] == '/') --end;
  std::string out = path.substr(begin, end - begin);
  if (out.find("//") != std::string::npos)
    throw DatabaseError("invalid path '" + path + "'");
  return out;
}

std::vector<std::string> splitPath(const std::string& path) {
  std::vector<std::string> segments;
  std::size_t start = 0;
  while (start <= path.size()) {
    const auto slash = path.find('/', start);
    if (slash == std::string::npos) {
      segments.push_back(path.substr(start));
      break;
    }
    segments.push_back(path.substr(start, slash - start));
    start = slash + 1;
  }
  return segments;
}

// Smallest stored path above lower (or equal when inclusive) and below
// upper. An empty upper is unbounded.
std::optional<std::string> firstPath(sqlite3* db, const std::string& lower, bool inclusive,
                                     const std::string& upper) {
  std::string sql = inclusive ? "SELECT path FROM nodes WHERE path >= ?1" : "SELECT path FROM nodes WHERE path > ?1";
  if (!upper.empty()) sql += " AND path < ?2";
  sql += " ORDER BY path LIMIT 1";
  Statement st(db, sql.c_str());
  st.bind(1, lower);
  if (!upper.empty()) st.bind(2, upper);
  if (!st.step()) return std::nullopt;
  return st.column(0);
}

} // namespace

SqliteDatabase::SqliteDatabase(const std::string& dbPath) : db_(nullptr) {
  sqlite3* db = nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX, nullptr) != SQLITE_OK) {
    std::string err = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw DatabaseError("failed to open db " + dbPath + ": " + err);
  }
  sqlite3_busy_timeout(db, 5000);
  db_ = db;
}

SqliteDatabase::~SqliteDatabase() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

void SqliteDatabase::exec(const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(static_cast<sqlite3*>(db_), sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw DatabaseError(std::string("exec '") + sql + "' failed: " + msg);
  }
}

std::optional<nlohmann::json> SqliteDatabase::get(const std::string& rawPath) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  const std::string path = normalizePath(rawPath);
  auto* db = static_cast<sqlite3*>(db_);

  std::vector<std::pair<std::string, std::string>> rows;
  if (path.empty()) {
    Statement st(db, "SELECT path, value FROM nodes ORDER BY path");
    while (st.step()) rows.emplace_back(st.column(0), st.column(1));
  } else {
    Statement st(db, R"SQL(
      SELECT path, value FROM nodes
      WHERE path = ?1 OR (path > ?2 AND path < ?3)
      ORDER BY path
    )SQL");
    st.bind(1, path).bind(2, path + "/").bind(3, path + "0");
    while (st.step()) rows.emplace_back(st.column(0), st.column(1));
  }
  if (rows.empty()) return std::nullopt;

  try {
    if (rows.front().first == path) return nlohmann::json::parse(rows.front().second);

    nlohmann::json tree = nlohmann::json::object();
    const std::size_t prefix = path.empty() ? 0 : path.size() + 1;
    for (const auto& [leafPath, value] : rows) {
      nlohmann::json* node = &tree;
      const auto segments = splitPath(leafPath.substr(prefix));
      for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
        auto& child = (*node)[segments[i]];
        if (!child.is_object()) child = nlohmann::json::object();
        node = &child;
      }
      (*node)[segments.back()] = nlohmann::json::parse(value);
    }
    return tree;
  } catch (const nlohmann::json::parse_error& e) {
    throw DatabaseError(std::string("corrupt value below '") + path + "': " + e.what());
  }
}

// One index seek per child. Inside a child's subtree every path is below
// "<child>0", so the walk jumps there instead of reading the subtree.
std::vector<std::string> SqliteDatabase::childKeys(const std::string& rawPath) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  const std::string path = normalizePath(rawPath);
  const std::string prefix = path.empty() ? "" : path + "/";
  const std::string upper = path.empty() ? "" : path + "0";
  auto* db = static_cast<sqlite3*>(db_);

  std::vector<std::string> keys;
  auto next = firstPath(db, prefix, false, upper);
  while (next) {
    const std::string rest = next->substr(prefix.size());
    std::string key = rest.substr(0, rest.find('/'));
    const std::string child = prefix + key;
    if (*next == child) {
      next = firstPath(db, child, false, upper);
    } else {
      next = firstPath(db, child + "0", true, upper);
    }
    keys.push_back(std::move(key));
  }
  return keys;
}

void SqliteDatabase::removeSubtree(const std::string& path) {
  auto* db = static_cast<sqlite3*>(db_);
  if (path.empty()) {
    Statement(db, "DELETE FROM nodes").run();
    return;
  }
  Statement st(db, "DELETE FROM nodes WHERE path = ?1 OR (path > ?2 AND path < ?3)");
  st.bind(1, path).bind(2, path + "/").bind(3, path + "0").run();
}

// A leaf stored at an ancestor would shadow the new subtree.
void SqliteDatabase::removeAncestorLeaves(const std::string& path) {
  auto* db = static_cast<sqlite3*>(db_);
  for (auto slash = path.find('/'); slash != std::string::npos; slash = path.find('/', slash + 1)) {
    Statement st(db, "DELETE FROM nodes WHERE path = ?1");
    st.bind(1, path.substr(0, slash)).run();
  }
}

void SqliteDatabase::insertLeaves(const std::string& path, const nlohmann::json& value) {
  if (value.is_object()) {
    for (const auto& [key, child] : value.items()) {
      if (key.empty() || key.find('/') != std::string::npos)
        throw DatabaseError("invalid key '" + key + "' below '" + path + "'");
      insertLeaves(path.empty() ? key : path + "/" + key, child);
    }
    return;
  }
  if (path.empty()) throw DatabaseError("only objects can be stored at the root");
  Statement st(static_cast<sqlite3*>(db_), "INSERT INTO nodes (path, value) VALUES (?1, ?2)");
  st.bind(1, path).bind(2, value.dump()).run();
}

void SqliteDatabase::set(const std::string& rawPath, const nlohmann::json& value) {
  const std::string path = normalizePath(rawPath);
  runTransaction([&] {
    removeSubtree(path);
    if (value.is_null()) return;
    removeAncestorLeaves(path);
    insertLeaves(path, value);
  });
}

void SqliteDatabase::remove(const std::string& rawPath) {
  const std::string path = normalizePath(rawPath);
  runTransaction([&] { removeSubtree(path); });
}

void SqliteDatabase::runTransaction(const std::function<void()>& body) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (transactionDepth_ > 0) {
    ++transactionDepth_;
    try {
      body();
    } catch (...) {
      --transactionDepth_;
      throw;
    }
    --transactionDepth_;
    return;
  }

  exec("BEGIN IMMEDIATE;");
  transactionDepth_ = 1;
  try {
    body();
  } catch (...) {
    transactionDepth_ = 0;
    char* err = nullptr;
    if (sqlite3_exec(static_cast<sqlite3*>(db_), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
      spdlog::error("rollback failed: {}", err ? err : "unknown error");
      sqlite3_free(err);
    }
    throw;
  }
  transactionDepth_ = 0;
  try {
    exec("COMMIT;");
  } catch (const DatabaseError&) {
    sqlite3_exec(static_cast<sqlite3*>(db_), "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }
}

} // namespace cft
