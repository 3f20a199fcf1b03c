#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cft {

// Key-path store holding one json tree, paths look like "clubs/<id>/fines/<id>".
// Implementations throw DatabaseError on failure.
class Database {
public:
  virtual ~Database() = default;

  // Subtree at path, nullopt if nothing is stored there.
  virtual std::optional<nlohmann::json> get(const std::string& path) = 0;

  // Replaces the subtree at path; a null value removes it.
  // Keys of the direct children of path, in no particular order. Empty if
  // nothing or a single value is stored there. Does not read the children.
  virtual std::vector<std::string> childKeys(const std::string& path) = 0;

  virtual void set(const std::string& path, const nlohmann::json& value) = 0;

  virtual void remove(const std::string& path) = 0;

  // Runs body atomically with respect to other transactions; rolls back and
  // rethrows if body throws. Nested calls join the outer transaction.
  virtual void runTransaction(const std::function<void()>& body) = 0;

  bool exists(const std::string& path) { return get(path).has_value(); }
};

} // namespace cft
