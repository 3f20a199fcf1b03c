#pragma once
#include <optional>
#include <string>
#include <utility>

#include "core/errors/FunctionError.hpp"
#include "core/storage/Database.hpp"
#include "core/trace/TraceContext.hpp"
#include "core/updatable/Updatable.hpp"

namespace cft {

template <typename T>
struct ChangeOutcome {
  bool applied = false;
  std::optional<Updatable<T>> previous;  // value read right before the decision
};

// Updatable entity stored at one key path of the database.
template <typename T>
class UpdatableReference {
public:
  UpdatableReference(Database& db, std::string path, Guid id)
    : db_(db), path_(std::move(path)), id_(id) {}

  const std::string& path() const { return path_; }

  // nullopt if nothing was ever stored; a tombstone is returned as such.
  std::optional<Updatable<T>> get(const TraceContext& trace) const {
    std::optional<nlohmann::json> value;
    try {
      value = db_.get(path_);
    } catch (const DatabaseError& e) {
      throw internalError(std::string("get ") + T::kName, e);
    }
    if (!value) return std::nullopt;
    try {
      return Updatable<T>::fromStored(id_, *value, trace.nested());
    } catch (const FunctionError& e) {
      throw FunctionError(ErrorCode::Internal,
                          std::string("Couldn't parse stored ") + T::kName + " at '" + path_ + "': " + e.what());
    }
  }

  // Stored value for callers that need an active entity.
  // Throws unavailable "Couldn't get <name> from 'Deleted'." for a tombstone
  // and for an entity that was never stored.
  Updatable<T> getActive(const TraceContext& trace) const {
    auto current = get(trace);
    if (!current) trace.append(std::string(T::kName) + " never existed", {{"path", path_}});
    if (!current || current->isDeleted())
      throw FunctionError(ErrorCode::Unavailable, std::string("Couldn't get ") + T::kName + " from 'Deleted'.");
    return std::move(*current);
  }

  // Read-decide-write in one transaction. A stale change is discarded
  // (LastWriterWins) or rejected with already-exists (Strict).
  ChangeOutcome<T> change(const Updatable<T>& incoming, UpdatePolicy policy, const TraceContext& trace) {
    trace.append("UpdatableReference.change", {{"path", path_}});
    ChangeOutcome<T> outcome;
    try {
      db_.runTransaction([&] {
        outcome.previous = get(trace);
        outcome.applied = shouldApply(outcome.previous, incoming);
        if (outcome.applied) {
          db_.set(path_, incoming.databaseObject());
        } else if (policy == UpdatePolicy::Strict) {
          throw FunctionError(ErrorCode::AlreadyExists,
                              std::string("Couldn't change ") + T::kName + ", a newer change is already stored.");
        }
      });
    } catch (const DatabaseError& e) {
      throw internalError(std::string("change ") + T::kName, e);
    }
    if (!outcome.applied) trace.append("change discarded, stored state is newer");
    return outcome;
  }

private:
  Database& db_;
  std::string path_;
  Guid id_;
};

} // namespace cft
