#pragma once
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/storage/Database.hpp"
#include "core/trace/TraceContext.hpp"
#include "core/updatable/Updatable.hpp"
#include "core/util/IsoDate.hpp"

namespace cft {

// Immutable audit record of one accepted change.
struct StatisticsEvent {
  std::string name;
  Timestamp timestamp;
  nlohmann::json properties;

  nlohmann::json databaseObject() const;
  static StatisticsEvent fromObject(const nlohmann::json& value);
};

// Appends statistics events below "<clubPath>/statistics/<name>/<eventId>".
// Every event gets a fresh key, so history is never overwritten.
class StatisticsRecorder {
public:
  explicit StatisticsRecorder(Database& db) : db_(db) {}

  // Throws internal if the event couldn't be written.
  void record(const std::string& clubPath, const StatisticsEvent& event, const TraceContext& trace);

  // properties: { previousState: <stored form with id> | null, changedState: <stored form with id> }
  template <typename T>
  void recordChange(const std::string& clubPath, const std::string& name,
                    const std::optional<Updatable<T>>& previous, const Updatable<T>& changed,
                    const TraceContext& trace) {
    record(clubPath,
           StatisticsEvent{name, currentTimestamp(),
                           {{"previousState", previous ? previous->databaseObjectWithId() : nlohmann::json(nullptr)},
                            {"changedState", changed.databaseObjectWithId()}}},
           trace);
  }

  // Events of one name, oldest first.
  std::vector<StatisticsEvent> list(const std::string& clubPath, const std::string& name);

private:
  Database& db_;
};

} // namespace cft
