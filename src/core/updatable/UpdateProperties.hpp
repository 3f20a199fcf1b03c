#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "core/ids/Guid.hpp"
#include "core/util/IsoDate.hpp"

namespace cft {

class ParameterContainer;
class TraceContext;

// Ordering metadata of the last change of an entity: when it happened and
// which person made it.
struct UpdateProperties {
  Timestamp timestamp;
  Guid person_id;

  // True if a change carrying these properties replaces one carrying `other`:
  // a strictly newer timestamp, or the same timestamp and a greater person id.
  // Equal properties never supersede each other, so re-applying a change is a no-op.
  bool supersedes(const UpdateProperties& other) const;

  // { timestamp: "<iso>", personId: "<guid>" }
  nlohmann::json databaseObject() const;

  static UpdateProperties fromObject(const nlohmann::json& value, const TraceContext& trace);
  static UpdateProperties fromParameterContainer(const ParameterContainer& container,
                                                 const std::string& name,
                                                 const TraceContext& trace);
};

inline bool operator==(const UpdateProperties& a, const UpdateProperties& b) {
  return a.timestamp == b.timestamp && a.person_id == b.person_id;
}
inline bool operator!=(const UpdateProperties& a, const UpdateProperties& b) { return !(a == b); }

} // namespace cft
