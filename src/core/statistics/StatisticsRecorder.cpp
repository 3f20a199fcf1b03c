#include "core/statistics/StatisticsRecorder.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "core/errors/FunctionError.hpp"
#include "core/ids/Guid.hpp"

namespace cft {

nlohmann::json StatisticsEvent::databaseObject() const {
  return {
    {"name", name},
    {"timestamp", formatIsoDate(timestamp)},
    {"properties", properties}
  };
}

StatisticsEvent StatisticsEvent::fromObject(const nlohmann::json& value) {
  const auto timestamp = parseIsoDate(value.at("timestamp").get<std::string>());
  if (!timestamp) throw DatabaseError("statistic with invalid timestamp");
  return StatisticsEvent{value.at("name").get<std::string>(), *timestamp, value.value("properties", nlohmann::json())};
}

void StatisticsRecorder::record(const std::string& clubPath, const StatisticsEvent& event,
                                const TraceContext& trace) {
  const std::string path = clubPath + "/statistics/" + event.name + "/" + Guid::newGuid().guidString();
  trace.append("StatisticsRecorder.record", {{"path", path}});
  try {
    db_.set(path, event.databaseObject());
  } catch (const DatabaseError& e) {
    spdlog::error("statistic {} not saved: {}", event.name, e.what());
    throw internalError("save statistic", e);
  }
}

std::vector<StatisticsEvent> StatisticsRecorder::list(const std::string& clubPath, const std::string& name) {
  std::vector<StatisticsEvent> events;
  const auto stored = db_.get(clubPath + "/statistics/" + name);
  if (!stored || !stored->is_object()) return events;
  try {
    for (const auto& item : stored->items()) events.push_back(StatisticsEvent::fromObject(item.value()));
  } catch (const nlohmann::json::exception& e) {
    throw DatabaseError(std::string("corrupt statistic: ") + e.what());
  }
  std::stable_sort(events.begin(), events.end(),
                   [](const StatisticsEvent& a, const StatisticsEvent& b) { return a.timestamp < b.timestamp; });
  return events;
}

} // namespace cft
