#pragma once
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/config/Config.hpp"
#include "core/statistics/StatisticsRecorder.hpp"
#include "core/storage/Database.hpp"
#include "services/functions/CallableFunction.hpp"

namespace cft {

using FunctionFactory =
    std::function<std::unique_ptr<CallableFunction>(const nlohmann::json& data, FunctionContext& context)>;

// Routes a named call with an untyped payload to its function.
class FunctionDispatcher {
public:
  FunctionDispatcher(Config config, Database& db);

  void add(const std::string& name, FunctionFactory factory);

  // { "result": <value> } on success, { "error": { "code", "message" } } otherwise.
  nlohmann::json call(const std::string& name, const nlohmann::json& data, const std::optional<AuthState>& auth);

private:
  Config config_;
  Database& db_;
  StatisticsRecorder statistics_;
  std::map<std::string, FunctionFactory> functions_;
};

// changeFine, changeFinePayed, changePerson, changeReasonTemplate, newClub,
// newTestClub and deleteTestClubs.
void addDefaultFunctions(FunctionDispatcher& dispatcher);

} // namespace cft
