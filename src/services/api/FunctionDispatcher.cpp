#include "FunctionDispatcher.hpp"

#include <spdlog/spdlog.h>

#include <utility>

#include "core/errors/FunctionError.hpp"
#include "core/model/Fine.hpp"
#include "core/model/Person.hpp"
#include "core/model/ReasonTemplate.hpp"
#include "services/functions/ChangeFinePayedFunction.hpp"
#include "services/functions/ChangeUpdatableFunction.hpp"
#include "services/functions/NewClubFunction.hpp"
#include "services/testing/TestClubFunctions.hpp"

namespace cft {

static nlohmann::json errorResult(const FunctionError& error) {
  return {{"error", error.toJson()}};
}

template <typename F>
static FunctionFactory factoryOf() {
  return [](const nlohmann::json& data, FunctionContext& context) -> std::unique_ptr<CallableFunction> {
    return std::make_unique<F>(data, context);
  };
}

template <typename T>
static FunctionFactory changeFactory(ChangeFunctionTraits traits) {
  return [traits](const nlohmann::json& data, FunctionContext& context) -> std::unique_ptr<CallableFunction> {
    return std::make_unique<ChangeUpdatableFunction<T>>(traits, data, context);
  };
}

FunctionDispatcher::FunctionDispatcher(Config config, Database& db)
  : config_(std::move(config)), db_(db), statistics_(db) {}

void FunctionDispatcher::add(const std::string& name, FunctionFactory factory) {
  functions_[name] = std::move(factory);
}

nlohmann::json FunctionDispatcher::call(const std::string& name, const nlohmann::json& data,
                                        const std::optional<AuthState>& auth) {
  auto it = functions_.find(name);
  if (it == functions_.end()) {
    spdlog::warn("call of unknown function {}", name);
    return errorResult(FunctionError(ErrorCode::InvalidArgument, "Function '" + name + "' doesn't exist."));
  }

  FunctionContext context{config_, db_, statistics_};
  try {
    auto function = it->second(data, context);
    nlohmann::json result = function->executeFunction(auth);
    spdlog::info("{} succeeded", name);
    return {{"result", result}};
  } catch (const FunctionError& e) {
    if (e.code() == ErrorCode::Internal) {
      spdlog::error("{} failed: {} {}", name, toString(e.code()), e.what());
    } else {
      spdlog::warn("{} failed: {} {}", name, toString(e.code()), e.what());
    }
    return errorResult(e);
  } catch (const std::exception& e) {
    spdlog::error("{} failed: {}", name, e.what());
    return errorResult(FunctionError(ErrorCode::Internal, std::string("Internal error: ") + e.what()));
  }
}

void addDefaultFunctions(FunctionDispatcher& dispatcher) {
  dispatcher.add("changeFine",
                 changeFactory<Fine>({"changeFine", "updatableFine", "fines", UpdatePolicy::LastWriterWins}));
  dispatcher.add("changePerson",
                 changeFactory<Person>({"changePerson", "updatablePerson", "persons", UpdatePolicy::LastWriterWins}));
  dispatcher.add("changeReasonTemplate",
                 changeFactory<ReasonTemplate>({"changeReasonTemplate", "updatableReasonTemplate", "reasonTemplates",
                                                UpdatePolicy::LastWriterWins}));
  dispatcher.add(ChangeFinePayedFunction::kName, factoryOf<ChangeFinePayedFunction>());
  dispatcher.add(NewClubFunction::kName, factoryOf<NewClubFunction>());
  dispatcher.add(NewTestClubFunction::kName, factoryOf<NewTestClubFunction>());
  dispatcher.add(DeleteTestClubsFunction::kName, factoryOf<DeleteTestClubsFunction>());
}

} // namespace cft
