#pragma once
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/model/Fine.hpp"
#include "core/params/ParameterContainer.hpp"
#include "core/trace/TraceContext.hpp"
#include "core/updatable/UpdateProperties.hpp"
#include "services/functions/CallableFunction.hpp"

namespace cft {

// Changes the payed state of an existing fine.
//
// Parameters: privateKey, clubId, fineId, payedState, fineUpdateProperties.
// Saved statistic: changeFinePayed { previousFine, changedState }, where
// previousFine is the fine before the change with person and reason resolved.
//
// unavailable if the fine doesn't exist or is deleted, already-exists if a
// newer change of the fine is already stored.
class ChangeFinePayedFunction : public CallableFunction {
public:
  static constexpr const char* kName = "changeFinePayed";

  ChangeFinePayedFunction(const nlohmann::json& data, FunctionContext& context);

  nlohmann::json executeFunction(const std::optional<AuthState>& auth) override;

private:
  FunctionContext& context_;
  ParameterContainer container_;
  TraceContext trace_;
  std::string privateKey_;
  Guid clubId_;
  Guid fineId_;
  PayedState payedState_;
  UpdateProperties fineUpdateProperties_;
};

} // namespace cft
