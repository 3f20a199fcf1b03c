#pragma once
#include <optional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "core/errors/FunctionError.hpp"
#include "core/model/ChangeType.hpp"
#include "core/params/ParameterContainer.hpp"
#include "core/trace/TraceContext.hpp"
#include "core/updatable/Updatable.hpp"
#include "core/updatable/UpdatableReference.hpp"
#include "services/functions/CallableFunction.hpp"
#include "services/functions/Prerequirements.hpp"

namespace cft {

// What distinguishes changeFine, changePerson and changeReasonTemplate.
struct ChangeFunctionTraits {
  std::string function_name;   // also the statistic name, e.g. "changeFine"
  std::string parameter_name;  // e.g. "updatableFine"
  std::string list_component;  // e.g. "fines"
  UpdatePolicy policy = UpdatePolicy::LastWriterWins;
};

// Updates or deletes one element of a club list.
//
// Parameters:
//  - privateKey (string)
//  - clubId (guid)
//  - changeType ('update' | 'delete')
//  - <parameter_name> (Updatable<T>): entity, or tombstone if change type is 'delete'
//
// Saved statistic: <function_name> { previousState, changedState }, only if the change was applied.
template <typename T>
class ChangeUpdatableFunction : public CallableFunction {
public:
  ChangeUpdatableFunction(ChangeFunctionTraits traits, const nlohmann::json& data, FunctionContext& context)
    : traits_(std::move(traits)), context_(context), container_(data),
      trace_(TraceContext::start(traits_.function_name, container_.getOptionalBool("verbose", false))),
      privateKey_(container_.getString("privateKey")),
      clubId_(container_.getGuid("clubId")),
      changeType_(container_.getEnum<ChangeType>("changeType", "ChangeType", kChangeTypeValues)),
      updatable_(Updatable<T>::fromParameterContainer(container_, traits_.parameter_name, trace_)) {
    if (changeType_ == ChangeType::Update && updatable_.isDeleted())
      throw FunctionError(ErrorCode::InvalidArgument,
                          "Couldn't parse '" + traits_.parameter_name + "', change type 'update' needs a " +
                          T::kName + ", but got a deleted " + T::kName + ".");
    if (changeType_ == ChangeType::Delete && !updatable_.isDeleted())
      throw FunctionError(ErrorCode::InvalidArgument,
                          "Couldn't parse '" + traits_.parameter_name + "', change type 'delete' needs a deleted " +
                          T::kName + ", but got a " + T::kName + ".");
  }

  nlohmann::json executeFunction(const std::optional<AuthState>& auth) override {
    checkPrerequirements(context_, privateKey_, auth, clubId_, trace_.nested());

    const std::string club = clubPath(context_.config, clubId_);
    UpdatableReference<T> reference(context_.db, club + "/" + traits_.list_component + "/" +
                                    updatable_.id().guidString(), updatable_.id());
    const auto outcome = reference.change(updatable_, traits_.policy, trace_.nested());
    if (outcome.applied)
      context_.statistics.recordChange(club, traits_.function_name, outcome.previous, updatable_, trace_.nested());
    return nullptr;
  }

private:
  ChangeFunctionTraits traits_;
  FunctionContext& context_;
  ParameterContainer container_;
  TraceContext trace_;
  std::string privateKey_;
  Guid clubId_;
  ChangeType changeType_;
  Updatable<T> updatable_;
};

} // namespace cft
