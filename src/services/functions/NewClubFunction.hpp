#pragma once
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/model/ClubProperties.hpp"
#include "core/model/Person.hpp"
#include "core/params/ParameterContainer.hpp"
#include "core/trace/TraceContext.hpp"
#include "services/functions/CallableFunction.hpp"

namespace cft {

// Creates a club with its first person, who becomes admin.
// A club with the same id is left untouched; a different club with the same
// identifier is rejected with already-exists.
class NewClubFunction : public CallableFunction {
public:
  static constexpr const char* kName = "newClub";

  NewClubFunction(const nlohmann::json& data, FunctionContext& context);

  nlohmann::json executeFunction(const std::optional<AuthState>& auth) override;

private:
  bool identifierExists(const std::string& identifier) const;

  FunctionContext& context_;
  ParameterContainer container_;
  TraceContext trace_;
  std::string privateKey_;
  ClubProperties clubProperties_;
  PersonPropertiesWithUserId personProperties_;
};

} // namespace cft
