#include "services/functions/Prerequirements.hpp"

#include "core/errors/FunctionError.hpp"

namespace cft {

std::string clubPath(const Config& config, const Guid& clubId) {
  return clubComponent(config.database_type) + "/" + clubId.guidString();
}

void checkPrerequirements(FunctionContext& context, const std::string& privateKey,
                          const std::optional<AuthState>& auth, const std::optional<Guid>& clubId,
                          const TraceContext& trace) {
  trace.append("checkPrerequirements");
  if (!context.config.function_call_key.empty() && privateKey != context.config.function_call_key)
    throw FunctionError(ErrorCode::PermissionDenied, "Private key is invalid.");

  if (!auth || auth->uid.empty())
    throw FunctionError(ErrorCode::PermissionDenied,
                        "The function must be called while authenticated, nobody signed in.");
  if (!clubId) return;

  if (auth->uid.find('/') != std::string::npos)
    throw FunctionError(ErrorCode::PermissionDenied, "The function must be called by a person of the club.");
  try {
    if (!context.db.exists(clubPath(context.config, *clubId) + "/personUserIds/" + auth->uid))
      throw FunctionError(ErrorCode::PermissionDenied, "The function must be called by a person of the club.");
  } catch (const DatabaseError& e) {
    throw internalError("check person of the club", e);
  }
}

void checkTestingDatabase(const Config& config) {
  if (config.database_type != DatabaseType::Testing)
    throw FunctionError(ErrorCode::PermissionDenied, "Test clubs only exist in the testing database.");
}

} // namespace cft
