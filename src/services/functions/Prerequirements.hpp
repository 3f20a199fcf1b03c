#pragma once
#include <optional>
#include <string>

#include "core/ids/Guid.hpp"
#include "core/trace/TraceContext.hpp"
#include "services/functions/CallableFunction.hpp"

namespace cft {

// "<clubComponent>/<clubId>"
std::string clubPath(const Config& config, const Guid& clubId);

// Throws permission-denied unless the private key matches, the caller is
// signed in and, if clubId is given, the caller is a person of that club.
void checkPrerequirements(FunctionContext& context, const std::string& privateKey,
                          const std::optional<AuthState>& auth, const std::optional<Guid>& clubId,
                          const TraceContext& trace);

// Throws permission-denied unless the process works on the testing database.
void checkTestingDatabase(const Config& config);

} // namespace cft
