#pragma once
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/config/Config.hpp"
#include "core/statistics/StatisticsRecorder.hpp"
#include "core/storage/Database.hpp"

namespace cft {

// Identity of the caller as established by the authentication provider.
struct AuthState {
  std::string uid;
};

// Collaborators shared by all invocations of a process.
struct FunctionContext {
  const Config& config;
  Database& db;
  StatisticsRecorder& statistics;
};

// One callable function. Parameters are parsed when the function is
// constructed from the request payload, before any storage access.
class CallableFunction {
public:
  virtual ~CallableFunction() = default;

  // Result sent back to the caller, null for functions without a result.
  virtual nlohmann::json executeFunction(const std::optional<AuthState>& auth) = 0;
};

} // namespace cft
