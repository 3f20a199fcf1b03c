#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace cft {

enum class ErrorCode {
  InvalidArgument,
  Unavailable,
  AlreadyExists,
  Internal,
  PermissionDenied,
};

// Wire name of the code, e.g. "invalid-argument".
std::string_view toString(ErrorCode code);

// Error returned to the caller of a function as { code, message }.
class FunctionError : public std::runtime_error {
public:
  FunctionError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

  ErrorCode code() const { return code_; }
  nlohmann::json toJson() const;

private:
  ErrorCode code_;
};

// Failure reported by the storage collaborator.
class DatabaseError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// "Couldn't <action>, underlying error: DatabaseError, <what>"
FunctionError internalError(const std::string& action, const DatabaseError& error);

} // namespace cft
