#include "core/errors/FunctionError.hpp"

namespace cft {

std::string_view toString(ErrorCode code) {
  switch (code) {
    case ErrorCode::InvalidArgument:  return "invalid-argument";
    case ErrorCode::Unavailable:      return "unavailable";
    case ErrorCode::AlreadyExists:    return "already-exists";
    case ErrorCode::Internal:         return "internal";
    case ErrorCode::PermissionDenied: return "permission-denied";
  }
  return "internal";
}

nlohmann::json FunctionError::toJson() const {
  return {
    {"code", std::string(toString(code_))},
    {"message", what()}
  };
}

FunctionError internalError(const std::string& action, const DatabaseError& error) {
  return FunctionError(ErrorCode::Internal,
                       "Couldn't " + action + ", underlying error: DatabaseError, " + error.what());
}

} // namespace cft
