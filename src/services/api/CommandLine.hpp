#pragma once
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "services/api/FunctionDispatcher.hpp"

namespace cft {

// Parsed arguments of the club-fines executable.
struct CommandLine {
  enum class Mode {
    Init,   // --init
    Call,   // --call <function> [--uid <uid>]
    Usage,  // anything else
  };

  Mode mode = Mode::Usage;
  std::string function;
  std::optional<AuthState> auth;
};

// args without the program name.
CommandLine parseCommandLine(const std::vector<std::string>& args);

void printUsage(std::ostream& out, const std::string& program);

// Reads the JSON payload from in (blank input is {}), calls the function and
// writes the result to out. Returns 0 on success, 1 if the function failed
// and 2 if the payload is not valid JSON.
int runCall(FunctionDispatcher& dispatcher, const CommandLine& command, std::istream& in, std::ostream& out,
            std::ostream& err);

} // namespace cft
