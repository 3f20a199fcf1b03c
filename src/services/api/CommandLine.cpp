#include "services/api/CommandLine.hpp"

#include <istream>
#include <iterator>
#include <ostream>

#include <spdlog/spdlog.h>

namespace cft {

static nlohmann::json readPayload(std::istream& in) {
  const std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  if (text.find_first_not_of(" \t\r\n") == std::string::npos) return nlohmann::json::object();
  return nlohmann::json::parse(text);
}

static bool isOption(const std::string& arg) {
  return arg.compare(0, 2, "--") == 0;
}

CommandLine parseCommandLine(const std::vector<std::string>& args) {
  CommandLine command;
  if (args.empty()) return command;

  if (args[0] == "--init") {
    if (args.size() == 1) command.mode = CommandLine::Mode::Init;
    return command;
  }

  if (args[0] != "--call" || args.size() < 2 || isOption(args[1])) return command;
  command.function = args[1];
  for (std::size_t i = 2; i < args.size(); i += 2) {
    if (args[i] != "--uid" || i + 1 >= args.size()) {
      spdlog::warn("unexpected argument '{}'", args[i]);
      return CommandLine{};
    }
    command.auth = AuthState{args[i + 1]};
  }
  command.mode = CommandLine::Mode::Call;
  return command;
}

void printUsage(std::ostream& out, const std::string& program) {
  out << "Usage:\n"
      << "  " << program << " --init                           # create/upgrade SQLite schema\n"
      << "  " << program << " --call <function> [--uid <uid>]  # call a function, JSON payload on stdin\n";
}

int runCall(FunctionDispatcher& dispatcher, const CommandLine& command, std::istream& in, std::ostream& out,
            std::ostream& err) {
  nlohmann::json payload;
  try {
    payload = readPayload(in);
  } catch (const nlohmann::json::parse_error& e) {
    err << "invalid JSON payload: " << e.what() << "\n";
    return 2;
  }

  const nlohmann::json result = dispatcher.call(command.function, payload, command.auth);
  out << result.dump(2) << "\n";
  return result.contains("error") ? 1 : 0;
}

} // namespace cft
