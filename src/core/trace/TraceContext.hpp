#pragma once
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

namespace cft {

// Structured trace information handed alongside the parameters of one
// function invocation. Only used for logging.
class TraceContext {
public:
  static TraceContext start(std::string functionName, bool verbose);

  // Same invocation, one nesting level deeper.
  TraceContext nested() const;

  void append(std::string_view what, const nlohmann::json& details = nullptr) const;

private:
  TraceContext(std::string functionName, std::string invocationId, int depth, bool verbose)
    : functionName_(std::move(functionName)), invocationId_(std::move(invocationId)),
      depth_(depth), verbose_(verbose) {}

  std::string functionName_;
  std::string invocationId_;
  int depth_ = 0;
  bool verbose_ = false;
};

} // namespace cft
