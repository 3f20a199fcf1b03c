#include "core/trace/TraceContext.hpp"

#include <spdlog/spdlog.h>

#include "core/ids/Guid.hpp"

namespace cft {

TraceContext TraceContext::start(std::string functionName, bool verbose) {
  TraceContext trace(std::move(functionName), Guid::newGuid().guidString(), 0, verbose);
  trace.append("start");
  return trace;
}

TraceContext TraceContext::nested() const {
  return TraceContext(functionName_, invocationId_, depth_ + 1, verbose_);
}

void TraceContext::append(std::string_view what, const nlohmann::json& details) const {
  const auto level = verbose_ ? spdlog::level::info : spdlog::level::debug;
  if (!spdlog::should_log(level)) return;
  const std::string indent(static_cast<std::size_t>(depth_) * 2, ' ');
  if (details.is_null()) {
    spdlog::log(level, "[{} {}] {}{}", functionName_, invocationId_, indent, what);
  } else {
    spdlog::log(level, "[{} {}] {}{} {}", functionName_, invocationId_, indent, what, details.dump());
  }
}

} // namespace cft
