#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace cft {

// Instants are kept with millisecond precision, the precision of the stored form.
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

// Accepts YYYY-MM-DD[THH:MM[:SS[.fff…]][Z|±HH|±HHMM|±HH:MM]].
// A missing offset is read as UTC.
std::optional<Timestamp> parseIsoDate(std::string_view value);

// Always YYYY-MM-DDTHH:MM:SS.mmmZ.
std::string formatIsoDate(Timestamp timestamp);

Timestamp currentTimestamp();

} // namespace cft
