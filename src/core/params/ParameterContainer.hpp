#pragma once
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "core/errors/FunctionError.hpp"
#include "core/ids/Guid.hpp"

namespace cft {

enum class ParameterType {
  String,
  Number,
  Boolean,
  Object,
};

// 'string', 'number', 'boolean' or 'object'.
std::string_view toString(ParameterType type);

bool hasType(const nlohmann::json& value, ParameterType type);

// Client-facing rendering of a received value, nullptr meaning the value was absent.
std::string describeValue(const nlohmann::json* value);
std::string typeOfValue(const nlohmann::json* value);

// "'a', 'b' or 'c'"
template <std::size_t N>
std::string listEnumValues(const std::array<std::string_view, N>& values) {
  std::string out;
  for (std::size_t i = 0; i < N; ++i) {
    if (i > 0) out += (i + 1 == N) ? " or " : ", ";
    out += "'" + std::string(values[i]) + "'";
  }
  return out;
}

template <typename Enum, std::size_t N>
std::optional<Enum> enumFromString(const std::array<std::string_view, N>& values, std::string_view value) {
  for (std::size_t i = 0; i < N; ++i) {
    if (values[i] == value) return static_cast<Enum>(i);
  }
  return std::nullopt;
}

// Top-level parameters of a function call as sent by the client.
// Pure: only looks at the payload it was constructed with.
class ParameterContainer {
public:
  explicit ParameterContainer(nlohmann::json data);

  // Throws invalid-argument:
  //   Couldn't parse '<name>'. Expected type '<type>', but got undefined or null.
  const nlohmann::json& getParameter(const std::string& name, ParameterType type) const;

  // nullptr when missing or null, throws like getParameter on a type mismatch.
  const nlohmann::json* getOptionalParameter(const std::string& name, ParameterType type) const;

  std::string getString(const std::string& name) const;
  bool getOptionalBool(const std::string& name, bool fallback) const;
  Guid getGuid(const std::string& name) const;

  template <typename Enum, std::size_t N>
  Enum getEnum(const std::string& name, std::string_view context,
               const std::array<std::string_view, N>& values) const {
    const auto& value = getParameter(name, ParameterType::String);
    if (auto parsed = enumFromString<Enum>(values, value.get<std::string>()))
      return *parsed;
    throw FunctionError(ErrorCode::InvalidArgument,
                        "Couldn't parse " + std::string(context) + " parameter '" + name +
                        "'. Expected values " + listEnumValues(values) + ", but got '" +
                        describeValue(&value) + "' from type '" + typeOfValue(&value) + "'.");
  }

private:
  const nlohmann::json* find(const std::string& name) const;

  nlohmann::json data_;
};

} // namespace cft
