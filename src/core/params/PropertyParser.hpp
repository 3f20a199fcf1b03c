#pragma once
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

#include "core/errors/FunctionError.hpp"
#include "core/ids/Guid.hpp"
#include "core/params/ParameterContainer.hpp"
#include "core/util/IsoDate.hpp"

namespace cft {

// Reads the properties of one nested object, e.g. a PayedState. Failures name
// the context of the object they were found in:
//   Couldn't parse PayedState parameter 'inApp'. Expected type 'boolean', but got 'undefined' from type 'undefined'.
class PropertyParser {
public:
  // value must already be a json object.
  PropertyParser(const nlohmann::json& value, std::string context)
    : value_(value), context_(std::move(context)) {}

  // nullptr if the property is absent.
  const nlohmann::json* find(const std::string& field) const;
  bool contains(const std::string& field) const { return find(field) != nullptr; }

  const nlohmann::json& require(const std::string& field, ParameterType type) const;
  std::string requireString(const std::string& field) const;
  double requireNumber(const std::string& field) const;
  bool requireBool(const std::string& field) const;
  const nlohmann::json& requireObject(const std::string& field) const;
  Guid requireGuid(const std::string& field) const;

  // ISO datetime string; has its own message naming the literal value.
  Timestamp requireDate(const std::string& field) const;

  // Absent or null gives nullopt.
  std::optional<std::string> optionalString(const std::string& field) const;

  template <typename Enum, std::size_t N>
  Enum requireEnum(const std::string& field, const std::array<std::string_view, N>& values) const {
    const auto* value = find(field);
    if (value != nullptr && value->is_string()) {
      if (auto parsed = enumFromString<Enum>(values, value->get<std::string>())) return *parsed;
    }
    fail("Couldn't parse " + context_ + " parameter '" + field + "'. Expected values " +
         listEnumValues(values) + ", but got '" + describeValue(value) + "' from type '" +
         typeOfValue(value) + "'.");
  }

  [[noreturn]] void fail(const std::string& message) const;

  const nlohmann::json& value() const { return value_; }
  const std::string& context() const { return context_; }

private:
  const nlohmann::json& value_;
  std::string context_;
};

} // namespace cft
