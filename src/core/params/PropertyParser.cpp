#include "core/params/PropertyParser.hpp"

namespace cft {

const nlohmann::json* PropertyParser::find(const std::string& field) const {
  auto it = value_.find(field);
  return it == value_.end() ? nullptr : &*it;
}

void PropertyParser::fail(const std::string& message) const {
  throw FunctionError(ErrorCode::InvalidArgument, message);
}

const nlohmann::json& PropertyParser::require(const std::string& field, ParameterType type) const {
  const auto* value = find(field);
  if (value == nullptr || !hasType(*value, type))
    fail("Couldn't parse " + context_ + " parameter '" + field + "'. Expected type '" +
         std::string(toString(type)) + "', but got '" + describeValue(value) + "' from type '" +
         typeOfValue(value) + "'.");
  return *value;
}

std::string PropertyParser::requireString(const std::string& field) const {
  return require(field, ParameterType::String).get<std::string>();
}

double PropertyParser::requireNumber(const std::string& field) const {
  return require(field, ParameterType::Number).get<double>();
}

bool PropertyParser::requireBool(const std::string& field) const {
  return require(field, ParameterType::Boolean).get<bool>();
}

const nlohmann::json& PropertyParser::requireObject(const std::string& field) const {
  return require(field, ParameterType::Object);
}

Guid PropertyParser::requireGuid(const std::string& field) const {
  const std::string value = requireString(field);
  auto guid = Guid::tryParse(value);
  if (!guid)
    fail("Couldn't parse " + context_ + " parameter '" + field + "', expected guid string, but got '" +
         value + "'.");
  return *guid;
}

Timestamp PropertyParser::requireDate(const std::string& field) const {
  const auto* value = find(field);
  if (value != nullptr && value->is_string()) {
    if (auto date = parseIsoDate(value->get<std::string>())) return *date;
  }
  fail("Couldn't parse " + context_ + " parameter '" + field + "', expected iso string, but got '" +
       describeValue(value) + "' from type " + typeOfValue(value));
}

std::optional<std::string> PropertyParser::optionalString(const std::string& field) const {
  const auto* value = find(field);
  if (value == nullptr || value->is_null()) return std::nullopt;
  return require(field, ParameterType::String).get<std::string>();
}

} // namespace cft
