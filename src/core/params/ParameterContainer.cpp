#include "core/params/ParameterContainer.hpp"

#include <cmath>
#include <cstdio>

namespace cft {

std::string_view toString(ParameterType type) {
  switch (type) {
    case ParameterType::String:  return "string";
    case ParameterType::Number:  return "number";
    case ParameterType::Boolean: return "boolean";
    case ParameterType::Object:  return "object";
  }
  return "object";
}

bool hasType(const nlohmann::json& value, ParameterType type) {
  switch (type) {
    case ParameterType::String:  return value.is_string();
    case ParameterType::Number:  return value.is_number();
    case ParameterType::Boolean: return value.is_boolean();
    case ParameterType::Object:  return value.is_object();
  }
  return false;
}

static std::string describeNumber(const nlohmann::json& value) {
  if (value.is_number_integer()) return value.dump();
  const double d = value.get<double>();
  if (std::isfinite(d) && d == std::trunc(d) && std::fabs(d) < 1e21) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.0f", d);
    return buf;
  }
  return value.dump();
}

std::string describeValue(const nlohmann::json* value) {
  if (value == nullptr) return "undefined";
  switch (value->type()) {
    case nlohmann::json::value_t::null:
      return "null";
    case nlohmann::json::value_t::string:
      return value->get<std::string>();
    case nlohmann::json::value_t::boolean:
      return value->get<bool>() ? "true" : "false";
    case nlohmann::json::value_t::number_integer:
    case nlohmann::json::value_t::number_unsigned:
    case nlohmann::json::value_t::number_float:
      return describeNumber(*value);
    case nlohmann::json::value_t::array: {
      std::string out;
      for (std::size_t i = 0; i < value->size(); ++i) {
        if (i > 0) out += ",";
        const auto& element = (*value)[i];
        if (!element.is_null()) out += describeValue(&element);
      }
      return out;
    }
    default:
      return "[object Object]";
  }
}

std::string typeOfValue(const nlohmann::json* value) {
  if (value == nullptr) return "undefined";
  if (value->is_string()) return "string";
  if (value->is_number()) return "number";
  if (value->is_boolean()) return "boolean";
  return "object";
}

ParameterContainer::ParameterContainer(nlohmann::json data) : data_(std::move(data)) {}

const nlohmann::json* ParameterContainer::find(const std::string& name) const {
  if (!data_.is_object()) return nullptr;
  auto it = data_.find(name);
  if (it == data_.end() || it->is_null()) return nullptr;
  return &*it;
}

const nlohmann::json* ParameterContainer::getOptionalParameter(const std::string& name,
                                                               ParameterType type) const {
  const auto* value = find(name);
  if (value == nullptr) return nullptr;
  if (!hasType(*value, type))
    throw FunctionError(ErrorCode::InvalidArgument,
                        "Couldn't parse '" + name + "'. Expected type '" + std::string(toString(type)) +
                        "', but got '" + describeValue(value) + "' from type '" + typeOfValue(value) + "'.");
  return value;
}

const nlohmann::json& ParameterContainer::getParameter(const std::string& name, ParameterType type) const {
  const auto* value = getOptionalParameter(name, type);
  if (value == nullptr)
    throw FunctionError(ErrorCode::InvalidArgument,
                        "Couldn't parse '" + name + "'. Expected type '" + std::string(toString(type)) +
                        "', but got undefined or null.");
  return *value;
}

std::string ParameterContainer::getString(const std::string& name) const {
  return getParameter(name, ParameterType::String).get<std::string>();
}

bool ParameterContainer::getOptionalBool(const std::string& name, bool fallback) const {
  const auto* value = getOptionalParameter(name, ParameterType::Boolean);
  return value ? value->get<bool>() : fallback;
}

Guid ParameterContainer::getGuid(const std::string& name) const {
  const std::string value = getString(name);
  try {
    return Guid::fromString(value);
  } catch (const GuidFormatError& e) {
    throw FunctionError(ErrorCode::InvalidArgument, e.what());
  }
}

} // namespace cft
