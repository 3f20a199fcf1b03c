#include "core/updatable/UpdateProperties.hpp"

#include "core/errors/FunctionError.hpp"
#include "core/params/ParameterContainer.hpp"
#include "core/params/PropertyParser.hpp"
#include "core/trace/TraceContext.hpp"

namespace cft {

bool UpdateProperties::supersedes(const UpdateProperties& other) const {
  if (timestamp != other.timestamp) return timestamp > other.timestamp;
  return other.person_id < person_id;
}

nlohmann::json UpdateProperties::databaseObject() const {
  return {
    {"timestamp", formatIsoDate(timestamp)},
    {"personId", person_id.guidString()}
  };
}

UpdateProperties UpdateProperties::fromObject(const nlohmann::json& value, const TraceContext& trace) {
  trace.append("UpdateProperties.fromObject", value);
  if (!value.is_object())
    throw FunctionError(ErrorCode::InvalidArgument,
                        "Couldn't parse UpdateProperties, expected type 'object', but got '" +
                        describeValue(&value) + "' from type '" + typeOfValue(&value) + "'.");
  PropertyParser parser(value, "UpdateProperties");

  const auto* personId = parser.find("personId");
  if (personId == nullptr || !personId->is_string())
    parser.fail("Couldn't parse UpdateProperties parameter 'personId', expected type string but got '" +
                describeValue(personId) + "' from type " + typeOfValue(personId));

  UpdateProperties properties;
  properties.person_id = parser.requireGuid("personId");
  properties.timestamp = parser.requireDate("timestamp");
  return properties;
}

UpdateProperties UpdateProperties::fromParameterContainer(const ParameterContainer& container,
                                                          const std::string& name,
                                                          const TraceContext& trace) {
  return fromObject(container.getParameter(name, ParameterType::Object), trace.nested());
}

} // namespace cft
