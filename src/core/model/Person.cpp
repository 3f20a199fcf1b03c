#include "core/model/Person.hpp"

#include "core/params/PropertyParser.hpp"
#include "core/trace/TraceContext.hpp"

namespace cft {

bool operator==(const PersonName& a, const PersonName& b) {
  return a.first == b.first && a.last == b.last;
}

nlohmann::json PersonName::databaseObject() const {
  nlohmann::json object = {{"first", first}};
  if (last) object["last"] = *last;
  return object;
}

PersonName PersonName::fromObject(const nlohmann::json& value, const TraceContext& trace) {
  trace.append("PersonName.fromObject", value);
  PropertyParser parser(value, "PersonName");
  return PersonName{parser.requireString("first"), parser.optionalString("last")};
}

nlohmann::json SignInData::databaseObject() const {
  return {
    {"admin", admin},
    {"signInDate", formatIsoDate(sign_in_date)},
    {"userId", user_id}
  };
}

SignInData SignInData::fromObject(const nlohmann::json& value, const TraceContext& trace) {
  trace.append("SignInData.fromObject", value);
  PropertyParser parser(value, "SignInData");
  SignInData data;
  data.admin = parser.requireBool("admin");
  data.sign_in_date = parser.requireDate("signInDate");
  data.user_id = parser.requireString("userId");
  return data;
}

nlohmann::json Person::databaseObject() const {
  nlohmann::json object = {{"name", name.databaseObject()}};
  if (sign_in_data) object["signInData"] = sign_in_data->databaseObject();
  return object;
}

nlohmann::json Person::statistic() const {
  return {
    {"id", id.guidString()},
    {"name", name.databaseObject()}
  };
}

Person Person::fromObject(const Guid& id, const nlohmann::json& value, const TraceContext& trace) {
  trace.append("Person.fromObject", value);
  PropertyParser parser(value, kTypeName);
  Person person;
  person.id = id;
  person.name = PersonName::fromObject(parser.requireObject("name"), trace.nested());
  const auto* signInData = parser.find("signInData");
  if (signInData != nullptr && !signInData->is_null())
    person.sign_in_data = SignInData::fromObject(parser.requireObject("signInData"), trace.nested());
  return person;
}

nlohmann::json PersonPropertiesWithUserId::databaseObject() const {
  return {
    {"id", id.guidString()},
    {"signInDate", formatIsoDate(sign_in_date)},
    {"userId", user_id},
    {"name", name.databaseObject()}
  };
}

PersonPropertiesWithUserId PersonPropertiesWithUserId::fromObject(const nlohmann::json& value,
                                                                  const TraceContext& trace) {
  trace.append("PersonPropertiesWithUserId.fromObject", value);
  PropertyParser parser(value, "PersonPropertiesWithUserId");
  PersonPropertiesWithUserId properties;
  properties.id = parser.requireGuid("id");
  properties.sign_in_date = parser.requireDate("signInDate");
  properties.user_id = parser.requireString("userId");
  if (properties.user_id.empty() || properties.user_id.find('/') != std::string::npos)
    parser.fail("Couldn't parse PersonPropertiesWithUserId parameter 'userId', expected a non-empty key "
                "without '/', but got '" + properties.user_id + "'.");
  properties.name = PersonName::fromObject(parser.requireObject("name"), trace.nested());
  return properties;
}

} // namespace cft
