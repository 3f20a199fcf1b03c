#include "core/model/ClubProperties.hpp"

#include "core/params/PropertyParser.hpp"
#include "core/trace/TraceContext.hpp"

namespace cft {

nlohmann::json ClubProperties::databaseObject() const {
  return {
    {"name", name},
    {"identifier", identifier},
    {"regionCode", region_code},
    {"inAppPaymentActive", in_app_payment_active}
  };
}

ClubProperties ClubProperties::fromObject(const nlohmann::json& value, const TraceContext& trace) {
  trace.append("ClubProperties.fromObject", value);
  PropertyParser parser(value, "ClubProperties");
  ClubProperties properties;
  properties.id = parser.requireGuid("id");
  properties.name = parser.requireString("name");
  properties.identifier = parser.requireString("identifier");
  properties.region_code = parser.requireString("regionCode");
  properties.in_app_payment_active = parser.requireBool("inAppPaymentActive");
  return properties;
}

} // namespace cft
