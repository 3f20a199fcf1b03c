#include "core/model/ReasonTemplate.hpp"

#include <cmath>

#include "core/params/PropertyParser.hpp"
#include "core/trace/TraceContext.hpp"

namespace cft {

double parseAmount(const PropertyParser& parser, const std::string& field) {
  const auto& value = parser.require(field, ParameterType::Number);
  const double amount = value.get<double>();
  if (!std::isfinite(amount) || amount < 0)
    parser.fail("Couldn't parse " + parser.context() + " parameter '" + field +
                "'. Expected a non-negative amount, but got '" + describeValue(&value) + "'.");
  return amount;
}

nlohmann::json ReasonTemplate::databaseObject() const {
  return {
    {"reasonMessage", reason_message},
    {"amount", amount},
    {"importance", std::string(toString(importance))}
  };
}

ReasonTemplate ReasonTemplate::fromObject(const Guid& id, const nlohmann::json& value,
                                          const TraceContext& trace) {
  trace.append("ReasonTemplate.fromObject", value);
  PropertyParser parser(value, kTypeName);
  ReasonTemplate reasonTemplate;
  reasonTemplate.id = id;
  reasonTemplate.reason_message = parser.requireString("reasonMessage");
  reasonTemplate.amount = parseAmount(parser, "amount");
  reasonTemplate.importance = parser.requireEnum<Importance>("importance", kImportanceValues);
  return reasonTemplate;
}

} // namespace cft
