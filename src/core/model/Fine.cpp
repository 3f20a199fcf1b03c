#include "core/model/Fine.hpp"

#include <cmath>
#include <stdexcept>

#include "core/params/PropertyParser.hpp"
#include "core/trace/TraceContext.hpp"

namespace cft {

bool operator==(const PayedState& a, const PayedState& b) {
  return a.state == b.state && a.pay_date == b.pay_date && a.in_app == b.in_app;
}

nlohmann::json PayedState::databaseObject() const {
  return {
    {"state", std::string(toString(state))},
    {"payDate", pay_date ? nlohmann::json(formatIsoDate(*pay_date)) : nlohmann::json(nullptr)},
    {"inApp", in_app ? nlohmann::json(*in_app) : nlohmann::json(nullptr)}
  };
}

PayedState PayedState::fromObject(const nlohmann::json& value, const TraceContext& trace) {
  trace.append("PayedState.fromObject", value);
  PropertyParser parser(value, "PayedState");
  const auto state = parser.requireEnum<PayedStateKind>("state", kPayedStateValues);
  if (state != PayedStateKind::Payed) return PayedState{state, std::nullopt, std::nullopt};
  const Timestamp payDate = parser.requireDate("payDate");
  const bool inApp = parser.requireBool("inApp");
  return payed(payDate, inApp);
}

nlohmann::json FineReason::databaseObject() const {
  if (const auto* reference = std::get_if<FineReasonTemplate>(&value))
    return {{"reasonTemplateId", reference->reason_template_id.guidString()}};
  const auto& custom = std::get<FineReasonCustom>(value);
  return {
    {"reasonMessage", custom.reason_message},
    {"amount", custom.amount},
    {"importance", std::string(toString(custom.importance))}
  };
}

FineReason FineReason::fromObject(const nlohmann::json& value, const TraceContext& trace) {
  trace.append("FineReason.fromObject", value);
  PropertyParser parser(value, "FineReason");
  if (parser.contains("reasonTemplateId"))
    return FineReason{FineReasonTemplate{parser.requireGuid("reasonTemplateId")}};
  FineReasonCustom custom;
  custom.reason_message = parser.requireString("reasonMessage");
  custom.amount = parseAmount(parser, "amount");
  custom.importance = parser.requireEnum<Importance>("importance", kImportanceValues);
  return FineReason{custom};
}

nlohmann::json Fine::databaseObject() const {
  return {
    {"personId", person_id.guidString()},
    {"payedState", payed_state.databaseObject()},
    {"number", number},
    {"date", formatIsoDate(date)},
    {"fineReason", fine_reason.databaseObject()}
  };
}

nlohmann::json Fine::statistic(const Person& person, const ReasonTemplate* reasonTemplate) const {
  nlohmann::json reason;
  if (const auto* reference = std::get_if<FineReasonTemplate>(&fine_reason.value)) {
    if (reasonTemplate == nullptr || reasonTemplate->id != reference->reason_template_id)
      throw std::invalid_argument("fine statistic needs reason template " +
                                  reference->reason_template_id.guidString());
    reason = {
      {"id", reasonTemplate->id.guidString()},
      {"reasonMessage", reasonTemplate->reason_message},
      {"amount", reasonTemplate->amount},
      {"importance", std::string(toString(reasonTemplate->importance))}
    };
  } else {
    const auto& custom = std::get<FineReasonCustom>(fine_reason.value);
    reason = {
      {"id", nullptr},
      {"reasonMessage", custom.reason_message},
      {"amount", custom.amount},
      {"importance", std::string(toString(custom.importance))}
    };
  }
  return {
    {"id", id.guidString()},
    {"number", number},
    {"date", formatIsoDate(date)},
    {"payedState", payed_state.databaseObject()},
    {"person", person.statistic()},
    {"fineReason", reason}
  };
}

Fine Fine::fromObject(const Guid& id, const nlohmann::json& value, const TraceContext& trace) {
  trace.append("Fine.fromObject", value);
  PropertyParser parser(value, kTypeName);
  Fine fine;
  fine.id = id;
  fine.person_id = parser.requireGuid("personId");
  fine.date = parser.requireDate("date");
  fine.payed_state = PayedState::fromObject(parser.requireObject("payedState"), trace.nested());

  const auto& number = parser.require("number", ParameterType::Number);
  const double n = number.get<double>();
  if (!std::isfinite(n) || n < 1 || n != std::trunc(n) || n > 9007199254740991.0)
    parser.fail("Couldn't parse Fine parameter 'number'. Expected a positive integer, but got '" +
                describeValue(&number) + "'.");
  fine.number = static_cast<std::int64_t>(n);

  fine.fine_reason = FineReason::fromObject(parser.requireObject("fineReason"), trace.nested());
  return fine;
}

} // namespace cft
