#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

#include "core/ids/Guid.hpp"
#include "core/model/Person.hpp"
#include "core/model/ReasonTemplate.hpp"
#include "core/util/IsoDate.hpp"

namespace cft {

class TraceContext;

enum class PayedStateKind {
  Payed,
  Settled,
  Unpayed,
};

inline constexpr std::array<std::string_view, 3> kPayedStateValues = {"payed", "settled", "unpayed"};

inline std::string_view toString(PayedStateKind state) {
  return kPayedStateValues[static_cast<std::size_t>(state)];
}

// pay_date and in_app are set exactly when the state is payed.
struct PayedState {
  PayedStateKind state = PayedStateKind::Unpayed;
  std::optional<Timestamp> pay_date;
  std::optional<bool> in_app;

  static PayedState unpayed() { return PayedState{PayedStateKind::Unpayed, std::nullopt, std::nullopt}; }
  static PayedState settled() { return PayedState{PayedStateKind::Settled, std::nullopt, std::nullopt}; }
  static PayedState payed(Timestamp payDate, bool inApp) { return PayedState{PayedStateKind::Payed, payDate, inApp}; }

  // { state, payDate: <iso> | null, inApp: <bool> | null }
  nlohmann::json databaseObject() const;

  static PayedState fromObject(const nlohmann::json& value, const TraceContext& trace);
};

bool operator==(const PayedState& a, const PayedState& b);

struct FineReasonTemplate {
  Guid reason_template_id;
};

struct FineReasonCustom {
  std::string reason_message;
  double amount = 0;
  Importance importance = Importance::Medium;
};

// Either a reference to a reason template or a reason given with the fine.
struct FineReason {
  std::variant<FineReasonTemplate, FineReasonCustom> value;

  nlohmann::json databaseObject() const;
  static FineReason fromObject(const nlohmann::json& value, const TraceContext& trace);
};

struct Fine {
  static constexpr const char* kTypeName = "Fine";
  static constexpr const char* kName = "fine";

  Guid id;
  Guid person_id;
  PayedState payed_state;
  std::int64_t number = 1;
  Timestamp date;
  FineReason fine_reason;

  // { personId, payedState, number, date, fineReason }
  nlohmann::json databaseObject() const;

  // Fine as recorded in statistics, with its person and reason resolved.
  // reasonTemplate must be given when the fine refers to a template.
  nlohmann::json statistic(const Person& person, const ReasonTemplate* reasonTemplate) const;

  static Fine fromObject(const Guid& id, const nlohmann::json& value, const TraceContext& trace);
};

} // namespace cft
