#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "core/ids/Guid.hpp"

namespace cft {

class TraceContext;

struct ClubProperties {
  Guid id;
  std::string name;
  std::string identifier;   // unique among all clubs of a database
  std::string region_code;
  bool in_app_payment_active = false;

  // { name, identifier, regionCode, inAppPaymentActive }
  nlohmann::json databaseObject() const;

  static ClubProperties fromObject(const nlohmann::json& value, const TraceContext& trace);
};

} // namespace cft
