#pragma once
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/ids/Guid.hpp"
#include "core/util/IsoDate.hpp"

namespace cft {

class TraceContext;

struct PersonName {
  std::string first;
  std::optional<std::string> last;

  nlohmann::json databaseObject() const;
  static PersonName fromObject(const nlohmann::json& value, const TraceContext& trace);
};

bool operator==(const PersonName& a, const PersonName& b);

// Present once the person is linked to a signed-in user.
struct SignInData {
  bool admin = false;
  Timestamp sign_in_date;
  std::string user_id;

  nlohmann::json databaseObject() const;
  static SignInData fromObject(const nlohmann::json& value, const TraceContext& trace);
};

struct Person {
  static constexpr const char* kTypeName = "Person";
  static constexpr const char* kName = "person";

  Guid id;
  PersonName name;
  std::optional<SignInData> sign_in_data;

  // { name, signInData? }
  nlohmann::json databaseObject() const;

  // { id, name } as embedded in statistics.
  nlohmann::json statistic() const;

  static Person fromObject(const Guid& id, const nlohmann::json& value, const TraceContext& trace);
};

// Person creating a club, together with the user account it is linked to.
struct PersonPropertiesWithUserId {
  Guid id;
  Timestamp sign_in_date;
  std::string user_id;
  PersonName name;

  nlohmann::json databaseObject() const;
  static PersonPropertiesWithUserId fromObject(const nlohmann::json& value, const TraceContext& trace);
};

} // namespace cft
