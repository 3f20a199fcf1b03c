#include "services/functions/NewClubFunction.hpp"

#include "core/errors/FunctionError.hpp"
#include "core/updatable/Updatable.hpp"
#include "services/functions/Prerequirements.hpp"

namespace cft {

NewClubFunction::NewClubFunction(const nlohmann::json& data, FunctionContext& context)
  : context_(context), container_(data),
    trace_(TraceContext::start(kName, container_.getOptionalBool("verbose", false))),
    privateKey_(container_.getString("privateKey")),
    clubProperties_(ClubProperties::fromObject(container_.getParameter("clubProperties", ParameterType::Object),
                                               trace_.nested())),
    personProperties_(PersonPropertiesWithUserId::fromObject(
        container_.getParameter("personProperties", ParameterType::Object), trace_.nested())) {}

// Reads only the identifier leaf of each club.
bool NewClubFunction::identifierExists(const std::string& identifier) const {
  const std::string clubs = clubComponent(context_.config.database_type);
  for (const auto& clubId : context_.db.childKeys(clubs)) {
    const auto stored = context_.db.get(clubs + "/" + clubId + "/identifier");
    if (stored && stored->is_string() && stored->get<std::string>() == identifier) return true;
  }
  return false;
}

nlohmann::json NewClubFunction::executeFunction(const std::optional<AuthState>& auth) {
  checkPrerequirements(context_, privateKey_, auth, std::nullopt, trace_.nested());

  const std::string club = clubPath(context_.config, clubProperties_.id);
  bool created = false;
  try {
    context_.db.runTransaction([&] {
      if (context_.db.exists(club)) {
        trace_.append("club already exists", {{"clubId", clubProperties_.id.guidString()}});
        return;
      }
      if (identifierExists(clubProperties_.identifier))
        throw FunctionError(ErrorCode::AlreadyExists, "Club identifier already exists");

      Person person;
      person.id = personProperties_.id;
      person.name = personProperties_.name;
      person.sign_in_data = SignInData{true, personProperties_.sign_in_date, personProperties_.user_id};
      const Updatable<Person> updatablePerson(person, UpdateProperties{currentTimestamp(), person.id});

      nlohmann::json value = clubProperties_.databaseObject();
      value["personUserIds"] = {{personProperties_.user_id, person.id.guidString()}};
      value["persons"] = {{person.id.guidString(), updatablePerson.databaseObject()}};
      context_.db.set(club, value);
      created = true;
    });
  } catch (const DatabaseError& e) {
    throw internalError("create new club", e);
  }

  if (created) {
    nlohmann::json clubProperties = clubProperties_.databaseObject();
    clubProperties["id"] = clubProperties_.id.guidString();
    context_.statistics.record(club,
                               StatisticsEvent{kName, currentTimestamp(),
                                               {{"clubProperties", clubProperties},
                                                {"personProperties", personProperties_.databaseObject()}}},
                               trace_.nested());
  }
  return nullptr;
}

} // namespace cft
