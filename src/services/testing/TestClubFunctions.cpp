#include "services/testing/TestClubFunctions.hpp"

#include "core/errors/FunctionError.hpp"
#include "services/functions/Prerequirements.hpp"

namespace cft {

NewTestClubFunction::NewTestClubFunction(const nlohmann::json& data, FunctionContext& context)
  : context_(context), container_(data),
    trace_(TraceContext::start(kName, container_.getOptionalBool("verbose", false))),
    privateKey_(container_.getString("privateKey")),
    clubId_(container_.getGuid("clubId")),
    testClubType_(container_.getEnum<TestClubType>("testClubType", "TestClubType", kTestClubTypeValues)) {}

nlohmann::json NewTestClubFunction::executeFunction(const std::optional<AuthState>& auth) {
  checkPrerequirements(context_, privateKey_, auth, std::nullopt, trace_.nested());
  checkTestingDatabase(context_.config);

  const std::string club = clubPath(context_.config, clubId_);
  try {
    context_.db.set(club, testClub(testClubType_, clubId_));
  } catch (const DatabaseError& e) {
    throw internalError("create test club", e);
  }
  context_.statistics.record(
      club,
      StatisticsEvent{kName, currentTimestamp(),
                      {{"testClubType", std::string(kTestClubTypeValues[static_cast<std::size_t>(testClubType_)])}}},
      trace_.nested());
  return nullptr;
}

DeleteTestClubsFunction::DeleteTestClubsFunction(const nlohmann::json& data, FunctionContext& context)
  : context_(context), container_(data),
    trace_(TraceContext::start(kName, container_.getOptionalBool("verbose", false))),
    privateKey_(container_.getString("privateKey")) {}

nlohmann::json DeleteTestClubsFunction::executeFunction(const std::optional<AuthState>& auth) {
  checkPrerequirements(context_, privateKey_, auth, std::nullopt, trace_.nested());
  checkTestingDatabase(context_.config);
  try {
    context_.db.remove(clubComponent(DatabaseType::Testing));
  } catch (const DatabaseError& e) {
    throw internalError("delete test clubs", e);
  }
  return nullptr;
}

} // namespace cft
