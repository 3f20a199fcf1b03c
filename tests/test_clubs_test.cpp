#include <set>
#include <string>
#include <variant>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "core/model/Fine.hpp"
#include "core/model/Person.hpp"
#include "core/model/ReasonTemplate.hpp"
#include "core/updatable/Updatable.hpp"
#include "test_support.hpp"

using cft::Guid;
using cft::Updatable;
using cft::test::FunctionTest;
using cft::test::kPrivateKey;
using nlohmann::json;

namespace {
const cft::TraceContext trace = cft::TraceContext::start("testClubsTest", false);

// Parses every entity of a club and checks that fines only refer to existing entities.
void expectConsistentClub(const json& club) {
    std::set<std::string> persons, templates;
    for (const auto& [id, value] : club.at("persons").items()) {
        const auto person = Updatable<cft::Person>::fromStored(Guid::fromString(id), value, trace);
        ASSERT_FALSE(person.isDeleted());
        persons.insert(person.id().guidString());
    }
    for (const auto& [id, value] : club.at("reasonTemplates").items()) {
        const auto reasonTemplate = Updatable<cft::ReasonTemplate>::fromStored(Guid::fromString(id), value, trace);
        templates.insert(reasonTemplate.id().guidString());
    }
    for (const auto& [id, value] : club.at("fines").items()) {
        const auto fine = Updatable<cft::Fine>::fromStored(Guid::fromString(id), value, trace);
        EXPECT_EQ(persons.count(fine.active()->person_id.guidString()), 1u) << id;
        if (const auto* reference = std::get_if<cft::FineReasonTemplate>(&fine.active()->fine_reason.value))
            EXPECT_EQ(templates.count(reference->reason_template_id.guidString()), 1u) << id;
    }
    for (const auto& [userId, personId] : club.at("personUserIds").items())
        EXPECT_EQ(persons.count(personId.get<std::string>()), 1u) << userId;
}
} // namespace

// ===== fixtures =====

TEST(TestClubs, DefaultClubIsConsistent) {
    const json club = cft::defaultTestClub();
    expectConsistentClub(club);
    EXPECT_EQ(club["personUserIds"][std::string(cft::kTestUserId)], json("7BB9AB2B-8516-4847-8B5F-1A94B78EC7B7"));
    EXPECT_EQ(club["persons"].size(), 3u);
    EXPECT_EQ(club["reasonTemplates"].size(), 3u);
    EXPECT_EQ(club["fines"].size(), 3u);
}

TEST(TestClubs, FakeDataIsDeterministicPerClubId) {
    const Guid clubId = Guid::fromString("1992AF26-8B42-4452-A564-7E376B6401DB");
    const Guid otherId = Guid::fromString("7BB9AB2B-8516-4847-8B5F-1A94B78EC7B7");
    EXPECT_EQ(cft::fakeDataTestClub(clubId), cft::fakeDataTestClub(clubId));
    EXPECT_NE(cft::fakeDataTestClub(clubId), cft::fakeDataTestClub(otherId));
}

TEST(TestClubs, FakeDataIsConsistent) {
    for (const char* id : {"1992AF26-8B42-4452-A564-7E376B6401DB", "637D6187-68D2-4000-9CB8-7DFC3877D5BA"}) {
        const json club = cft::fakeDataTestClub(Guid::fromString(id));
        expectConsistentClub(club);
        EXPECT_GE(club["persons"].size(), 3u);
        EXPECT_GE(club["fines"].size(), 5u);
    }
}

// ===== functions =====

class TestClubFunctionsTest : public FunctionTest {
protected:
    json newTestClub(const Guid& id, const std::string& type) {
        return call("newTestClub", {{"privateKey", kPrivateKey}, {"clubId", id.guidString()}, {"testClubType", type}});
    }

    // Stored club without its statistics.
    json storedClub(const Guid& id) {
        auto club = database_.db().get("testableClubs/" + id.guidString());
        if (!club) return nullptr;
        club->erase("statistics");
        return *club;
    }
};

TEST_F(TestClubFunctionsTest, NewTestClubStoresDefaultFixture) {
    EXPECT_EQ(storedClub(clubId), cft::defaultTestClub());
    EXPECT_EQ(statistics("newTestClub"), (std::vector<json>{json{{"testClubType", "default"}}}));
}

TEST_F(TestClubFunctionsTest, NewTestClubStoresFakeData) {
    const Guid fakeId = Guid::fromString("637D6187-68D2-4000-9CB8-7DFC3877D5BA");
    expectSuccess(newTestClub(fakeId, "fakeData"));
    EXPECT_EQ(storedClub(fakeId), cft::fakeDataTestClub(fakeId));
}

TEST_F(TestClubFunctionsTest, NewTestClubReplacesExistingClub) {
    database_.db().set(clubPath() + "/fines/637D6187-68D2-4000-9CB8-7DFC3877D5BA/number", 7);
    expectSuccess(newTestClub(clubId, "default"));
    EXPECT_EQ(storedClub(clubId), cft::defaultTestClub());
}

TEST_F(TestClubFunctionsTest, InvalidTestClubType) {
    expectFailure(newTestClub(clubId, "other"), "invalid-argument",
                  "Couldn't parse TestClubType parameter 'testClubType'. Expected values 'default' or 'fakeData', "
                  "but got 'other' from type 'string'.");
}

TEST_F(TestClubFunctionsTest, DeleteTestClubsKeepsProductionClubs) {
    database_.db().set("clubs/1992AF26-8B42-4452-A564-7E376B6401DB/name", "Production");
    expectSuccess(call("deleteTestClubs", {{"privateKey", kPrivateKey}}));
    EXPECT_FALSE(database_.db().exists("testableClubs"));
    EXPECT_EQ(database_.db().get("clubs/1992AF26-8B42-4452-A564-7E376B6401DB/name"), json("Production"));
}

TEST(TestClubFunctions, OnlyInTestingDatabase) {
    cft::test::TempDatabase database;
    cft::FunctionDispatcher dispatcher(cft::test::testingConfig(database.path(), cft::DatabaseType::Production),
                                       database.db());
    cft::addDefaultFunctions(dispatcher);
    const cft::AuthState auth{std::string(cft::kTestUserId)};

    const json created = dispatcher.call(
        "newTestClub",
        {{"privateKey", kPrivateKey}, {"clubId", "1992AF26-8B42-4452-A564-7E376B6401DB"}, {"testClubType", "default"}},
        auth);
    EXPECT_EQ(created, (json{{"error", {{"code", "permission-denied"},
                                        {"message", "Test clubs only exist in the testing database."}}}}));
    EXPECT_FALSE(database.db().exists("clubs"));

    const json deleted = dispatcher.call("deleteTestClubs", {{"privateKey", kPrivateKey}}, auth);
    EXPECT_EQ(deleted["error"]["code"], json("permission-denied"));
}
