#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "test_support.hpp"

using cft::test::FunctionTest;
using cft::test::kPrivateKey;
using nlohmann::json;

namespace {
const std::string kFineId = "637D6187-68D2-4000-9CB8-7DFC3877D5BA";
const std::string kAdminId = "7BB9AB2B-8516-4847-8B5F-1A94B78EC7B7";

json updateProperties(const std::string& timestamp) {
    return {{"timestamp", timestamp}, {"personId", kAdminId}};
}

json updatableFine(const std::string& timestamp, int number = 2) {
    return {
        {"id", kFineId},
        {"personId", "D1852AC0-A0E2-4091-AC7E-CB2C23F708D9"},
        {"date", "2011-10-14T10:42:38+0000"},
        {"number", number},
        {"payedState", {{"state", "unpayed"}}},
        {"fineReason", {{"reasonTemplateId", "9D0681F0-2045-4A1D-ABBC-6BB289934FF9"}}},
        {"updateProperties", updateProperties(timestamp)},
    };
}

json storedFine(const std::string& timestamp, int number = 2) {
    return {
        {"personId", "D1852AC0-A0E2-4091-AC7E-CB2C23F708D9"},
        {"date", "2011-10-14T10:42:38.000Z"},
        {"number", number},
        {"payedState", {{"state", "unpayed"}, {"payDate", nullptr}, {"inApp", nullptr}}},
        {"fineReason", {{"reasonTemplateId", "9D0681F0-2045-4A1D-ABBC-6BB289934FF9"}}},
        {"updateProperties", updateProperties(timestamp)},
    };
}

json deletedFine(const std::string& timestamp) {
    return {{"id", kFineId}, {"deleted", true}, {"updateProperties", updateProperties(timestamp)}};
}
} // namespace

class ChangeFineTest : public FunctionTest {
protected:
    json changeFine(const std::string& changeType, const json& fine) {
        return call("changeFine", {{"privateKey", kPrivateKey},
                                   {"clubId", clubId.guidString()},
                                   {"changeType", changeType},
                                   {"updatableFine", fine}});
    }
};

// ===== updates =====

TEST_F(ChangeFineTest, AddsNewFine) {
    expectSuccess(changeFine("update", updatableFine("2011-10-14T10:42:38.000Z")));
    EXPECT_EQ(stored("fines/" + kFineId), storedFine("2011-10-14T10:42:38.000Z"));

    const auto events = statistics("changeFine");
    ASSERT_EQ(events.size(), 1u);
    json changedState = storedFine("2011-10-14T10:42:38.000Z");
    changedState["id"] = kFineId;
    EXPECT_EQ(events[0], (json{{"previousState", nullptr}, {"changedState", changedState}}));
}

TEST_F(ChangeFineTest, StaleUpdateIsDiscardedSilently) {
    expectSuccess(changeFine("update", updatableFine("2011-10-15T10:42:38.000Z", 3)));
    expectSuccess(changeFine("update", updatableFine("2011-10-14T10:42:38.000Z", 1)));

    EXPECT_EQ(stored("fines/" + kFineId), storedFine("2011-10-15T10:42:38.000Z", 3));
    EXPECT_EQ(statistics("changeFine").size(), 1u);
}

TEST_F(ChangeFineTest, NewerUpdateReplacesAndRecordsPrevious) {
    expectSuccess(changeFine("update", updatableFine("2011-10-14T10:42:38.000Z", 1)));
    expectSuccess(changeFine("update", updatableFine("2011-10-15T10:42:38.000Z", 3)));

    EXPECT_EQ(stored("fines/" + kFineId), storedFine("2011-10-15T10:42:38.000Z", 3));
    const auto events = statistics("changeFine");
    ASSERT_EQ(events.size(), 2u);
    json previousState = storedFine("2011-10-14T10:42:38.000Z", 1);
    previousState["id"] = kFineId;
    EXPECT_EQ(events[1]["previousState"], previousState);
}

// ===== deletes =====

TEST_F(ChangeFineTest, DeleteLeavesTombstone) {
    expectSuccess(changeFine("update", updatableFine("2011-10-14T10:42:38.000Z")));
    expectSuccess(changeFine("delete", deletedFine("2011-10-15T10:42:38.000Z")));
    EXPECT_EQ(stored("fines/" + kFineId),
              (json{{"deleted", true}, {"updateProperties", updateProperties("2011-10-15T10:42:38.000Z")}}));
}

TEST_F(ChangeFineTest, OlderUpdateDoesNotResurrect) {
    expectSuccess(changeFine("delete", deletedFine("2011-10-15T10:42:38.000Z")));
    expectSuccess(changeFine("update", updatableFine("2011-10-14T10:42:38.000Z")));
    EXPECT_EQ(stored("fines/" + kFineId + "/deleted"), json(true));

    expectSuccess(changeFine("update", updatableFine("2011-10-16T10:42:38.000Z")));
    EXPECT_EQ(stored("fines/" + kFineId), storedFine("2011-10-16T10:42:38.000Z"));
}

TEST_F(ChangeFineTest, ChangeTypeMustMatchPayload) {
    expectFailure(changeFine("update", deletedFine("2011-10-15T10:42:38.000Z")), "invalid-argument",
                  "Couldn't parse 'updatableFine', change type 'update' needs a fine, but got a deleted fine.");
    expectFailure(changeFine("delete", updatableFine("2011-10-15T10:42:38.000Z")), "invalid-argument",
                  "Couldn't parse 'updatableFine', change type 'delete' needs a deleted fine, but got a fine.");
    EXPECT_FALSE(stored("fines/" + kFineId).has_value());
}

// ===== rejected calls =====

TEST_F(ChangeFineTest, InvalidChangeType) {
    expectFailure(changeFine("upsert", updatableFine("2011-10-15T10:42:38.000Z")), "invalid-argument",
                  "Couldn't parse ChangeType parameter 'changeType'. Expected values 'update' or 'delete', but "
                  "got 'upsert' from type 'string'.");
}

TEST_F(ChangeFineTest, ParseErrorWritesNothing) {
    json fine = updatableFine("2011-10-15T10:42:38.000Z");
    fine["payedState"] = {{"state", "payed"}};
    expectFailure(changeFine("update", fine), "invalid-argument",
                  "Couldn't parse PayedState parameter 'payDate', expected iso string, but got 'undefined' from "
                  "type undefined");
    EXPECT_FALSE(stored("fines/" + kFineId).has_value());
    EXPECT_TRUE(statistics("changeFine").empty());
}

TEST_F(ChangeFineTest, PrerequirementsChecked) {
    const json data = {{"privateKey", kPrivateKey},
                       {"clubId", clubId.guidString()},
                       {"changeType", "update"},
                       {"updatableFine", updatableFine("2011-10-15T10:42:38.000Z")}};

    json wrongKey = data;
    wrongKey["privateKey"] = "invalid";
    expectFailure(call("changeFine", wrongKey), "permission-denied", "Private key is invalid.");
    expectFailure(call("changeFine", data, std::nullopt), "permission-denied",
                  "The function must be called while authenticated, nobody signed in.");
    expectFailure(call("changeFine", data, std::string("someone-else")), "permission-denied",
                  "The function must be called by a person of the club.");
    EXPECT_FALSE(stored("fines/" + kFineId).has_value());
}

TEST_F(ChangeFineTest, UnknownFunction) {
    expectFailure(call("changeFines", json::object()), "invalid-argument", "Function 'changeFines' doesn't exist.");
}

// ===== persons and reason templates =====

TEST_F(ChangeFineTest, ChangePerson) {
    const std::string personId = "D1852AC0-A0E2-4091-AC7E-CB2C23F708D9";
    expectSuccess(call("changePerson", {{"privateKey", kPrivateKey},
                                        {"clubId", clubId.guidString()},
                                        {"changeType", "update"},
                                        {"updatablePerson",
                                         {{"id", personId},
                                          {"name", {{"first", "Johnny"}}},
                                          {"updateProperties", updateProperties("2011-10-15T10:42:38.000Z")}}}}));
    EXPECT_EQ(stored("persons/" + personId),
              (json{{"name", {{"first", "Johnny"}}},
                    {"updateProperties", updateProperties("2011-10-15T10:42:38.000Z")}}));

    const auto events = statistics("changePerson");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0]["previousState"]["name"], (json{{"first", "John"}, {"last", "Doe"}}));
}

TEST_F(ChangeFineTest, ChangeReasonTemplateTieBreak) {
    const std::string templateId = "9D0681F0-2045-4A1D-ABBC-6BB289934FF9";
    auto change = [&](const std::string& message, const std::string& personId) {
        return call("changeReasonTemplate",
                    {{"privateKey", kPrivateKey},
                     {"clubId", clubId.guidString()},
                     {"changeType", "update"},
                     {"updatableReasonTemplate",
                      {{"id", templateId},
                       {"reasonMessage", message},
                       {"amount", 12.98},
                       {"importance", "low"},
                       {"updateProperties", {{"timestamp", "2011-10-14T10:42:38.000Z"}, {"personId", personId}}}}}});
    };
    // same timestamp, the greater person id wins regardless of arrival order
    expectSuccess(change("from greater", "D1852AC0-A0E2-4091-AC7E-CB2C23F708D9"));
    expectSuccess(change("from smaller", "76025DDE-6893-46D2-BC34-9864BB5B8DAD"));
    EXPECT_EQ(stored("reasonTemplates/" + templateId + "/reasonMessage"), json("from greater"));
    EXPECT_EQ(statistics("changeReasonTemplate").size(), 1u);
}
