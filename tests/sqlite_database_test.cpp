#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "test_support.hpp"

using cft::DatabaseError;
using cft::test::TempDatabase;
using nlohmann::json;

TEST(SqliteDatabase, GetMissingPath) {
    TempDatabase database;
    EXPECT_FALSE(database.db().get("clubs/a").has_value());
    EXPECT_FALSE(database.db().exists("clubs"));
}

TEST(SqliteDatabase, SetAndGetSubtree) {
    TempDatabase database;
    auto& db = database.db();
    const json fine = {{"number", 2},
                       {"amount", 12.98},
                       {"payedState", {{"state", "unpayed"}, {"payDate", nullptr}, {"inApp", nullptr}}},
                       {"tags", json::array({"a", "b"})}};
    db.set("clubs/a/fines/f1", fine);

    EXPECT_EQ(db.get("clubs/a/fines/f1"), fine);
    EXPECT_EQ(db.get("/clubs/a/fines/f1/"), fine);
    EXPECT_EQ(db.get("clubs/a/fines/f1/payedState/state"), json("unpayed"));
    EXPECT_EQ(db.get("clubs/a"), (json{{"fines", {{"f1", fine}}}}));
    EXPECT_EQ(db.get(""), (json{{"clubs", {{"a", {{"fines", {{"f1", fine}}}}}}}}));
}

TEST(SqliteDatabase, SiblingPrefixesStaySeparate) {
    TempDatabase database;
    auto& db = database.db();
    db.set("clubs/a", {{"name", "a"}});
    db.set("clubs/ab", {{"name", "ab"}});
    db.set("clubs/a-b", {{"name", "a-b"}});

    EXPECT_EQ(db.get("clubs/a"), (json{{"name", "a"}}));
    db.remove("clubs/a");
    EXPECT_FALSE(db.get("clubs/a").has_value());
    EXPECT_EQ(db.get("clubs/ab"), (json{{"name", "ab"}}));
    EXPECT_EQ(db.get("clubs/a-b"), (json{{"name", "a-b"}}));
}

static std::vector<std::string> sortedChildKeys(cft::Database& db, const std::string& path) {
    auto keys = db.childKeys(path);
    std::sort(keys.begin(), keys.end());
    return keys;
}

TEST(SqliteDatabase, ChildKeys) {
    TempDatabase database;
    auto& db = database.db();
    db.set("clubs/a", {{"identifier", "a"}, {"fines", {{"f1", {{"number", 1}}}, {"f2", {{"number", 2}}}}}});
    db.set("clubs/a-b", {{"identifier", "a-b"}});
    db.set("clubs/ab/identifier", "ab");
    db.set("clubs/a0", "scalar");
    db.set("testableClubs/t", {{"identifier", "t"}});

    EXPECT_EQ(sortedChildKeys(db, "clubs"), (std::vector<std::string>{"a", "a-b", "a0", "ab"}));
    EXPECT_EQ(sortedChildKeys(db, "/clubs/"), (std::vector<std::string>{"a", "a-b", "a0", "ab"}));
    EXPECT_EQ(sortedChildKeys(db, "clubs/a"), (std::vector<std::string>{"fines", "identifier"}));
    EXPECT_EQ(sortedChildKeys(db, ""), (std::vector<std::string>{"clubs", "testableClubs"}));
}

TEST(SqliteDatabase, ChildKeysOfLeafOrMissingPath) {
    TempDatabase database;
    auto& db = database.db();
    EXPECT_TRUE(db.childKeys("").empty());
    db.set("clubs/a", {{"identifier", "a"}});
    EXPECT_TRUE(db.childKeys("clubs/a/identifier").empty());
    EXPECT_TRUE(db.childKeys("clubs/b").empty());
    EXPECT_TRUE(db.childKeys("club").empty());
}

TEST(SqliteDatabase, SetReplacesWholeSubtree) {
    TempDatabase database;
    auto& db = database.db();
    db.set("clubs/a/persons/p", {{"name", {{"first", "John"}, {"last", "Doe"}}}, {"signInData", {{"admin", true}}}});
    db.set("clubs/a/persons/p", {{"name", {{"first", "John"}}}});
    EXPECT_EQ(db.get("clubs/a/persons/p"), (json{{"name", {{"first", "John"}}}}));
}

TEST(SqliteDatabase, SetBelowScalarReplacesIt) {
    TempDatabase database;
    auto& db = database.db();
    db.set("clubs/a/name", "old");
    db.set("clubs/a/name/first", "new");
    EXPECT_EQ(db.get("clubs/a"), (json{{"name", {{"first", "new"}}}}));
}

TEST(SqliteDatabase, NullAndEmptyObjectRemove) {
    TempDatabase database;
    auto& db = database.db();
    db.set("clubs/a/name", "club");
    db.set("clubs/a/name", nullptr);
    EXPECT_FALSE(db.exists("clubs/a"));

    db.set("clubs/b", json::object());
    EXPECT_FALSE(db.exists("clubs/b"));
}

TEST(SqliteDatabase, InvalidKeysAreRejected) {
    TempDatabase database;
    auto& db = database.db();
    EXPECT_THROW(db.set("clubs/a", {{"with/slash", 1}}), DatabaseError);
    EXPECT_THROW(db.set("clubs/a", {{"", 1}}), DatabaseError);
    EXPECT_THROW(db.set("clubs//a", 1), DatabaseError);
    EXPECT_THROW(db.set("", 1), DatabaseError);
    // nothing half-written
    EXPECT_FALSE(db.exists("clubs"));
}

TEST(SqliteDatabase, TransactionRollsBack) {
    TempDatabase database;
    auto& db = database.db();
    db.set("clubs/a/name", "before");

    EXPECT_THROW(db.runTransaction([&] {
                     db.set("clubs/a/name", "after");
                     db.set("clubs/b/name", "new");
                     throw std::runtime_error("abort");
                 }),
                 std::runtime_error);

    EXPECT_EQ(db.get("clubs/a/name"), json("before"));
    EXPECT_FALSE(db.exists("clubs/b"));
}

TEST(SqliteDatabase, NestedTransactionJoinsOuter) {
    TempDatabase database;
    auto& db = database.db();
    db.runTransaction([&] {
        db.set("clubs/a/name", "a");
        db.runTransaction([&] { db.set("clubs/b/name", "b"); });
        EXPECT_EQ(db.get("clubs/b/name"), json("b"));
    });
    EXPECT_EQ(db.get("clubs"), (json{{"a", {{"name", "a"}}}, {"b", {{"name", "b"}}}}));

    EXPECT_THROW(db.runTransaction([&] {
                     db.set("clubs/c/name", "c");
                     db.runTransaction([&] { throw std::runtime_error("inner"); });
                 }),
                 std::runtime_error);
    EXPECT_FALSE(db.exists("clubs/c"));
}

TEST(SqliteDatabase, PersistsAcrossConnections) {
    TempDatabase database;
    database.db().set("clubs/a/name", "club");
    cft::SqliteDatabase second(database.path());
    EXPECT_EQ(second.get("clubs/a"), (json{{"name", "club"}}));
}

TEST(SqliteDatabase, InitIsIdempotent) {
    TempDatabase database;
    database.db().set("clubs/a/name", "club");
    EXPECT_FALSE(cft::initDatabase(database.path(), CFT_SCHEMA_PATH));
    EXPECT_EQ(database.db().get("clubs/a/name"), json("club"));
}

TEST(SqliteDatabase, InitRejectsMissingSchema) {
    const auto path = std::filesystem::temp_directory_path() /
                      ("cft_test_" + cft::Guid::newGuid().guidString() + ".db");
    EXPECT_THROW(cft::initDatabase(path.string(), "does-not-exist.sql"), DatabaseError);
    std::error_code ec;
    for (const char* suffix : {"", "-wal", "-shm"}) std::filesystem::remove(path.string() + suffix, ec);
}
