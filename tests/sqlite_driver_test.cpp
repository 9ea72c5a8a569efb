#include <gtest/gtest.h>
#include <sqlite3.h>

#include <chrono>
#include <memory>
#include <string>

#include "cppquery_sqldriver/sql_driver_registry.h"
#include "cppquery_sqldriver/sql_result.h"
#include "cppquery_sqldriver/sqlite/sqlite_driver.h"
#include "cppquery_sqldriver/sqlite/sqlite_driver_helper.h"

using namespace cppquery_sqldriver;

TEST(SqlDriverRegistryTest, BuiltinSqliteIsCaseInsensitive) {
    auto registry = SqlDriverRegistry::createWithBuiltinDrivers();
    ASSERT_NE(registry, nullptr);
    EXPECT_TRUE(registry->isDriverAvailable("sqlite"));
    EXPECT_TRUE(registry->isDriverAvailable("SQLite"));
    EXPECT_FALSE(registry->isDriverAvailable("MYSQL"));
    auto driver = registry->createDriver("sqlite");
    ASSERT_NE(driver, nullptr);
    EXPECT_EQ(driver->driverName(), "SQLITE");
    EXPECT_EQ(registry->createDriver("oracle"), nullptr);
}

TEST(SqlDriverRegistryTest, RegistrationRules) {
    SqlDriverRegistry registry;
    EXPECT_TRUE(SqliteDriver_Register(registry));
    EXPECT_FALSE(SqliteDriver_Register(registry));
    EXPECT_FALSE(registry.registerDriver("", []() { return std::make_unique<SqliteDriver>(); }));
    EXPECT_FALSE(registry.registerDriver("other", nullptr));
    ASSERT_EQ(registry.drivers().size(), 1u);
    EXPECT_TRUE(registry.unregisterDriver("Sqlite"));
    EXPECT_FALSE(registry.unregisterDriver("sqlite"));
    EXPECT_TRUE(registry.drivers().empty());
}

TEST(SqliteHelperTest, ConstraintNameExtraction) {
    EXPECT_EQ(sqlite_helper::extractConstraintName("UNIQUE constraint failed: users.email"), "users.email");
    EXPECT_EQ(sqlite_helper::extractConstraintName("UNIQUE constraint failed: t.a, t.b"), "t.a, t.b");
    EXPECT_EQ(sqlite_helper::extractConstraintName("FOREIGN KEY constraint failed"), "");
}

TEST(SqliteHelperTest, ResultCodeCategories) {
    EXPECT_EQ(sqlite_helper::categoryForResultCode(SQLITE_CONSTRAINT_UNIQUE, ""), ErrorCategory::Constraint);
    EXPECT_EQ(sqlite_helper::categoryForResultCode(SQLITE_BUSY, "database is locked"), ErrorCategory::LockTimeout);
    EXPECT_EQ(sqlite_helper::categoryForResultCode(SQLITE_INTERRUPT, "interrupted"), ErrorCategory::OperationCancelled);
    EXPECT_EQ(sqlite_helper::categoryForResultCode(SQLITE_READONLY, ""), ErrorCategory::Permissions);
    EXPECT_EQ(sqlite_helper::categoryForResultCode(SQLITE_ERROR, "no such table: t"), ErrorCategory::Syntax);
    EXPECT_EQ(sqlite_helper::categoryForResultCode(SQLITE_ERROR, "cannot start a transaction within a transaction"), ErrorCategory::Transaction);
    EXPECT_EQ(sqlite_helper::categoryForResultCode(SQLITE_DONE, ""), ErrorCategory::NoError);
}

TEST(SqliteHelperTest, IdentifierQuoting) {
    EXPECT_EQ(sqlite_helper::quoteIdentifier("users"), "\"users\"");
    EXPECT_EQ(sqlite_helper::quoteIdentifier("we\"ird"), "\"we\"\"ird\"");
    EXPECT_EQ(sqlite_helper::isolationBeginStatement(TransactionIsolationLevel::Serializable), "BEGIN IMMEDIATE TRANSACTION");
    EXPECT_EQ(sqlite_helper::isolationBeginStatement(TransactionIsolationLevel::Default), "BEGIN");
}

class SqliteDriverTest : public ::testing::Test {
  protected:
    void SetUp() override {
        ConnectionParameters params;
        params.setDbName(":memory:");
        params.addSessionSetting("foreign_keys", "ON");
        ASSERT_TRUE(driver_.open(params)) << driver_.lastError().text();
        run("CREATE TABLE items (id INTEGER PRIMARY KEY, name TEXT NOT NULL UNIQUE, price REAL, data BLOB)");
    }

    void run(const std::string& sql) {
        auto result = driver_.createResult();
        ASSERT_TRUE(result->prepare(sql)) << result->error().text();
        ASSERT_TRUE(result->exec()) << result->error().text();
        result->finish();
    }

    SqliteDriver driver_;
};

TEST_F(SqliteDriverTest, OpenTwiceFails) {
    ConnectionParameters params;
    params.setDbName(":memory:");
    EXPECT_FALSE(driver_.open(params));
    EXPECT_EQ(driver_.lastError().category(), ErrorCategory::Connectivity);
    EXPECT_TRUE(driver_.isOpen());
}

TEST_F(SqliteDriverTest, BindAndFetchEveryStorageClass) {
    auto insert = driver_.createResult();
    ASSERT_TRUE(insert->prepare("INSERT INTO items (name, price, data) VALUES (?, ?, ?)"));
    insert->addPositionalBindValue(SqlValue("lamp"));
    insert->addPositionalBindValue(SqlValue(12.5));
    insert->addPositionalBindValue(SqlValue(SqlValue::Bytes{0x00, 0xff, 0x10}));
    ASSERT_TRUE(insert->exec()) << insert->error().text();
    EXPECT_EQ(insert->numRowsAffected(), 1);
    EXPECT_EQ(insert->lastInsertId(), SqlValue(1LL));
    EXPECT_FALSE(insert->isSelect());

    insert->clearBindValues();
    insert->addPositionalBindValue(SqlValue("empty"));
    insert->addPositionalBindValue(SqlValue());
    insert->addPositionalBindValue(SqlValue());
    ASSERT_TRUE(insert->exec()) << insert->error().text();
    insert->finish();

    auto select = driver_.createResult();
    ASSERT_TRUE(select->prepare("SELECT id, name, price, data, price * 2 AS doubled FROM items ORDER BY id"));
    ASSERT_TRUE(select->exec());
    EXPECT_TRUE(select->isSelect());
    SqlRecord meta = select->recordMetadata();
    ASSERT_EQ(meta.count(), 5);
    EXPECT_EQ(meta.field(1).databaseTypeName(), "TEXT");
    EXPECT_EQ(meta.field(4).databaseTypeName(), "");

    SqlRecord row;
    ASSERT_TRUE(select->fetchNext(row));
    EXPECT_EQ(row.value("id"), SqlValue(1LL));
    EXPECT_EQ(row.value("name"), SqlValue("lamp"));
    EXPECT_EQ(row.value("price"), SqlValue(12.5));
    EXPECT_EQ(row.value("data"), SqlValue(SqlValue::Bytes{0x00, 0xff, 0x10}));
    EXPECT_EQ(row.value("doubled"), SqlValue(25.0));

    ASSERT_TRUE(select->fetchNext(row));
    EXPECT_TRUE(row.isNull("price"));
    EXPECT_TRUE(row.isNull("data"));
    EXPECT_FALSE(select->fetchNext(row));
    EXPECT_FALSE(select->error().isValid());
}

TEST_F(SqliteDriverTest, BoolBindsAsInteger) {
    auto insert = driver_.createResult();
    ASSERT_TRUE(insert->prepare("SELECT ? AS flag, typeof(?) AS kind"));
    insert->addPositionalBindValue(SqlValue(true));
    insert->addPositionalBindValue(SqlValue(false));
    ASSERT_TRUE(insert->exec());
    SqlRecord row;
    ASSERT_TRUE(insert->fetchNext(row));
    EXPECT_EQ(row.value("flag"), SqlValue(1LL));
    EXPECT_EQ(row.value("kind"), SqlValue("integer"));
}

TEST_F(SqliteDriverTest, ParameterCountMismatch) {
    auto result = driver_.createResult();
    ASSERT_TRUE(result->prepare("SELECT * FROM items WHERE id = ?"));
    EXPECT_FALSE(result->exec());
    EXPECT_EQ(result->error().category(), ErrorCategory::DataRelated);
}

TEST_F(SqliteDriverTest, RejectsMultipleStatements) {
    auto result = driver_.createResult();
    EXPECT_FALSE(result->prepare("SELECT 1; DROP TABLE items"));
    EXPECT_EQ(result->error().category(), ErrorCategory::Syntax);
    EXPECT_TRUE(result->prepare("SELECT 1;  "));
}

TEST_F(SqliteDriverTest, SyntaxErrorKeepsQuery) {
    auto result = driver_.createResult();
    EXPECT_FALSE(result->prepare("SELEC 1"));
    EXPECT_EQ(result->error().category(), ErrorCategory::Syntax);
    EXPECT_EQ(result->error().failedQuery(), "SELEC 1");
}

TEST_F(SqliteDriverTest, UniqueViolationCarriesConstraint) {
    run("INSERT INTO items (name) VALUES ('lamp')");
    auto result = driver_.createResult();
    ASSERT_TRUE(result->prepare("INSERT INTO items (name) VALUES ('lamp')"));
    EXPECT_FALSE(result->exec());
    SqlError error = result->error();
    EXPECT_EQ(error.category(), ErrorCategory::Constraint);
    EXPECT_EQ(error.constraintName(), "items.name");
    EXPECT_EQ(error.resultCode(), SQLITE_CONSTRAINT_UNIQUE);
    EXPECT_EQ(error.primaryResultCode(), SQLITE_CONSTRAINT);
    EXPECT_FALSE(error.isRetryable());
    EXPECT_EQ(error.context(), "step");
    EXPECT_EQ(error.describe().rfind("[Constraint] step: ", 0), 0u);
}

TEST_F(SqliteDriverTest, SavepointsNestInsideTransaction) {
    EXPECT_FALSE(driver_.isInTransaction());
    ASSERT_TRUE(driver_.beginTransaction());
    EXPECT_TRUE(driver_.isInTransaction());
    run("INSERT INTO items (name) VALUES ('outer')");
    ASSERT_TRUE(driver_.setSavepoint("sp_1"));
    run("INSERT INTO items (name) VALUES ('inner')");
    ASSERT_TRUE(driver_.rollbackToSavepoint("sp_1"));
    ASSERT_TRUE(driver_.releaseSavepoint("sp_1"));
    ASSERT_TRUE(driver_.commitTransaction());
    EXPECT_FALSE(driver_.isInTransaction());

    auto count = driver_.createResult();
    ASSERT_TRUE(count->prepare("SELECT name FROM items"));
    ASSERT_TRUE(count->exec());
    SqlRecord row;
    ASSERT_TRUE(count->fetchNext(row));
    EXPECT_EQ(row.value(0), SqlValue("outer"));
    EXPECT_FALSE(count->fetchNext(row));
}

TEST_F(SqliteDriverTest, CommitWithoutTransactionFails) {
    EXPECT_FALSE(driver_.commitTransaction());
    EXPECT_TRUE(driver_.lastError().isValid());
}

TEST_F(SqliteDriverTest, UnsupportedIsolationLevel) {
    EXPECT_TRUE(driver_.setTransactionIsolationLevel(TransactionIsolationLevel::Serializable));
    EXPECT_EQ(driver_.transactionIsolationLevel(), TransactionIsolationLevel::Serializable);
    EXPECT_FALSE(driver_.setTransactionIsolationLevel(TransactionIsolationLevel::RepeatableRead));
    EXPECT_EQ(driver_.lastError().category(), ErrorCategory::FeatureNotSupported);
    EXPECT_EQ(driver_.transactionIsolationLevel(), TransactionIsolationLevel::Serializable);
}

TEST_F(SqliteDriverTest, QueryTimeoutInterruptsLongStatement) {
    auto result = driver_.createResult();
    ASSERT_TRUE(result->prepare("WITH RECURSIVE c(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM c) SELECT count(*) FROM c"));
    ASSERT_TRUE(result->setQueryTimeout(std::chrono::milliseconds(50)));
    EXPECT_FALSE(result->exec());
    EXPECT_EQ(result->error().category(), ErrorCategory::OperationTimedOut);

    // 超时后连接仍可使用
    run("INSERT INTO items (name) VALUES ('after')");
}

TEST_F(SqliteDriverTest, ClosedDriverReportsConnectivity) {
    driver_.close();
    EXPECT_FALSE(driver_.isOpen());
    EXPECT_FALSE(driver_.beginTransaction());
    EXPECT_EQ(driver_.lastError().category(), ErrorCategory::Connectivity);
    auto result = driver_.createResult();
    EXPECT_FALSE(result->prepare("SELECT 1"));
    EXPECT_EQ(result->error().category(), ErrorCategory::Connectivity);
}

TEST(SqliteDriverOpenTest, UnsafeSessionSettingIsRejected) {
    SqliteDriver driver;
    ConnectionParameters params;
    params.setDbName(":memory:");
    params.addSessionSetting("foreign_keys = ON; DROP TABLE x; --", "ON");
    EXPECT_FALSE(driver.open(params));
    EXPECT_FALSE(driver.isOpen());
    EXPECT_EQ(driver.lastError().category(), ErrorCategory::DriverInternal);
}

TEST(SqliteDriverOpenTest, MissingFileReadOnly) {
    SqliteDriver driver;
    ConnectionParameters params;
    params.setDbName("/nonexistent-dir/cppquery-missing.db");
    params.setReadOnly(true);
    params.setCreateIfMissing(false);
    EXPECT_FALSE(driver.open(params));
    EXPECT_EQ(driver.lastError().category(), ErrorCategory::Connectivity);
}

TEST(SqliteDriverOpenTest, FeaturesAndVersion) {
    SqliteDriver driver;
    EXPECT_TRUE(driver.hasFeature(DriverFeature::NamedSavepoints));
    EXPECT_TRUE(driver.hasFeature(DriverFeature::QueryTimeout));
    EXPECT_EQ(driver.engineVersion(), std::string(sqlite3_libversion()));
    EXPECT_EQ(driver.quoteIdentifier("a\"b"), "\"a\"\"b\"");
}
