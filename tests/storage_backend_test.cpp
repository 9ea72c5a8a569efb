#include <gtest/gtest.h>

#include <QFile>
#include <QJsonArray>
#include <QJsonObject>
#include <QTemporaryDir>
#include <QTimeZone>
#include <atomic>
#include <chrono>
#include <thread>

#include "cppquery/backend/storage_backend.h"
#include "cppquery/expression/expression_builders.h"
#include "cppquery/query/active_query.h"
#include "cppquery/query/dml_query.h"
#include "test_support.h"

using namespace cppquery;
using cppquery_sqldriver::SqlValue;

namespace {

    // 没有超时或取消时永远不会结束
    const char* kEndlessQuery = "WITH RECURSIVE c(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM c) SELECT count(*) FROM c";

}  // namespace

TEST(StorageBackendCreateTest, UnknownDriver) {
    auto drivers = cppquery_sqldriver::SqlDriverRegistry::createWithBuiltinDrivers();
    ASSERT_NE(drivers, nullptr);
    BackendConfig config = test::memoryConfig();
    config.driver_type = "ORACLE";
    auto backend = StorageBackend::create(config, nullptr, *drivers);
    ASSERT_FALSE(backend.has_value());
    EXPECT_EQ(backend.error().code, ErrorCode::DriverNotFound);
    EXPECT_EQ(backend.error().kind(), ErrorKind::Connection);
}

TEST(StorageBackendCreateTest, InvalidConfiguration) {
    auto drivers = cppquery_sqldriver::SqlDriverRegistry::createWithBuiltinDrivers();
    ASSERT_NE(drivers, nullptr);
    BackendConfig config = test::memoryConfig();
    config.lock_wait_timeout_s = -3;
    auto backend = StorageBackend::create(config, nullptr, *drivers);
    ASSERT_FALSE(backend.has_value());
    EXPECT_EQ(backend.error().code, ErrorCode::InvalidConfiguration);
}

TEST(StorageBackendCreateTest, DialectFollowsLibraryOrOverride) {
    auto drivers = cppquery_sqldriver::SqlDriverRegistry::createWithBuiltinDrivers();
    ASSERT_NE(drivers, nullptr);
    auto detected = StorageBackend::create(test::memoryConfig(), nullptr, *drivers);
    ASSERT_TRUE(detected.has_value()) << detected.error().toString();
    EXPECT_EQ((*detected)->dialect()->name(), "sqlite");
    EXPECT_EQ((*detected)->dialect()->version().toString(), DialectVersion::parse((*detected)->serverVersion())->toString());
    EXPECT_FALSE((*detected)->isConnected());

    BackendConfig pinned = test::memoryConfig();
    pinned.dialect_version = DialectVersion{3, 20, 0};
    auto old = StorageBackend::create(pinned, nullptr, *drivers);
    ASSERT_TRUE(old.has_value());
    EXPECT_FALSE((*old)->dialect()->supports(DialectFeature::WindowFunctions));
    EXPECT_TRUE((*old)->dialect()->supports(DialectFeature::Cte));
}

class StorageBackendTest : public test::SqliteBackendTest {};

TEST_F(StorageBackendTest, ConnectionLifecycle) {
    auto again = backend_->connect();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::ConnectionAlreadyOpen);

    ASSERT_TRUE(backend_->disconnect().has_value());
    EXPECT_FALSE(backend_->isConnected());
    EXPECT_TRUE(backend_->disconnect().has_value());

    auto closed = backend_->execute("SELECT 1");
    ASSERT_FALSE(closed.has_value());
    EXPECT_EQ(closed.error().code, ErrorCode::ConnectionNotOpen);
    EXPECT_EQ(closed.error().dialect, "sqlite");

    ASSERT_TRUE(backend_->connect().has_value());
    EXPECT_TRUE(backend_->execute("SELECT 1").has_value());
}

TEST_F(StorageBackendTest, PragmasAreApplied) {
    auto fk = backend_->execute("PRAGMA foreign_keys");
    ASSERT_TRUE(fk.has_value()) << fk.error().toString();
    ASSERT_EQ(fk->rows.size(), 1u);
    EXPECT_EQ(fk->rows[0][0], Value(1LL));
}

TEST_F(StorageBackendTest, BooleanRoundTripsAsInteger) {
    exec("CREATE TABLE flags (id INTEGER PRIMARY KEY, flag BOOLEAN NOT NULL)");
    InsertQuery insert(backend_.get(), "flags");
    insert.Set("flag", lit(true));
    auto inserted = insert.Execute();
    ASSERT_TRUE(inserted.has_value()) << inserted.error().toString();

    auto stored = backend_->execute("SELECT typeof(flag) AS storage, flag + 0 AS raw FROM flags");
    ASSERT_TRUE(stored.has_value()) << stored.error().toString();
    ASSERT_EQ(stored->rows.size(), 1u);
    EXPECT_EQ(stored->rows[0].get<std::string>("storage"), std::optional<std::string>("integer"));
    EXPECT_EQ(stored->rows[0].get<long long>("raw"), std::optional<long long>(1));

    ActiveQuery read(backend_.get(), "flags");
    read.Select({col("flag")});
    auto rows = read.All();
    ASSERT_TRUE(rows.has_value()) << rows.error().toString();
    ASSERT_EQ(rows->size(), 1u);
    const Value& flag = (*rows)[0][0];
    ASSERT_TRUE(std::holds_alternative<bool>(flag)) << valueToDebugString(flag);
    EXPECT_TRUE(std::get<bool>(flag));
    EXPECT_FALSE((*rows)[0].get<long long>("flag").has_value());
    EXPECT_FALSE((*rows)[0].get<std::string>("flag").has_value());
}

TEST_F(StorageBackendTest, ColumnTypeHintOverridesDeclaredType) {
    exec("CREATE TABLE legacy (active INTEGER)");
    exec("INSERT INTO legacy VALUES (0)");
    ActiveQuery q(backend_.get(), "legacy");
    q.ColumnTypes({{"active", LogicalType::Boolean}});
    auto row = q.One();
    ASSERT_TRUE(row.has_value()) << row.error().toString();
    ASSERT_TRUE(row->has_value());
    EXPECT_EQ((*row)->get<bool>("active"), std::optional<bool>(false));
}

TEST_F(StorageBackendTest, BadStoredValueIsTypeConversionError) {
    exec("CREATE TABLE flags (flag BOOLEAN)");
    exec("INSERT INTO flags VALUES ('maybe')");
    auto rows = backend_->execute("SELECT flag FROM flags");
    ASSERT_FALSE(rows.has_value());
    EXPECT_EQ(rows.error().code, ErrorCode::TypeConversionError);
    EXPECT_EQ(rows.error().kind(), ErrorKind::TypeConversion);
    EXPECT_NE(rows.error().message.find("flag"), std::string::npos) << rows.error().message;
}

TEST_F(StorageBackendTest, TemporalAndJsonColumnsDecode) {
    exec("CREATE TABLE events (at TIMESTAMP, payload JSON)");
    const QDateTime at(QDate(2024, 2, 29), QTime(12, 30, 0, 125), QTimeZone::utc());
    QJsonObject payload;
    payload.insert("tags", QJsonArray{"a", "b"});

    InsertQuery insert(backend_.get(), "events");
    insert.Set("at", lit(Value(at))).Set("payload", lit(Value(QJsonDocument(payload))));
    auto inserted = insert.Execute();
    ASSERT_TRUE(inserted.has_value()) << inserted.error().toString();

    auto rows = backend_->execute("SELECT at, payload FROM events");
    ASSERT_TRUE(rows.has_value()) << rows.error().toString();
    ASSERT_EQ(rows->rows.size(), 1u);
    EXPECT_EQ(rows->rows[0].get<QDateTime>("at"), std::optional<QDateTime>(at));
    EXPECT_EQ(rows->rows[0].get<QJsonDocument>("payload"), std::optional<QJsonDocument>(QJsonDocument(payload)));
}

TEST_F(StorageBackendTest, DecimalRoundTripsThroughNumericAffinity) {
    exec("CREATE TABLE prices (id INTEGER PRIMARY KEY, amount DECIMAL(10,2), exact TEXT)");
    const Decimal amount = *Decimal::fromString("-12.50");
    const Decimal wide = *Decimal::fromString("12345678901234567890.000000001");
    InsertQuery insert(backend_.get(), "prices");
    insert.Set("amount", lit(Value(amount))).Set("exact", lit(Value(wide)));
    auto inserted = insert.Execute();
    ASSERT_TRUE(inserted.has_value()) << inserted.error().toString();

    auto storage = backend_->execute("SELECT typeof(amount) AS storage FROM prices");
    ASSERT_TRUE(storage.has_value()) << storage.error().toString();
    EXPECT_EQ(storage->rows[0].get<std::string>("storage"), std::optional<std::string>("real"));

    ActiveQuery read(backend_.get(), "prices");
    read.Select({col("amount"), col("exact")});
    read.ColumnTypes({{"exact", LogicalType::Decimal}});
    auto rows = read.All();
    ASSERT_TRUE(rows.has_value()) << rows.error().toString();
    ASSERT_EQ(rows->size(), 1u);
    EXPECT_EQ((*rows)[0].get<Decimal>("amount"), std::optional<Decimal>(amount));
    ASSERT_TRUE((*rows)[0].get<Decimal>("exact").has_value());
    EXPECT_EQ((*rows)[0].get<Decimal>("exact")->toString(), wide.toString());
}

TEST_F(StorageBackendTest, SyntaxErrorIsPreparationError) {
    auto result = backend_->execute("SELEC 1");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::StatementPreparationError);
    EXPECT_EQ(result.error().kind(), ErrorKind::Execution);
    EXPECT_EQ(result.error().failed_query, "SELEC 1");
    EXPECT_EQ(result.error().dialect, "sqlite");
}

TEST_F(StorageBackendTest, ForeignKeyViolation) {
    exec("CREATE TABLE teams (id INTEGER PRIMARY KEY)");
    exec("CREATE TABLE members (id INTEGER PRIMARY KEY, team_id INTEGER REFERENCES teams(id))");
    auto result = backend_->execute("INSERT INTO members (team_id) VALUES (?)", {SqlValue(42LL)});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConstraintViolation);
    EXPECT_NE(result.error().native_db_error_code, 0);
}

TEST_F(StorageBackendTest, TransactionControlMustUseApi) {
    for (const char* sql : {"BEGIN", "COMMIT", "SAVEPOINT x", "rollback"}) {
        auto result = backend_->execute(sql);
        ASSERT_FALSE(result.has_value()) << sql;
        EXPECT_EQ(result.error().code, ErrorCode::TransactionError) << sql;
        EXPECT_EQ(result.error().failed_query, sql);
    }
    EXPECT_FALSE(backend_->inTransaction());
}

TEST_F(StorageBackendTest, DdlInsideTransactionNeedsOptIn) {
    ASSERT_TRUE(backend_->beginTransaction().has_value());
    auto refused = backend_->execute("CREATE TABLE t (a INTEGER)");
    ASSERT_FALSE(refused.has_value());
    EXPECT_EQ(refused.error().code, ErrorCode::TransactionError);

    ExecutionOptions options;
    options.allow_ddl_in_transaction = true;
    auto allowed = backend_->execute("CREATE TABLE t (a INTEGER)", {}, options);
    ASSERT_TRUE(allowed.has_value()) << allowed.error().toString();
    EXPECT_EQ(allowed->kind, StatementKind::DDL);
    ASSERT_TRUE(backend_->rollback().has_value());

    auto gone = backend_->execute("SELECT * FROM t");
    ASSERT_FALSE(gone.has_value());
    EXPECT_EQ(gone.error().code, ErrorCode::StatementPreparationError);
}

TEST_F(StorageBackendTest, ExecuteManySumsAffectedRows) {
    exec("CREATE TABLE items (id INTEGER PRIMARY KEY, name TEXT)");
    auto result = backend_->executeMany("INSERT INTO items (name) VALUES (?)", {{SqlValue("a")}, {SqlValue("b")}, {SqlValue("c")}});
    ASSERT_TRUE(result.has_value()) << result.error().toString();
    EXPECT_EQ(result->kind, StatementKind::Insert);
    EXPECT_EQ(result->affected_rows, 3);
    EXPECT_EQ(result->last_insert_id, std::optional<long long>(3));

    auto rejected = backend_->executeMany("SELECT * FROM items WHERE id = ?", {{SqlValue(1LL)}});
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().kind(), ErrorKind::Construction);
}

TEST_F(StorageBackendTest, ExecuteManyStopsAtFirstFailure) {
    exec("CREATE TABLE items (name TEXT UNIQUE)");
    auto result = backend_->executeMany("INSERT INTO items VALUES (?)", {{SqlValue("a")}, {SqlValue("a")}, {SqlValue("b")}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConstraintViolation);
    EXPECT_EQ(result.error().constraint_name, "items.name");
}

TEST_F(StorageBackendTest, StatementTimeout) {
    ExecutionOptions options;
    options.timeout = std::chrono::milliseconds(50);
    auto result = backend_->execute(kEndlessQuery, {}, options);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Timeout);
    EXPECT_EQ(result.error().kind(), ErrorKind::Timeout);
    EXPECT_TRUE(backend_->execute("SELECT 1").has_value());
}

TEST_F(StorageBackendTest, TimeoutInsideTransactionRollsBackEverything) {
    exec("CREATE TABLE items (name TEXT)");
    ASSERT_TRUE(backend_->beginTransaction().has_value());
    ASSERT_TRUE(backend_->beginTransaction().has_value());
    exec("INSERT INTO items VALUES ('lost')");

    ExecutionOptions options;
    options.timeout = std::chrono::milliseconds(50);
    auto result = backend_->execute(kEndlessQuery, {}, options);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Timeout);
    EXPECT_FALSE(backend_->inTransaction());
    EXPECT_EQ(backend_->transactionLevel(), 0);

    auto count = backend_->execute("SELECT count(*) AS n FROM items");
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(count->rows[0].get<long long>("n"), std::optional<long long>(0));
}

TEST_F(StorageBackendTest, CancelFromAnotherThread) {
    std::atomic<bool> finished{false};
    std::thread canceller([&] {
        // 查询可能尚未开始, 重复中断直到它结束
        while (!finished.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            backend_->cancel();
        }
    });
    auto result = backend_->execute(kEndlessQuery);
    finished = true;
    canceller.join();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::OperationCancelled);
    EXPECT_EQ(result.error().kind(), ErrorKind::Cancellation);
}

class StatementTimeoutConfigTest : public test::SqliteBackendTest {
  protected:
    BackendConfig config() const override {
        BackendConfig c = test::memoryConfig();
        c.statement_timeout = std::chrono::milliseconds(50);
        return c;
    }
};

TEST_F(StatementTimeoutConfigTest, ConfiguredTimeoutApplies) {
    auto result = backend_->execute(kEndlessQuery);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Timeout);
}

class FileBackendTest : public ::testing::Test {
  protected:
    void SetUp() override {
        ASSERT_TRUE(dir_.isValid());
        path_ = dir_.filePath(QStringLiteral("app.db")).toStdString();
        drivers_ = cppquery_sqldriver::SqlDriverRegistry::createWithBuiltinDrivers();
        ASSERT_NE(drivers_, nullptr);
    }

    std::unique_ptr<StorageBackend> open(BackendConfig config) {
        auto created = StorageBackend::create(std::move(config), nullptr, *drivers_);
        EXPECT_TRUE(created.has_value()) << created.error().toString();
        if (!created) return nullptr;
        auto connected = (*created)->connect();
        EXPECT_TRUE(connected.has_value()) << connected.error().toString();
        return std::move(*created);
    }

    BackendConfig fileConfig() const {
        BackendConfig config = test::memoryConfig();
        config.database = path_;
        return config;
    }

    QTemporaryDir dir_;
    std::string path_;
    std::unique_ptr<cppquery_sqldriver::SqlDriverRegistry> drivers_;
};

TEST_F(FileBackendTest, WalJournalAndReadOnlyReopen) {
    {
        auto writer = open(fileConfig());
        ASSERT_NE(writer, nullptr);
        auto mode = writer->execute("PRAGMA journal_mode");
        ASSERT_TRUE(mode.has_value());
        EXPECT_EQ(mode->rows[0][0], Value(std::string("wal")));
        ASSERT_TRUE(writer->execute("CREATE TABLE notes (body TEXT)").has_value());
        ASSERT_TRUE(writer->execute("INSERT INTO notes VALUES ('kept')").has_value());
        ASSERT_TRUE(writer->disconnect().has_value());
    }

    BackendConfig read_only = fileConfig();
    read_only.read_only = true;
    auto reader = open(read_only);
    ASSERT_NE(reader, nullptr);
    auto rows = reader->execute("SELECT body FROM notes");
    ASSERT_TRUE(rows.has_value()) << rows.error().toString();
    EXPECT_EQ(rows->rows.size(), 1u);

    auto write = reader->execute("INSERT INTO notes VALUES ('no')");
    ASSERT_FALSE(write.has_value());
    EXPECT_EQ(write.error().code, ErrorCode::QueryExecutionError);
}

TEST_F(FileBackendTest, DeleteOnClose) {
    BackendConfig config = fileConfig();
    config.delete_on_close = true;
    auto backend = open(config);
    ASSERT_NE(backend, nullptr);
    ASSERT_TRUE(backend->execute("CREATE TABLE t (a INTEGER)").has_value());
    EXPECT_TRUE(QFile::exists(QString::fromStdString(path_)));
    ASSERT_TRUE(backend->disconnect().has_value());
    EXPECT_FALSE(QFile::exists(QString::fromStdString(path_)));
    EXPECT_FALSE(QFile::exists(QString::fromStdString(path_ + "-wal")));
}

TEST_F(FileBackendTest, MissingFileWithoutCreateFails) {
    BackendConfig config = fileConfig();
    config.create_if_missing = false;
    auto created = StorageBackend::create(config, nullptr, *drivers_);
    ASSERT_TRUE(created.has_value());
    auto connected = (*created)->connect();
    ASSERT_FALSE(connected.has_value());
    EXPECT_EQ(connected.error().code, ErrorCode::ConnectionFailed);
    EXPECT_FALSE((*created)->isConnected());
}
