#ifndef cppquery_TESTS_TEST_SUPPORT_H
#define cppquery_TESTS_TEST_SUPPORT_H

#include <gtest/gtest.h>

#include <deque>
#include <expected>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "cppquery/backend/storage_backend.h"
#include "cppquery/dialect/dialect_factory.h"
#include "cppquery/query/i_query_executor.h"
#include "cppquery/type_mapping.h"
#include "cppquery_sqldriver/sql_driver_registry.h"
#include "spdlog/spdlog.h"

namespace cppquery::test {

    inline DialectPtr makeTestDialect(const std::string& driver_type, DialectVersion version, std::shared_ptr<const TypeMappingRegistry> registry = nullptr) {
        if (!registry) {
            registry = TypeMappingRegistry::createWithBuiltins();
        }
        auto dialect = makeDialect(driver_type, version, std::move(registry));
        if (!dialect) {
            throw std::runtime_error("dialect setup failed: " + dialect.error().toString());
        }
        return *dialect;
    }

    inline DialectPtr sqliteDialect(DialectVersion version = {3, 45, 0}) {
        return makeTestDialect("SQLITE", version);
    }
    inline DialectPtr mysqlDialect(DialectVersion version = {8, 0, 36}) {
        return makeTestDialect("MYSQL", version);
    }
    inline DialectPtr postgresDialect(DialectVersion version = {16, 0, 0}) {
        return makeTestDialect("POSTGRESQL", version);
    }

    inline BackendConfig memoryConfig() {
        BackendConfig config;
        config.database = ":memory:";
        config.log_level = spdlog::level::warn;
        return config;
    }

    // 记录收到的语句, 按顺序返回预置结果; 没有预置结果时返回空结果
    class RecordingExecutor : public IQueryExecutor {
      public:
        explicit RecordingExecutor(DialectPtr dialect) : dialect_(std::move(dialect)) {
        }

        DialectPtr dialect() const override {
            return dialect_;
        }

        std::expected<QueryResult, Error> execute(const CompiledStatement& statement, const ExecutionOptions& options = {}) override {
            executed.push_back(statement);
            executed_options.push_back(options);
            if (results.empty()) {
                return QueryResult{};
            }
            auto next = std::move(results.front());
            results.pop_front();
            return next;
        }

        std::vector<CompiledStatement> executed;
        std::vector<ExecutionOptions> executed_options;
        std::deque<std::expected<QueryResult, Error>> results;

      private:
        DialectPtr dialect_;
    };

    inline QueryResult singleValueResult(Value value, const std::string& column = "value") {
        QueryResult result;
        result.kind = StatementKind::Select;
        auto columns = std::make_shared<const std::vector<std::string>>(std::vector<std::string>{column});
        result.rows.emplace_back(columns, std::vector<Value>{std::move(value)});
        return result;
    }

    // 每个测试独立的驱动注册表与内存数据库
    class SqliteBackendTest : public ::testing::Test {
      protected:
        void SetUp() override {
            drivers_ = cppquery_sqldriver::SqlDriverRegistry::createWithBuiltinDrivers();
            ASSERT_NE(drivers_, nullptr);
            registry_ = TypeMappingRegistry::createWithBuiltins();
            auto created = StorageBackend::create(config(), registry_, *drivers_);
            ASSERT_TRUE(created.has_value()) << created.error().toString();
            backend_ = std::move(*created);
            auto connected = backend_->connect();
            ASSERT_TRUE(connected.has_value()) << connected.error().toString();
        }

        void TearDown() override {
            if (backend_) {
                auto closed = backend_->disconnect();
                EXPECT_TRUE(closed.has_value()) << closed.error().toString();
            }
        }

        virtual BackendConfig config() const {
            return memoryConfig();
        }

        void exec(const std::string& sql) {
            auto res = backend_->execute(sql);
            ASSERT_TRUE(res.has_value()) << sql << ": " << res.error().toString();
        }

        std::unique_ptr<cppquery_sqldriver::SqlDriverRegistry> drivers_;
        std::shared_ptr<TypeMappingRegistry> registry_;
        std::unique_ptr<StorageBackend> backend_;
    };

}  // namespace cppquery::test

#endif  // cppquery_TESTS_TEST_SUPPORT_H
