#ifndef cppquery_STORAGE_BACKEND_H
#define cppquery_STORAGE_BACKEND_H

#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cppquery/backend/backend_config.h"
#include "cppquery/backend/statement_classifier.h"
#include "cppquery/backend/transaction_manager.h"
#include "cppquery/error.h"
#include "cppquery/query/i_query_executor.h"
#include "cppquery/type_mapping.h"
#include "cppquery_sqldriver/i_sql_driver.h"
#include "cppquery_sqldriver/sql_driver_registry.h"
#include "cppquery_sqldriver/sql_record.h"

namespace cppquery {

    // 单连接的同步存储后端.
    // 状态: Disconnected -> Connected -> (嵌套) InTransaction -> Connected -> Disconnected.
    // 一个实例同一时刻只服务一个调用序列; cancel() 可以从其它线程调用
    class StorageBackend : public IQueryExecutor {
      public:
        // 校验配置, 创建驱动与方言. 不建立连接
        static std::expected<std::unique_ptr<StorageBackend>, Error> create(BackendConfig config, std::shared_ptr<const TypeMappingRegistry> type_registry, const cppquery_sqldriver::SqlDriverRegistry& drivers);

        ~StorageBackend() override;
        StorageBackend(const StorageBackend&) = delete;
        StorageBackend& operator=(const StorageBackend&) = delete;

        std::expected<void, Error> connect();
        // 有未结束的事务时先回滚
        std::expected<void, Error> disconnect();
        bool isConnected() const;

        // IQueryExecutor
        DialectPtr dialect() const override {
            return dialect_;
        }
        std::expected<QueryResult, Error> execute(const CompiledStatement& statement, const ExecutionOptions& options = {}) override;

        std::expected<QueryResult, Error> execute(const std::string& sql, const std::vector<cppquery_sqldriver::SqlValue>& params = {}, const ExecutionOptions& options = {});
        // 同一语句按多组参数执行, affected_rows 为总和
        std::expected<QueryResult, Error> executeMany(const std::string& sql, const std::vector<std::vector<cppquery_sqldriver::SqlValue>>& param_sets, const ExecutionOptions& options = {});

        // --- 事务 ---
        std::expected<void, Error> beginTransaction(std::optional<cppquery_sqldriver::TransactionIsolationLevel> isolation = std::nullopt);
        std::expected<void, Error> commit();
        std::expected<void, Error> rollback();
        std::expected<void, Error> setIsolationLevel(cppquery_sqldriver::TransactionIsolationLevel level);
        int transactionLevel() const;
        bool inTransaction() const;
        // work 返回错误时回滚并返回该错误, 否则提交
        std::expected<void, Error> runInTransaction(const std::function<std::expected<void, Error>(StorageBackend&)>& work, std::optional<cppquery_sqldriver::TransactionIsolationLevel> isolation = std::nullopt);

        // 中断正在执行的语句, 线程安全
        void cancel();

        const BackendConfig& config() const {
            return config_;
        }
        const std::shared_ptr<spdlog::logger>& logger() const {
            return logger_;
        }
        const TypeMappingRegistry& typeMappings() const {
            return *type_registry_;
        }
        std::string serverVersion() const;

      private:
        StorageBackend(BackendConfig config, std::shared_ptr<const TypeMappingRegistry> type_registry, std::unique_ptr<cppquery_sqldriver::ISqlDriver> driver, DialectPtr dialect);

        std::expected<void, Error> checkExecutable_(const std::string& sql, const StatementClassification& classification, const ExecutionOptions& options) const;
        // 语句执行失败后的统一处理: 翻译错误, 超时回滚, 事务状态重同步
        Error handleExecutionFailure_(const cppquery_sqldriver::SqlError& sql_error, const std::string& sql);
        std::expected<Row, Error> convertRow_(const cppquery_sqldriver::SqlRecord& record, const std::shared_ptr<const std::vector<std::string>>& columns, const ExecutionOptions& options) const;
        std::expected<Value, Error> convertValue_(const cppquery_sqldriver::SqlValue& value, const std::string& column, const std::string& declared_type, const ExecutionOptions& options) const;

        BackendConfig config_;
        std::shared_ptr<const TypeMappingRegistry> type_registry_;
        std::unique_ptr<cppquery_sqldriver::ISqlDriver> driver_;
        DialectPtr dialect_;
        std::shared_ptr<spdlog::logger> logger_;
        std::unique_ptr<TransactionManager> transactions_;
    };

}  // namespace cppquery

#endif  // cppquery_STORAGE_BACKEND_H
