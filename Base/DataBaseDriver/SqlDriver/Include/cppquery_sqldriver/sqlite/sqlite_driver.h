// cppquery_sqldriver/sqlite/sqlite_driver.h
#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "cppquery_sqldriver/i_sql_driver.h"
#include "cppquery_sqldriver/sql_connection_parameters.h"
#include "cppquery_sqldriver/sql_error.h"

struct sqlite3;

namespace cppquery_sqldriver {

    class SqlDriverRegistry;

    class SqliteDriver : public ISqlDriver {
      public:
        static constexpr const char* DRIVER_NAME = "SQLITE";

        SqliteDriver();
        ~SqliteDriver() override;

        SqliteDriver(const SqliteDriver&) = delete;
        SqliteDriver& operator=(const SqliteDriver&) = delete;

        // --- ISqlDriver 接口实现 ---
        bool open(const ConnectionParameters& params) override;
        void close() override;
        bool isOpen() const override;

        bool beginTransaction() override;
        bool commitTransaction() override;
        bool rollbackTransaction() override;
        bool setSavepoint(const std::string& name) override;
        bool rollbackToSavepoint(const std::string& name) override;
        bool releaseSavepoint(const std::string& name) override;
        bool isInTransaction() const override;

        bool setTransactionIsolationLevel(TransactionIsolationLevel level) override;
        TransactionIsolationLevel transactionIsolationLevel() const override;

        std::unique_ptr<SqlResult> createResult() const override;

        SqlError lastError() const override;
        bool hasFeature(DriverFeature feature) const override;
        std::string driverName() const override;
        std::string engineVersion() const override;
        std::string quoteIdentifier(const std::string& identifier) const override;

        void interrupt() override;
        // --- End ISqlDriver 接口实现 ---

        sqlite3* nativeHandle() const;

      private:
        bool executeSimple(const std::string& sql, const char* context);
        bool applySessionSettings(const ConnectionParameters& params);

        sqlite3* m_db = nullptr;
        mutable std::mutex m_handle_mutex;  // 保护 m_db 与 interrupt() 的并发访问
        mutable SqlError m_last_error_cache;
        ConnectionParameters m_current_params_cache;
        TransactionIsolationLevel m_isolation_level = TransactionIsolationLevel::Default;
    };

    // 向注册表登记 SQLITE 驱动工厂, 同名驱动已存在时返回 false
    bool SqliteDriver_Register(SqlDriverRegistry& registry);

}  // namespace cppquery_sqldriver
