// cppquery_sqldriver/i_sql_driver.h
#pragma once

#include <memory>
#include <string>

#include "sql_connection_parameters.h"
#include "sql_enums.h"
#include "sql_error.h"
#include "sql_record.h"
#include "sql_value.h"

namespace cppquery_sqldriver {

    class SqlResult;

    // 单个数据库连接. 失败的调用返回 false, 细节由 lastError() 给出.
    // 除 interrupt() 外都只能在持有连接的线程上调用
    class ISqlDriver {
      public:
        virtual ~ISqlDriver() = default;

        // 连接
        virtual bool open(const ConnectionParameters& params) = 0;
        virtual void close() = 0;
        virtual bool isOpen() const = 0;

        // 事务. 嵌套层级由上层用保存点实现, 驱动只执行单条 TCL
        virtual bool beginTransaction() = 0;
        virtual bool commitTransaction() = 0;
        virtual bool rollbackTransaction() = 0;
        virtual bool setSavepoint(const std::string& name) = 0;
        virtual bool rollbackToSavepoint(const std::string& name) = 0;
        virtual bool releaseSavepoint(const std::string& name) = 0;
        // 引擎自身是否处于事务中 (引擎可能在出错时自动回滚)
        virtual bool isInTransaction() const = 0;

        // 作用于下一次 beginTransaction
        virtual bool setTransactionIsolationLevel(TransactionIsolationLevel level) = 0;
        virtual TransactionIsolationLevel transactionIsolationLevel() const = 0;

        virtual std::unique_ptr<SqlResult> createResult() const = 0;

        virtual SqlError lastError() const = 0;
        virtual bool hasFeature(DriverFeature feature) const = 0;
        virtual std::string driverName() const = 0;
        // 引擎库版本, 例如 "3.45.1"
        virtual std::string engineVersion() const = 0;
        virtual std::string quoteIdentifier(const std::string& identifier) const = 0;

        // 可以从其它线程调用, 中断正在执行的语句
        virtual void interrupt() = 0;
    };

}  // namespace cppquery_sqldriver
