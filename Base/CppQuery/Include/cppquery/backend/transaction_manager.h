#ifndef cppquery_TRANSACTION_MANAGER_H
#define cppquery_TRANSACTION_MANAGER_H

#include <expected>
#include <memory>
#include <optional>
#include <string>

#include "cppquery/error.h"
#include "cppquery_sqldriver/i_sql_driver.h"
#include "cppquery_sqldriver/sql_enums.h"
#include "spdlog/spdlog.h"

namespace cppquery {

    // 嵌套事务: 第 1 层是真实事务, 更深的层次使用保存点 sp_<n>
    class TransactionManager {
      public:
        TransactionManager(cppquery_sqldriver::ISqlDriver& driver, std::string dialect_name, bool supports_savepoint, std::shared_ptr<spdlog::logger> logger);

        TransactionManager(const TransactionManager&) = delete;
        TransactionManager& operator=(const TransactionManager&) = delete;

        int level() const {
            return level_;
        }
        bool isActive() const {
            return level_ > 0;
        }
        std::optional<cppquery_sqldriver::TransactionIsolationLevel> isolationLevel() const {
            return isolation_;
        }

        // 只能在事务开始之前设置
        std::expected<void, Error> setIsolationLevel(cppquery_sqldriver::TransactionIsolationLevel level);

        std::expected<void, Error> begin(std::optional<cppquery_sqldriver::TransactionIsolationLevel> isolation = std::nullopt);
        std::expected<void, Error> commit();
        std::expected<void, Error> rollback();
        // 回滚整个事务 (所有层级), 用于超时与断开连接
        std::expected<void, Error> rollbackAll();

        // 事务内每执行一条语句调用一次
        void noteStatementExecuted();
        std::size_t statementsInTransaction() const {
            return statements_in_transaction_;
        }

        // 引擎自行结束了事务 (例如出错后自动回滚) 时把计数归零, 返回是否发生了归零
        bool resynchronize();
        // 连接关闭后丢弃全部状态
        void reset();

        static std::string savepointName(int level);

      private:
        Error driverError_(const char* operation, ErrorCode fallback) const;

        cppquery_sqldriver::ISqlDriver& driver_;
        std::string dialect_name_;
        bool supports_savepoint_;
        std::shared_ptr<spdlog::logger> logger_;

        int level_ = 0;
        std::size_t statements_in_transaction_ = 0;
        std::optional<cppquery_sqldriver::TransactionIsolationLevel> isolation_;
    };

}  // namespace cppquery

#endif  // cppquery_TRANSACTION_MANAGER_H
