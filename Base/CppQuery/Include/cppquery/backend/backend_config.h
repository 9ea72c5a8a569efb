#ifndef cppquery_BACKEND_CONFIG_H
#define cppquery_BACKEND_CONFIG_H

#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "cppquery/dialect/dialect.h"
#include "cppquery/error.h"
#include "cppquery_sqldriver/sql_connection_parameters.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

namespace cppquery {

    struct BackendConfig {
        std::string driver_type = "SQLITE";
        std::string database = ":memory:";
        std::string connection_name = "default";

        // 等待锁的时间 (SQLite busy timeout), 秒
        double lock_wait_timeout_s = 5.0;
        // 单条语句的执行上限, 超时后回滚当前事务; 为空表示不限制
        std::optional<std::chrono::milliseconds> statement_timeout;

        // 连接建立后按顺序执行的 PRAGMA
        std::vector<std::pair<std::string, std::string>> pragmas = {{"foreign_keys", "ON"}, {"journal_mode", "WAL"}, {"synchronous", "FULL"}};

        bool read_only = false;
        bool create_if_missing = true;
        // 断开连接后删除数据库文件 (内存数据库无效)
        bool delete_on_close = false;

        // 强制使用的方言版本, 默认取驱动报告的版本
        std::optional<DialectVersion> dialect_version;

        // --- Logging ---
        std::shared_ptr<spdlog::logger> logger;
        spdlog::level::level_enum log_level = spdlog::level::info;

        BackendConfig() = default;

        // sqlite://:memory:
        // sqlite:///relative/path.db?timeout=2.5&statement_timeout_ms=100&foreign_keys=OFF
        // sqlite:////absolute/path.db?mode=ro
        static std::expected<BackendConfig, Error> fromUri(const std::string& uri);
        // 从 <prefix>DATABASE / TIMEOUT / STATEMENT_TIMEOUT_MS / READ_ONLY / DELETE_ON_CLOSE / PRAGMA_<name> 读取
        static std::expected<BackendConfig, Error> fromEnvironment(const std::string& prefix = "CPPQUERY_SQLITE_");

        bool isMemoryDatabase() const;
        std::expected<void, Error> validate() const;
        // 设置 (或覆盖同名) PRAGMA, 保持原有顺序
        void setPragma(const std::string& name, const std::string& value);
        cppquery_sqldriver::ConnectionParameters toDriverParameters() const;

        std::shared_ptr<spdlog::logger> getOrCreateLogger(const std::string& logger_name = "cppquery");
    };

}  // namespace cppquery

#endif  // cppquery_BACKEND_CONFIG_H
