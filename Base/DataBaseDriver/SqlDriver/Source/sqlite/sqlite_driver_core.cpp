// SqlDriver/Source/sqlite/sqlite_driver_core.cpp
#include <sqlite3.h>

#include <algorithm>
#include <cctype>

#include "cppquery_sqldriver/sql_driver_registry.h"
#include "cppquery_sqldriver/sqlite/sqlite_driver.h"
#include "cppquery_sqldriver/sqlite/sqlite_driver_helper.h"
#include "cppquery_sqldriver/sqlite/sqlite_result.h"

namespace cppquery_sqldriver {

    namespace {
        // PRAGMA 名称与取值只允许简单记号, 防止配置串被拼接成任意 SQL
        bool isSafeSettingToken(const std::string& token) {
            if (token.empty()) return false;
            return std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isalnum(c) || c == '_' || c == '-' || c == '.'; });
        }
    }  // namespace

    SqliteDriver::SqliteDriver() = default;

    SqliteDriver::~SqliteDriver() {
        // 直接执行 close() 的逻辑，避免从析构函数调用虚函数
        std::lock_guard<std::mutex> lock(m_handle_mutex);
        if (m_db) {
            sqlite3_close_v2(m_db);
            m_db = nullptr;
        }
    }

    bool SqliteDriver::open(const ConnectionParameters& params) {
        if (isOpen()) {
            m_last_error_cache = SqlError(ErrorCategory::Connectivity, "Connection is already open.", "open");
            return false;
        }

        const std::string db_name = params.dbName().value_or(":memory:");
        int flags = SQLITE_OPEN_URI | SQLITE_OPEN_FULLMUTEX;
        if (params.readOnly().value_or(false)) {
            flags |= SQLITE_OPEN_READONLY;
        } else {
            flags |= SQLITE_OPEN_READWRITE;
            if (params.createIfMissing().value_or(true)) {
                flags |= SQLITE_OPEN_CREATE;
            }
        }

        sqlite3* handle = nullptr;
        int rc = sqlite3_open_v2(db_name.c_str(), &handle, flags, nullptr);
        if (rc != SQLITE_OK) {
            m_last_error_cache = sqlite_helper::makeSqlError(handle, rc, "open '" + db_name + "'");
            if (m_last_error_cache.category() == ErrorCategory::Unknown || m_last_error_cache.category() == ErrorCategory::Syntax) {
                m_last_error_cache.setCategory(ErrorCategory::Connectivity);
            }
            if (handle) {
                sqlite3_close_v2(handle);
            }
            return false;
        }
        sqlite3_extended_result_codes(handle, 1);

        {
            std::lock_guard<std::mutex> lock(m_handle_mutex);
            m_db = handle;
        }
        m_current_params_cache = params;

        if (auto busy_ms = params.busyTimeoutMs()) {
            sqlite3_busy_timeout(m_db, static_cast<int>(std::max<long long>(0, *busy_ms)));
        }

        if (!applySessionSettings(params)) {
            SqlError settings_error = m_last_error_cache;
            close();
            m_last_error_cache = settings_error;
            return false;
        }

        m_last_error_cache.clear();
        return true;
    }

    bool SqliteDriver::applySessionSettings(const ConnectionParameters& params) {
        for (const auto& [name, value] : params.session_settings) {
            if (!isSafeSettingToken(name) || !isSafeSettingToken(value)) {
                m_last_error_cache = SqlError(ErrorCategory::DriverInternal, "Rejected PRAGMA setting '" + name + "=" + value + "'.", "applySessionSettings");
                return false;
            }
            if (!executeSimple("PRAGMA " + name + " = " + value, "applySessionSettings")) {
                return false;
            }
        }
        return true;
    }

    void SqliteDriver::close() {
        std::lock_guard<std::mutex> lock(m_handle_mutex);
        if (m_db) {
            int rc = sqlite3_close_v2(m_db);
            if (rc != SQLITE_OK) {
                m_last_error_cache = SqlError(ErrorCategory::DriverInternal, sqlite3_errstr(rc), "close", rc);
            }
            m_db = nullptr;
        }
        m_isolation_level = TransactionIsolationLevel::Default;
    }

    bool SqliteDriver::isOpen() const {
        std::lock_guard<std::mutex> lock(m_handle_mutex);
        return m_db != nullptr;
    }

    std::unique_ptr<SqlResult> SqliteDriver::createResult() const {
        return std::make_unique<SqliteResult>(m_db);
    }

    sqlite3* SqliteDriver::nativeHandle() const {
        return m_db;
    }

    bool SqliteDriver::executeSimple(const std::string& sql, const char* context) {
        if (!m_db) {
            m_last_error_cache = SqlError(ErrorCategory::Connectivity, "Connection is not open.", context);
            return false;
        }
        char* err_msg = nullptr;
        int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &err_msg);
        if (err_msg) {
            sqlite3_free(err_msg);
        }
        if (rc != SQLITE_OK) {
            m_last_error_cache = sqlite_helper::makeSqlError(m_db, rc, context, sql);
            return false;
        }
        m_last_error_cache.clear();
        return true;
    }

    bool SqliteDriver_Register(SqlDriverRegistry& registry) {
        return registry.registerDriver(SqliteDriver::DRIVER_NAME, []() { return std::make_unique<SqliteDriver>(); });
    }

}  // namespace cppquery_sqldriver
