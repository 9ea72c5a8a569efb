// SqlDriver/Source/sqlite/sqlite_result.cpp
#include "cppquery_sqldriver/sqlite/sqlite_result.h"

#include <sqlite3.h>

#include <cctype>

#include "cppquery_sqldriver/sqlite/sqlite_driver_helper.h"

namespace cppquery_sqldriver {

    namespace {
        // 每执行这么多条虚拟机指令检查一次截止时间
        constexpr int kProgressHandlerInterval = 1000;

        bool isBlankTail(const char* tail) {
            if (!tail) return true;
            for (const char* p = tail; *p; ++p) {
                if (!std::isspace(static_cast<unsigned char>(*p)) && *p != ';') return false;
            }
            return true;
        }
    }  // namespace

    SqliteResult::SqliteResult(sqlite3* db) : m_db(db) {
    }

    SqliteResult::~SqliteResult() {
        removeDeadline();
        if (m_stmt) {
            sqlite3_finalize(m_stmt);
            m_stmt = nullptr;
        }
    }

    bool SqliteResult::prepare(const std::string& query) {
        finish();
        if (m_stmt) {
            sqlite3_finalize(m_stmt);
            m_stmt = nullptr;
        }
        m_query = query;
        m_metadata.clear();
        m_error.clear();

        if (!m_db) {
            m_error = SqlError(ErrorCategory::Connectivity, "Connection is not open.", "prepare", 0, query);
            return false;
        }

        const char* tail = nullptr;
        int rc = sqlite3_prepare_v2(m_db, query.c_str(), static_cast<int>(query.size()), &m_stmt, &tail);
        if (rc != SQLITE_OK) {
            setErrorFromDb(rc, "prepare");
            if (m_stmt) {
                sqlite3_finalize(m_stmt);
                m_stmt = nullptr;
            }
            return false;
        }
        if (!m_stmt) {
            m_error = SqlError(ErrorCategory::Syntax, "Statement text is empty.", "prepare", 0, query);
            return false;
        }
        if (!isBlankTail(tail)) {
            sqlite3_finalize(m_stmt);
            m_stmt = nullptr;
            m_error = SqlError(ErrorCategory::Syntax, "Only one statement can be prepared at a time.", "prepare", 0, query);
            return false;
        }

        int columns = sqlite3_column_count(m_stmt);
        for (int i = 0; i < columns; ++i) {
            m_metadata.append(sqlite_helper::columnField(m_stmt, i));
        }
        return true;
    }

    bool SqliteResult::exec() {
        if (!m_stmt) {
            m_error = SqlError(ErrorCategory::DriverInternal, "Statement is not prepared.", "exec", 0, m_query);
            return false;
        }
        sqlite3_reset(m_stmt);
        sqlite3_clear_bindings(m_stmt);
        m_error.clear();
        m_active = false;
        m_has_pending_row = false;
        m_done = false;
        m_rows_affected = 0;
        m_deadline_hit = false;

        int expected_params = sqlite3_bind_parameter_count(m_stmt);
        if (expected_params != static_cast<int>(m_bind_values.size())) {
            m_error = SqlError(ErrorCategory::DataRelated,
                               "Statement expects " + std::to_string(expected_params) + " parameters but " + std::to_string(m_bind_values.size()) + " were bound.",
                               "exec",
                               0,
                               m_query);
            return false;
        }
        for (size_t i = 0; i < m_bind_values.size(); ++i) {
            int rc = sqlite_helper::bindValue(m_stmt, static_cast<int>(i) + 1, m_bind_values[i]);
            if (rc != SQLITE_OK) {
                setErrorFromDb(rc, "bind");
                return false;
            }
        }

        installDeadline();
        m_active = true;
        if (!step()) {
            m_active = false;
            removeDeadline();
            sqlite3_reset(m_stmt);
            return false;
        }
        return true;
    }

    bool SqliteResult::step() {
        int rc = sqlite3_step(m_stmt);
        if (rc == SQLITE_ROW) {
            m_has_pending_row = true;
            return true;
        }
        if (rc == SQLITE_DONE) {
            m_has_pending_row = false;
            m_done = true;
            if (!sqlite3_stmt_readonly(m_stmt)) {
                m_rows_affected = sqlite3_changes(m_db);
                m_last_insert_id = sqlite3_last_insert_rowid(m_db);
            }
            removeDeadline();
            return true;
        }
        // sqlite3_step 返回的是主结果码, 需要从连接上取扩展码
        setErrorFromDb(rc, "step");
        m_has_pending_row = false;
        return false;
    }

    bool SqliteResult::setQueryTimeout(std::chrono::milliseconds timeout) {
        m_timeout = timeout.count() > 0 ? timeout : std::chrono::milliseconds{0};
        return true;
    }

    void SqliteResult::addPositionalBindValue(const SqlValue& value) {
        m_bind_values.push_back(value);
    }

    void SqliteResult::clearBindValues() {
        m_bind_values.clear();
        if (m_stmt) {
            sqlite3_clear_bindings(m_stmt);
        }
    }

    bool SqliteResult::fetchNext(SqlRecord& record_buffer) {
        if (!m_active || !m_stmt) {
            return false;
        }
        if (m_has_pending_row) {
            readCurrentRow(record_buffer);
            m_has_pending_row = false;
            return true;
        }
        if (m_done) {
            return false;
        }
        if (!step()) {
            m_active = false;
            removeDeadline();
            return false;
        }
        if (m_has_pending_row) {
            readCurrentRow(record_buffer);
            m_has_pending_row = false;
            return true;
        }
        return false;
    }

    void SqliteResult::readCurrentRow(SqlRecord& record_buffer) const {
        record_buffer = m_metadata;
        int columns = sqlite3_column_count(m_stmt);
        for (int i = 0; i < columns; ++i) {
            record_buffer.setValue(i, sqlite_helper::columnValue(m_stmt, i));
        }
    }

    SqlRecord SqliteResult::recordMetadata() const {
        return m_metadata;
    }

    long long SqliteResult::numRowsAffected() {
        return m_rows_affected;
    }

    SqlValue SqliteResult::lastInsertId() {
        if (m_last_insert_id == 0) {
            return SqlValue();
        }
        return SqlValue(m_last_insert_id);
    }

    bool SqliteResult::isSelect() const {
        return m_stmt && sqlite3_column_count(m_stmt) > 0;
    }

    SqlError SqliteResult::error() const {
        return m_error;
    }

    void SqliteResult::finish() {
        removeDeadline();
        if (m_stmt) {
            sqlite3_reset(m_stmt);
        }
        m_active = false;
        m_has_pending_row = false;
    }

    void SqliteResult::setErrorFromDb(int rc, const char* context) {
        m_error = sqlite_helper::makeSqlError(m_db, rc, context, m_query);
        if (m_error.category() == ErrorCategory::OperationCancelled && m_deadline_hit.load()) {
            m_error.setCategory(ErrorCategory::OperationTimedOut);
            m_error.setMessage("statement timeout of " + std::to_string(m_timeout.count()) + " ms exceeded");
        }
    }

    int SqliteResult::progressCallback(void* self) {
        auto* result = static_cast<SqliteResult*>(self);
        if (std::chrono::steady_clock::now() >= result->m_deadline) {
            result->m_deadline_hit = true;
            return 1;  // 非零返回值使 sqlite3_step 以 SQLITE_INTERRUPT 结束
        }
        return 0;
    }

    void SqliteResult::installDeadline() {
        if (!m_db || m_timeout.count() <= 0) {
            return;
        }
        m_deadline = std::chrono::steady_clock::now() + m_timeout;
        sqlite3_progress_handler(m_db, kProgressHandlerInterval, &SqliteResult::progressCallback, this);
    }

    void SqliteResult::removeDeadline() {
        if (!m_db || m_timeout.count() <= 0) {
            return;
        }
        sqlite3_progress_handler(m_db, 0, nullptr, nullptr);
    }

}  // namespace cppquery_sqldriver
