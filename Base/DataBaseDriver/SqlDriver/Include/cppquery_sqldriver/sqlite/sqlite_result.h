// cppquery_sqldriver/sqlite/sqlite_result.h
#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

#include "cppquery_sqldriver/sql_record.h"
#include "cppquery_sqldriver/sql_result.h"

struct sqlite3;
struct sqlite3_stmt;

namespace cppquery_sqldriver {

    class SqliteResult : public SqlResult {
      public:
        explicit SqliteResult(sqlite3* db);
        ~SqliteResult() override;

        SqliteResult(const SqliteResult&) = delete;
        SqliteResult& operator=(const SqliteResult&) = delete;

        bool prepare(const std::string& query) override;
        bool exec() override;
        bool setQueryTimeout(std::chrono::milliseconds timeout) override;

        void addPositionalBindValue(const SqlValue& value) override;
        void clearBindValues() override;

        bool fetchNext(SqlRecord& record_buffer) override;

        SqlRecord recordMetadata() const override;
        long long numRowsAffected() override;
        SqlValue lastInsertId() override;

        bool isSelect() const override;
        SqlError error() const override;

        void finish() override;

      private:
        static int progressCallback(void* self);

        bool step();
        void readCurrentRow(SqlRecord& record_buffer) const;
        void setErrorFromDb(int rc, const char* context);
        void installDeadline();
        void removeDeadline();

        sqlite3* m_db;
        sqlite3_stmt* m_stmt = nullptr;
        std::string m_query;
        std::vector<SqlValue> m_bind_values;
        SqlRecord m_metadata;
        SqlError m_error;

        bool m_active = false;
        bool m_has_pending_row = false;
        bool m_done = false;
        long long m_rows_affected = 0;
        long long m_last_insert_id = 0;

        std::chrono::milliseconds m_timeout{0};
        std::chrono::steady_clock::time_point m_deadline;
        std::atomic<bool> m_deadline_hit{false};
    };

}  // namespace cppquery_sqldriver
