// cppquery_sqldriver/sql_result.h
#pragma once

#include <chrono>
#include <string>

#include "sql_error.h"
#include "sql_record.h"
#include "sql_value.h"

namespace cppquery_sqldriver {

    // 单条语句的执行游标. 由 ISqlDriver::createResult 创建, 不可跨线程共享.
    // 用法: prepare -> addPositionalBindValue... -> exec -> fetchNext... -> finish.
    // 同一语句可以 clearBindValues 后重新绑定并再次 exec
    class SqlResult {
      public:
        virtual ~SqlResult() = default;

        virtual bool prepare(const std::string& query) = 0;
        virtual void addPositionalBindValue(const SqlValue& value) = 0;
        virtual void clearBindValues() = 0;
        // 0 表示不限制; 超时后 exec/fetchNext 失败, 分类为 OperationTimedOut
        virtual bool setQueryTimeout(std::chrono::milliseconds timeout) = 0;
        virtual bool exec() = 0;

        // 列名与声明类型, 值为空
        virtual SqlRecord recordMetadata() const = 0;
        virtual bool fetchNext(SqlRecord& record_buffer) = 0;
        virtual bool isSelect() const = 0;

        virtual long long numRowsAffected() = 0;
        // 没有插入行时为 Null
        virtual SqlValue lastInsertId() = 0;

        virtual SqlError error() const = 0;
        virtual void finish() = 0;
    };

}  // namespace cppquery_sqldriver
