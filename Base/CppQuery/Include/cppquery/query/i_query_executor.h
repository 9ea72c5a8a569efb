#ifndef cppquery_I_QUERY_EXECUTOR_H
#define cppquery_I_QUERY_EXECUTOR_H

#include <boost/asio/awaitable.hpp>
#include <expected>

#include "cppquery/dialect/dialect.h"
#include "cppquery/error.h"
#include "cppquery/query/compiled_statement.h"
#include "cppquery/query/execution_options.h"
#include "cppquery/query/query_result.h"

namespace cppquery {

    // 同步执行接口, 由 StorageBackend 实现
    class IQueryExecutor {
      public:
        virtual ~IQueryExecutor() = default;

        virtual DialectPtr dialect() const = 0;
        virtual std::expected<QueryResult, Error> execute(const CompiledStatement& statement, const ExecutionOptions& options = {}) = 0;
    };

    // 异步执行接口, 由 AsyncStorageBackend 实现. 语义与同步接口一致, 只是在 I/O 处挂起
    class IAsyncQueryExecutor {
      public:
        virtual ~IAsyncQueryExecutor() = default;

        virtual DialectPtr dialect() const = 0;
        virtual boost::asio::awaitable<std::expected<QueryResult, Error>> executeAsync(CompiledStatement statement, ExecutionOptions options = {}) = 0;
    };

}  // namespace cppquery

#endif  // cppquery_I_QUERY_EXECUTOR_H
