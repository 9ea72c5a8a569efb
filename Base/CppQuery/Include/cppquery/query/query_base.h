#ifndef cppquery_QUERY_BASE_H
#define cppquery_QUERY_BASE_H

#include <boost/asio/awaitable.hpp>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cppquery/dialect/dialect.h"
#include "cppquery/error.h"
#include "cppquery/logical_type.h"
#include "cppquery/query/compiled_statement.h"
#include "cppquery/query/execution_options.h"
#include "cppquery/query/i_query_executor.h"
#include "cppquery/query/query_result.h"
#include "cppquery/query/query_source.h"

namespace cppquery {

    // 查询装配器的公共部分: 方言、执行器、终结调用与单次消费标记.
    // 同一装配器可以绑定同步或异步执行器, 渲染结果完全一致
    class QueryBase : public QuerySource {
      public:
        ~QueryBase() override = default;

        const DialectPtr& dialect() const {
            return dialect_;
        }
        IQueryExecutor* executor() const {
            return executor_;
        }
        IAsyncQueryExecutor* asyncExecutor() const {
            return async_executor_;
        }
        // 执行型终结调用之后为 true
        bool isConsumed() const {
            return consumed_;
        }
        const std::map<std::string, LogicalType>& columnTypes() const {
            return column_types_;
        }

        // 不执行, 只渲染. 可重复调用, 结果逐字节相同
        std::expected<CompiledStatement, Error> ToSql() const;

        // 执行型终结调用, 每个装配器只能调用一次
        std::expected<std::vector<Row>, Error> All();
        std::expected<std::optional<Row>, Error> One();
        std::expected<long long, Error> Count();
        std::expected<bool, Error> Exists();

        // 异步版本: 渲染与校验同步完成, 只在执行处挂起
        boost::asio::awaitable<std::expected<std::vector<Row>, Error>> AllAsync();
        boost::asio::awaitable<std::expected<std::optional<Row>, Error>> OneAsync();
        boost::asio::awaitable<std::expected<long long, Error>> CountAsync();
        boost::asio::awaitable<std::expected<bool, Error>> ExistsAsync();

        // 当前状态的不可变副本, 用于子查询 / 集合运算操作数 / CTE 定义
        virtual std::shared_ptr<const QueryBase> clone() const = 0;

      protected:
        explicit QueryBase(DialectPtr dialect);
        explicit QueryBase(IQueryExecutor* executor);
        explicit QueryBase(IAsyncQueryExecutor* executor);
        QueryBase(const QueryBase&) = default;
        QueryBase& operator=(const QueryBase&) = default;
        QueryBase(QueryBase&&) = default;
        QueryBase& operator=(QueryBase&&) = default;

        // 各终结调用实际执行的语句
        virtual std::expected<CompiledStatement, Error> compileSelect() const;
        virtual std::expected<CompiledStatement, Error> compileOne() const;
        virtual std::expected<CompiledStatement, Error> compileCount() const;
        virtual std::expected<CompiledStatement, Error> compileExists() const;
        // 在返回结果之前需要先执行的检查语句 (递归深度守卫); 返回行即视为失败
        virtual std::expected<std::optional<CompiledStatement>, Error> compileGuardCheck() const;
        virtual Error guardCheckFailure() const;

        // 派生出的新装配器 (例如集合运算) 从未被消费
        void resetConsumed_() {
            consumed_ = false;
        }

        // 在新的 RenderContext 中渲染并收集参数
        std::expected<CompiledStatement, Error> compileWith(const std::function<std::expected<std::string, Error>(RenderContext&)>& render) const;

        std::map<std::string, LogicalType> column_types_;

      private:
        enum class Terminal { All, One, Count, Exists };

        struct PreparedTerminal {
            CompiledStatement statement;
            std::optional<CompiledStatement> guard;
            ExecutionOptions options;
        };

        std::expected<PreparedTerminal, Error> prepareTerminal_(Terminal terminal, bool async);
        std::expected<void, Error> checkGuardResult_(const std::expected<QueryResult, Error>& guard_result) const;

        static std::expected<std::vector<Row>, Error> rowsOf_(std::expected<QueryResult, Error> result);
        static std::expected<std::optional<Row>, Error> firstRowOf_(std::expected<QueryResult, Error> result);
        static std::expected<long long, Error> countOf_(std::expected<QueryResult, Error> result);
        static std::expected<bool, Error> existsOf_(std::expected<QueryResult, Error> result);

        DialectPtr dialect_;
        IQueryExecutor* executor_ = nullptr;
        IAsyncQueryExecutor* async_executor_ = nullptr;
        bool consumed_ = false;
    };

}  // namespace cppquery

#endif  // cppquery_QUERY_BASE_H
