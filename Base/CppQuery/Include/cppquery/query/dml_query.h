#ifndef cppquery_DML_QUERY_H
#define cppquery_DML_QUERY_H

#include <boost/asio/awaitable.hpp>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "cppquery/dialect/dialect.h"
#include "cppquery/error.h"
#include "cppquery/expression/expression.h"
#include "cppquery/query/compiled_statement.h"
#include "cppquery/query/i_query_executor.h"
#include "cppquery/query/query_result.h"

namespace cppquery {

    class RenderContext;

    // INSERT / UPDATE / DELETE 的公共部分. 与 QueryBase 一样只能执行一次
    class DmlQueryBase {
      public:
        virtual ~DmlQueryBase() = default;

        const DialectPtr& dialect() const {
            return dialect_;
        }
        const std::string& table() const {
            return table_;
        }
        bool isConsumed() const {
            return consumed_;
        }
        bool hasReturning() const {
            return returning_.has_value();
        }

        std::expected<CompiledStatement, Error> ToSql() const;
        std::expected<QueryResult, Error> Execute();
        boost::asio::awaitable<std::expected<QueryResult, Error>> ExecuteAsync();

      protected:
        DmlQueryBase(DialectPtr dialect, std::string table);
        DmlQueryBase(IQueryExecutor* executor, std::string table);
        DmlQueryBase(IAsyncQueryExecutor* executor, std::string table);

        virtual std::expected<std::string, Error> renderStatement_(RenderContext& ctx) const = 0;
        virtual StatementKind statementKind_() const = 0;
        virtual const char* name_() const = 0;
        // 没有 RETURNING 时返回空串
        std::expected<std::string, Error> renderReturning_(RenderContext& ctx) const;

        std::string table_;
        std::optional<std::vector<std::string>> returning_;
        std::map<std::string, LogicalType> column_types_;

      private:
        std::expected<ExecutionOptions, Error> prepareExecute_(bool async);

        DialectPtr dialect_;
        IQueryExecutor* executor_ = nullptr;
        IAsyncQueryExecutor* async_executor_ = nullptr;
        bool consumed_ = false;
    };

    template <typename Derived>
    class DmlQuery : public DmlQueryBase {
      public:
        // 空列表表示 RETURNING *. 方言不支持时在渲染时报告能力错误
        Derived& Returning(std::vector<std::string> columns = {}) {
            returning_ = std::move(columns);
            return static_cast<Derived&>(*this);
        }
        Derived& ColumnTypes(std::map<std::string, LogicalType> types) {
            for (auto& [column, type] : types) {
                column_types_[column] = type;
            }
            return static_cast<Derived&>(*this);
        }

      protected:
        using DmlQueryBase::DmlQueryBase;
    };

    // INSERT 遇到唯一键冲突时的处理 (ON CONFLICT / ON DUPLICATE KEY UPDATE)
    struct OnConflictClause {
        enum class Action {
            DoNothing,          // 跳过冲突行, MySQL 渲染为 INSERT IGNORE
            UpdateAllExcluded,  // 用插入行的值更新冲突目标以外的全部插入列
            UpdateSpecific      // 按 assignments 更新, 可用 excluded(col) 引用插入行
        };

        Action action = Action::DoNothing;
        std::vector<std::string> target_columns;  // MySQL 不使用
        std::vector<std::pair<std::string, ExprPtr>> assignments;
        ExprPtr where;  // DO UPDATE ... WHERE, 仅 ON CONFLICT 方言
    };

    class InsertQuery : public DmlQuery<InsertQuery> {
      public:
        using Assignment = std::pair<std::string, ExprPtr>;

        InsertQuery(DialectPtr dialect, std::string table) : DmlQuery(std::move(dialect), std::move(table)) {
        }
        InsertQuery(IQueryExecutor* executor, std::string table) : DmlQuery(executor, std::move(table)) {
        }
        InsertQuery(IAsyncQueryExecutor* executor, std::string table) : DmlQuery(executor, std::move(table)) {
        }

        // 给当前行设置一列
        InsertQuery& Set(const std::string& column, ExprPtr value);
        // 追加完整的一行, 之后的 Set 作用于这一行
        InsertQuery& AddRow(std::vector<Assignment> row);

        InsertQuery& OnConflictDoNothing(std::vector<std::string> target_columns = {});
        InsertQuery& OnConflictUpdateAllExcluded(std::vector<std::string> target_columns);
        InsertQuery& OnConflictUpdate(std::vector<std::string> target_columns, std::vector<Assignment> assignments, ExprPtr where = nullptr);
        const std::optional<OnConflictClause>& onConflict() const {
            return on_conflict_;
        }

        std::size_t rowCount() const {
            return rows_.size();
        }

      protected:
        std::expected<std::string, Error> renderStatement_(RenderContext& ctx) const override;
        StatementKind statementKind_() const override {
            return StatementKind::Insert;
        }
        const char* name_() const override {
            return "InsertQuery";
        }

      private:
        std::expected<std::string, Error> renderOnConflict_(RenderContext& ctx, const std::vector<Assignment>& inserted) const;

        std::vector<std::vector<Assignment>> rows_;
        std::optional<OnConflictClause> on_conflict_;
    };

    class UpdateQuery : public DmlQuery<UpdateQuery> {
      public:
        UpdateQuery(DialectPtr dialect, std::string table) : DmlQuery(std::move(dialect), std::move(table)) {
        }
        UpdateQuery(IQueryExecutor* executor, std::string table) : DmlQuery(executor, std::move(table)) {
        }
        UpdateQuery(IAsyncQueryExecutor* executor, std::string table) : DmlQuery(executor, std::move(table)) {
        }

        UpdateQuery& Set(const std::string& column, ExprPtr value);
        // 与已有条件做 AND
        UpdateQuery& Where(ExprPtr condition);

      protected:
        std::expected<std::string, Error> renderStatement_(RenderContext& ctx) const override;
        StatementKind statementKind_() const override {
            return StatementKind::Update;
        }
        const char* name_() const override {
            return "UpdateQuery";
        }

      private:
        std::vector<std::pair<std::string, ExprPtr>> assignments_;
        ExprPtr where_;
    };

    class DeleteQuery : public DmlQuery<DeleteQuery> {
      public:
        DeleteQuery(DialectPtr dialect, std::string table) : DmlQuery(std::move(dialect), std::move(table)) {
        }
        DeleteQuery(IQueryExecutor* executor, std::string table) : DmlQuery(executor, std::move(table)) {
        }
        DeleteQuery(IAsyncQueryExecutor* executor, std::string table) : DmlQuery(executor, std::move(table)) {
        }

        DeleteQuery& Where(ExprPtr condition);

      protected:
        std::expected<std::string, Error> renderStatement_(RenderContext& ctx) const override;
        StatementKind statementKind_() const override {
            return StatementKind::Delete;
        }
        const char* name_() const override {
            return "DeleteQuery";
        }

      private:
        ExprPtr where_;
    };

}  // namespace cppquery

#endif  // cppquery_DML_QUERY_H
