// cppquery/query/dml_query.cpp
#include "cppquery/query/dml_query.h"

#include "cppquery/dialect/render_context.h"
#include "cppquery/query/builder_parts/active_query_conditions_mixin.h"

namespace cppquery {

    // --- DmlQueryBase ---

    DmlQueryBase::DmlQueryBase(DialectPtr dialect, std::string table) : table_(std::move(table)), dialect_(std::move(dialect)) {
    }

    DmlQueryBase::DmlQueryBase(IQueryExecutor* executor, std::string table) : table_(std::move(table)), dialect_(executor ? executor->dialect() : nullptr), executor_(executor) {
    }

    DmlQueryBase::DmlQueryBase(IAsyncQueryExecutor* executor, std::string table) : table_(std::move(table)), dialect_(executor ? executor->dialect() : nullptr), async_executor_(executor) {
    }

    std::expected<CompiledStatement, Error> DmlQueryBase::ToSql() const {
        if (!dialect_) {
            return std::unexpected(makeConstructionError("Query has no dialect (no executor was bound)"));
        }
        if (table_.empty()) {
            return std::unexpected(makeConstructionError(std::string(name_()) + " has no target table", "", dialect_->name()));
        }
        RenderContext ctx(*dialect_);
        auto sql = renderStatement_(ctx);
        if (!sql) {
            return std::unexpected(sql.error());
        }
        auto returning = renderReturning_(ctx);
        if (!returning) {
            return std::unexpected(returning.error());
        }
        if (!returning->empty()) {
            *sql += " " + *returning;
        }
        return CompiledStatement{std::move(*sql), ctx.takeParams()};
    }

    std::expected<std::string, Error> DmlQueryBase::renderReturning_(RenderContext& ctx) const {
        if (!returning_) {
            return std::string();
        }
        auto clause = ctx.dialect().formatReturningClause(*returning_);
        if (!clause) {
            Error err = clause.error();
            if (err.dialect.empty()) err.dialect = ctx.dialect().name();
            return std::unexpected(err);
        }
        return clause;
    }

    std::expected<ExecutionOptions, Error> DmlQueryBase::prepareExecute_(bool async) {
        if (consumed_) {
            return std::unexpected(Error(ErrorCode::QueryAlreadyConsumed, std::string(name_()) + " has already been executed").withDialect(dialect_ ? dialect_->name() : ""));
        }
        if (async ? async_executor_ == nullptr : executor_ == nullptr) {
            return std::unexpected(makeConstructionError(async ? "No async executor bound to this query" : "No executor bound to this query", "", dialect_ ? dialect_->name() : ""));
        }
        ExecutionOptions options;
        options.classification = statementKind_();
        options.returning = returning_.has_value();
        options.column_types = column_types_;
        return options;
    }

    std::expected<QueryResult, Error> DmlQueryBase::Execute() {
        auto options = prepareExecute_(false);
        if (!options) return std::unexpected(options.error());
        auto statement = ToSql();
        if (!statement) return std::unexpected(statement.error());
        consumed_ = true;
        return executor_->execute(*statement, *options);
    }

    boost::asio::awaitable<std::expected<QueryResult, Error>> DmlQueryBase::ExecuteAsync() {
        auto options = prepareExecute_(true);
        if (!options) co_return std::unexpected(options.error());
        auto statement = ToSql();
        if (!statement) co_return std::unexpected(statement.error());
        consumed_ = true;
        co_return co_await async_executor_->executeAsync(std::move(*statement), std::move(*options));
    }

    // --- InsertQuery ---

    InsertQuery& InsertQuery::Set(const std::string& column, ExprPtr value) {
        if (column.empty() || !value) {
            qWarning("cppquery InsertQuery::Set: empty column or null value ignored.");
            return *this;
        }
        if (rows_.empty()) {
            rows_.emplace_back();
        }
        rows_.back().emplace_back(column, std::move(value));
        return *this;
    }

    InsertQuery& InsertQuery::AddRow(std::vector<Assignment> row) {
        if (row.empty()) {
            qWarning("cppquery InsertQuery::AddRow: empty row ignored.");
            return *this;
        }
        rows_.push_back(std::move(row));
        return *this;
    }

    InsertQuery& InsertQuery::OnConflictDoNothing(std::vector<std::string> target_columns) {
        OnConflictClause clause;
        clause.action = OnConflictClause::Action::DoNothing;
        clause.target_columns = std::move(target_columns);
        on_conflict_ = std::move(clause);
        return *this;
    }

    InsertQuery& InsertQuery::OnConflictUpdateAllExcluded(std::vector<std::string> target_columns) {
        OnConflictClause clause;
        clause.action = OnConflictClause::Action::UpdateAllExcluded;
        clause.target_columns = std::move(target_columns);
        on_conflict_ = std::move(clause);
        return *this;
    }

    InsertQuery& InsertQuery::OnConflictUpdate(std::vector<std::string> target_columns, std::vector<Assignment> assignments, ExprPtr where) {
        OnConflictClause clause;
        clause.action = OnConflictClause::Action::UpdateSpecific;
        clause.target_columns = std::move(target_columns);
        for (auto& assignment : assignments) {
            if (assignment.first.empty() || !assignment.second) {
                qWarning("cppquery InsertQuery::OnConflictUpdate: empty column or null value ignored.");
                continue;
            }
            clause.assignments.push_back(std::move(assignment));
        }
        clause.where = std::move(where);
        on_conflict_ = std::move(clause);
        return *this;
    }

    std::expected<std::string, Error> InsertQuery::renderOnConflict_(RenderContext& ctx, const std::vector<Assignment>& inserted) const {
        ClauseScope scope(ctx, "ON CONFLICT");
        const Dialect& dialect = ctx.dialect();
        const OnConflictClause& clause = *on_conflict_;
        std::vector<std::string> assignments;
        switch (clause.action) {
            case OnConflictClause::Action::DoNothing:
                break;
            case OnConflictClause::Action::UpdateAllExcluded:
                for (const auto& [column, value] : inserted) {
                    bool is_target = false;
                    for (const auto& target : clause.target_columns) {
                        if (target == column) {
                            is_target = true;
                            break;
                        }
                    }
                    if (is_target) continue;
                    assignments.push_back(dialect.formatIdentifier(column) + " = " + dialect.formatExcludedColumn(column));
                }
                if (assignments.empty()) {
                    return std::unexpected(ctx.constructionError("Every inserted column is a conflict target; nothing to update"));
                }
                break;
            case OnConflictClause::Action::UpdateSpecific:
                for (const auto& [column, value] : clause.assignments) {
                    auto rendered = ctx.render(value);
                    if (!rendered) return rendered;
                    assignments.push_back(dialect.formatIdentifier(column) + " = " + *rendered);
                }
                break;
        }

        std::optional<std::string> where_sql;
        if (clause.where && clause.action != OnConflictClause::Action::DoNothing) {
            auto where = ctx.render(clause.where);
            if (!where) return where;
            where_sql = std::move(*where);
        }
        auto sql = dialect.formatOnConflictClause(clause.target_columns, clause.action == OnConflictClause::Action::DoNothing, assignments, where_sql);
        if (!sql) {
            Error err = sql.error();
            if (err.dialect.empty()) err.dialect = dialect.name();
            return std::unexpected(err);
        }
        return sql;
    }

    std::expected<std::string, Error> InsertQuery::renderStatement_(RenderContext& ctx) const {
        ClauseScope scope(ctx, "INSERT");
        if (rows_.empty()) {
            return std::unexpected(ctx.constructionError("INSERT into " + table_ + " has no values"));
        }
        const auto& first = rows_.front();
        std::string columns;
        for (const auto& [column, value] : first) {
            if (!columns.empty()) columns += ", ";
            columns += ctx.dialect().formatIdentifier(column);
        }

        std::string rows_sql;
        for (const auto& row : rows_) {
            if (row.size() != first.size()) {
                return std::unexpected(ctx.constructionError("INSERT rows must set the same columns in the same order"));
            }
            std::string values;
            for (std::size_t i = 0; i < row.size(); ++i) {
                if (row[i].first != first[i].first) {
                    return std::unexpected(ctx.constructionError("INSERT rows must set the same columns in the same order"));
                }
                auto rendered = ctx.render(row[i].second);
                if (!rendered) return rendered;
                if (i) values += ", ";
                values += *rendered;
            }
            if (!rows_sql.empty()) rows_sql += ", ";
            rows_sql += "(" + values + ")";
        }
        const bool ignore_conflicts = on_conflict_ && on_conflict_->action == OnConflictClause::Action::DoNothing;
        std::string sql = ctx.dialect().formatInsertVerb(ignore_conflicts) + " " + ctx.dialect().formatTableReference(table_, std::nullopt) + " (" + columns + ") VALUES " + rows_sql;
        if (on_conflict_) {
            auto clause = renderOnConflict_(ctx, first);
            if (!clause) return clause;
            if (!clause->empty()) sql += " " + *clause;
        }
        return sql;
    }

    // --- UpdateQuery ---

    UpdateQuery& UpdateQuery::Set(const std::string& column, ExprPtr value) {
        if (column.empty() || !value) {
            qWarning("cppquery UpdateQuery::Set: empty column or null value ignored.");
            return *this;
        }
        assignments_.emplace_back(column, std::move(value));
        return *this;
    }

    UpdateQuery& UpdateQuery::Where(ExprPtr condition) {
        if (!condition) {
            qWarning("cppquery UpdateQuery::Where: null condition ignored.");
            return *this;
        }
        where_ = conjoin(where_, condition);
        return *this;
    }

    std::expected<std::string, Error> UpdateQuery::renderStatement_(RenderContext& ctx) const {
        std::string sql = "UPDATE " + ctx.dialect().formatTableReference(table_, std::nullopt) + " SET ";
        {
            ClauseScope scope(ctx, "SET");
            if (assignments_.empty()) {
                return std::unexpected(ctx.constructionError("UPDATE of " + table_ + " has no assignments"));
            }
            for (std::size_t i = 0; i < assignments_.size(); ++i) {
                auto rendered = ctx.render(assignments_[i].second);
                if (!rendered) return rendered;
                if (i) sql += ", ";
                sql += ctx.dialect().formatIdentifier(assignments_[i].first) + " = " + *rendered;
            }
        }
        if (where_) {
            ClauseScope scope(ctx, "WHERE");
            auto where = ctx.render(where_);
            if (!where) return where;
            sql += " WHERE " + *where;
        }
        return sql;
    }

    // --- DeleteQuery ---

    DeleteQuery& DeleteQuery::Where(ExprPtr condition) {
        if (!condition) {
            qWarning("cppquery DeleteQuery::Where: null condition ignored.");
            return *this;
        }
        where_ = conjoin(where_, condition);
        return *this;
    }

    std::expected<std::string, Error> DeleteQuery::renderStatement_(RenderContext& ctx) const {
        std::string sql = "DELETE FROM " + ctx.dialect().formatTableReference(table_, std::nullopt);
        if (where_) {
            ClauseScope scope(ctx, "WHERE");
            auto where = ctx.render(where_);
            if (!where) return where;
            sql += " WHERE " + *where;
        }
        return sql;
    }

}  // namespace cppquery
