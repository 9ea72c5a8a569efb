// cppquery/query/query_base.cpp
#include "cppquery/query/query_base.h"

#include <QDebug>

#include "cppquery/dialect/render_context.h"

namespace cppquery {

    QueryBase::QueryBase(DialectPtr dialect) : dialect_(std::move(dialect)) {
    }

    QueryBase::QueryBase(IQueryExecutor* executor) : dialect_(executor ? executor->dialect() : nullptr), executor_(executor) {
        if (!executor_) {
            qWarning("cppquery QueryBase: constructed with a null executor, terminal calls will fail.");
        }
    }

    QueryBase::QueryBase(IAsyncQueryExecutor* executor) : dialect_(executor ? executor->dialect() : nullptr), async_executor_(executor) {
        if (!async_executor_) {
            qWarning("cppquery QueryBase: constructed with a null async executor, terminal calls will fail.");
        }
    }

    std::expected<CompiledStatement, Error> QueryBase::compileWith(const std::function<std::expected<std::string, Error>(RenderContext&)>& render) const {
        if (!dialect_) {
            return std::unexpected(makeConstructionError("Query has no dialect (no executor was bound)"));
        }
        RenderContext ctx(*dialect_);
        auto sql = render(ctx);
        if (!sql) {
            return std::unexpected(sql.error());
        }
        return CompiledStatement{std::move(*sql), ctx.takeParams()};
    }

    std::expected<CompiledStatement, Error> QueryBase::ToSql() const {
        return compileSelect();
    }

    std::expected<CompiledStatement, Error> QueryBase::compileSelect() const {
        return compileWith([this](RenderContext& ctx) { return renderInto(ctx); });
    }

    std::expected<CompiledStatement, Error> QueryBase::compileOne() const {
        return compileSelect();
    }

    std::expected<CompiledStatement, Error> QueryBase::compileCount() const {
        return compileWith([this](RenderContext& ctx) -> std::expected<std::string, Error> {
            auto inner = renderInto(ctx);
            if (!inner) return inner;
            return "SELECT COUNT(*) FROM " + ctx.dialect().formatSubquery(*inner) + " AS " + ctx.dialect().formatIdentifier("cppquery_count");
        });
    }

    std::expected<CompiledStatement, Error> QueryBase::compileExists() const {
        return compileWith([this](RenderContext& ctx) -> std::expected<std::string, Error> {
            auto inner = renderInto(ctx);
            if (!inner) return inner;
            auto limit = ctx.dialect().formatLimitOffset(ctx, 1, std::nullopt);
            if (!limit) return limit;
            return "SELECT " + ctx.dialect().formatExistsProjection() + " FROM " + ctx.dialect().formatSubquery(*inner) + " AS " + ctx.dialect().formatIdentifier("cppquery_exists") + " " + *limit;
        });
    }

    std::expected<std::optional<CompiledStatement>, Error> QueryBase::compileGuardCheck() const {
        return std::optional<CompiledStatement>();
    }

    Error QueryBase::guardCheckFailure() const {
        return Error(ErrorCode::InternalError, "Guard check reported a failure");
    }

    std::expected<QueryBase::PreparedTerminal, Error> QueryBase::prepareTerminal_(Terminal terminal, bool async) {
        if (consumed_) {
            return std::unexpected(Error(ErrorCode::QueryAlreadyConsumed, "Query has already been executed; build a new query for another terminal call").withDialect(dialect_ ? dialect_->name() : ""));
        }
        if (async ? async_executor_ == nullptr : executor_ == nullptr) {
            return std::unexpected(makeConstructionError(async ? "No async executor bound to this query" : "No executor bound to this query", "", dialect_ ? dialect_->name() : ""));
        }

        std::expected<CompiledStatement, Error> statement;
        switch (terminal) {
            case Terminal::All:
                statement = compileSelect();
                break;
            case Terminal::One:
                statement = compileOne();
                break;
            case Terminal::Count:
                statement = compileCount();
                break;
            case Terminal::Exists:
                statement = compileExists();
                break;
        }
        if (!statement) {
            return std::unexpected(statement.error());
        }
        auto guard = compileGuardCheck();
        if (!guard) {
            return std::unexpected(guard.error());
        }

        consumed_ = true;

        PreparedTerminal prepared;
        prepared.statement = std::move(*statement);
        prepared.guard = std::move(*guard);
        prepared.options.classification = StatementKind::Select;
        if (terminal == Terminal::All || terminal == Terminal::One) {
            prepared.options.column_types = column_types_;
        }
        return prepared;
    }

    std::expected<void, Error> QueryBase::checkGuardResult_(const std::expected<QueryResult, Error>& guard_result) const {
        if (!guard_result) {
            return std::unexpected(guard_result.error());
        }
        if (!guard_result->rows.empty()) {
            return std::unexpected(guardCheckFailure());
        }
        return {};
    }

    std::expected<std::vector<Row>, Error> QueryBase::rowsOf_(std::expected<QueryResult, Error> result) {
        if (!result) {
            return std::unexpected(result.error());
        }
        return std::move(result->rows);
    }

    std::expected<std::optional<Row>, Error> QueryBase::firstRowOf_(std::expected<QueryResult, Error> result) {
        if (!result) {
            return std::unexpected(result.error());
        }
        if (result->rows.empty()) {
            return std::optional<Row>();
        }
        return std::optional<Row>(std::move(result->rows.front()));
    }

    std::expected<long long, Error> QueryBase::countOf_(std::expected<QueryResult, Error> result) {
        if (!result) {
            return std::unexpected(result.error());
        }
        if (result->rows.empty() || result->rows.front().size() == 0) {
            return std::unexpected(Error(ErrorCode::InternalError, "COUNT query returned no rows"));
        }
        const Value& v = result->rows.front()[0];
        if (const auto* n = std::get_if<long long>(&v)) {
            return *n;
        }
        return std::unexpected(Error(ErrorCode::TypeConversionError, "COUNT query returned a non-integer value: " + valueToDebugString(v)));
    }

    std::expected<bool, Error> QueryBase::existsOf_(std::expected<QueryResult, Error> result) {
        if (!result) {
            return std::unexpected(result.error());
        }
        return !result->rows.empty();
    }

    // --- 同步终结调用 ---

    std::expected<std::vector<Row>, Error> QueryBase::All() {
        auto prepared = prepareTerminal_(Terminal::All, false);
        if (!prepared) return std::unexpected(prepared.error());
        if (prepared->guard) {
            auto checked = checkGuardResult_(executor_->execute(*prepared->guard, ExecutionOptions{StatementKind::Select}));
            if (!checked) return std::unexpected(checked.error());
        }
        return rowsOf_(executor_->execute(prepared->statement, prepared->options));
    }

    std::expected<std::optional<Row>, Error> QueryBase::One() {
        auto prepared = prepareTerminal_(Terminal::One, false);
        if (!prepared) return std::unexpected(prepared.error());
        if (prepared->guard) {
            auto checked = checkGuardResult_(executor_->execute(*prepared->guard, ExecutionOptions{StatementKind::Select}));
            if (!checked) return std::unexpected(checked.error());
        }
        return firstRowOf_(executor_->execute(prepared->statement, prepared->options));
    }

    std::expected<long long, Error> QueryBase::Count() {
        auto prepared = prepareTerminal_(Terminal::Count, false);
        if (!prepared) return std::unexpected(prepared.error());
        if (prepared->guard) {
            auto checked = checkGuardResult_(executor_->execute(*prepared->guard, ExecutionOptions{StatementKind::Select}));
            if (!checked) return std::unexpected(checked.error());
        }
        return countOf_(executor_->execute(prepared->statement, prepared->options));
    }

    std::expected<bool, Error> QueryBase::Exists() {
        auto prepared = prepareTerminal_(Terminal::Exists, false);
        if (!prepared) return std::unexpected(prepared.error());
        if (prepared->guard) {
            auto checked = checkGuardResult_(executor_->execute(*prepared->guard, ExecutionOptions{StatementKind::Select}));
            if (!checked) return std::unexpected(checked.error());
        }
        return existsOf_(executor_->execute(prepared->statement, prepared->options));
    }

    // --- 异步终结调用 ---

    boost::asio::awaitable<std::expected<std::vector<Row>, Error>> QueryBase::AllAsync() {
        auto prepared = prepareTerminal_(Terminal::All, true);
        if (!prepared) co_return std::unexpected(prepared.error());
        if (prepared->guard) {
            auto checked = checkGuardResult_(co_await async_executor_->executeAsync(*prepared->guard, ExecutionOptions{StatementKind::Select}));
            if (!checked) co_return std::unexpected(checked.error());
        }
        co_return rowsOf_(co_await async_executor_->executeAsync(std::move(prepared->statement), std::move(prepared->options)));
    }

    boost::asio::awaitable<std::expected<std::optional<Row>, Error>> QueryBase::OneAsync() {
        auto prepared = prepareTerminal_(Terminal::One, true);
        if (!prepared) co_return std::unexpected(prepared.error());
        if (prepared->guard) {
            auto checked = checkGuardResult_(co_await async_executor_->executeAsync(*prepared->guard, ExecutionOptions{StatementKind::Select}));
            if (!checked) co_return std::unexpected(checked.error());
        }
        co_return firstRowOf_(co_await async_executor_->executeAsync(std::move(prepared->statement), std::move(prepared->options)));
    }

    boost::asio::awaitable<std::expected<long long, Error>> QueryBase::CountAsync() {
        auto prepared = prepareTerminal_(Terminal::Count, true);
        if (!prepared) co_return std::unexpected(prepared.error());
        if (prepared->guard) {
            auto checked = checkGuardResult_(co_await async_executor_->executeAsync(*prepared->guard, ExecutionOptions{StatementKind::Select}));
            if (!checked) co_return std::unexpected(checked.error());
        }
        co_return countOf_(co_await async_executor_->executeAsync(std::move(prepared->statement), std::move(prepared->options)));
    }

    boost::asio::awaitable<std::expected<bool, Error>> QueryBase::ExistsAsync() {
        auto prepared = prepareTerminal_(Terminal::Exists, true);
        if (!prepared) co_return std::unexpected(prepared.error());
        if (prepared->guard) {
            auto checked = checkGuardResult_(co_await async_executor_->executeAsync(*prepared->guard, ExecutionOptions{StatementKind::Select}));
            if (!checked) co_return std::unexpected(checked.error());
        }
        co_return existsOf_(co_await async_executor_->executeAsync(std::move(prepared->statement), std::move(prepared->options)));
    }

}  // namespace cppquery
