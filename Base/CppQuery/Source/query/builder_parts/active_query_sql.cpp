// cppquery/query/builder_parts/active_query_sql.cpp
#include <QDebug>

#include "cppquery/dialect/render_context.h"
#include "cppquery/expression/cte_reference_collector.h"
#include "cppquery/expression/expression_builders.h"
#include "cppquery/query/active_query.h"

namespace cppquery {

    namespace {

        std::string joinStrings(const std::vector<std::string>& parts, const char* sep) {
            std::string out;
            for (std::size_t i = 0; i < parts.size(); ++i) {
                if (i) out += sep;
                out += parts[i];
            }
            return out;
        }

    }  // namespace

    std::expected<std::string, Error> ActiveQuery::renderSource_(RenderContext& ctx, const TableSource& source) {
        switch (source.kind) {
            case TableSource::Kind::Table:
                return ctx.dialect().formatTableReference(source.name, source.alias);
            case TableSource::Kind::Cte:
                return ctx.render(cteRef(source.name, source.alias));
            case TableSource::Kind::Subquery: {
                if (!source.subquery) {
                    return std::unexpected(ctx.constructionError("Derived table without a query"));
                }
                if (!source.alias || source.alias->empty()) {
                    return std::unexpected(ctx.constructionError("Derived table requires an alias"));
                }
                auto sql = source.subquery->renderInto(ctx);
                if (!sql) return sql;
                return ctx.dialect().formatSubquery(*sql) + " AS " + ctx.dialect().formatIdentifier(*source.alias);
            }
            case TableSource::Kind::None:
                break;
        }
        return std::unexpected(ctx.constructionError("Empty table source"));
    }

    std::expected<std::string, Error> ActiveQuery::renderState_(RenderContext& ctx, const ActiveQueryState& state, const std::optional<std::string>& projection) {
        std::string sql = "SELECT ";
        if (state.distinct) {
            sql += "DISTINCT ";
        }

        {
            ClauseScope scope(ctx, "SELECT");
            if (projection) {
                sql += *projection;
            } else if (state.select_items.empty()) {
                sql += "*";
            } else {
                std::vector<std::string> items;
                items.reserve(state.select_items.size());
                for (const auto& item : state.select_items) {
                    auto rendered = ctx.renderSelectItem(item.expr, item.alias);
                    if (!rendered) return rendered;
                    items.push_back(std::move(*rendered));
                }
                sql += joinStrings(items, ", ");
            }
        }

        if (!state.from.empty()) {
            ClauseScope scope(ctx, "FROM");
            auto from = renderSource_(ctx, state.from);
            if (!from) return from;
            sql += " FROM " + *from;
        } else if (!state.joins.empty()) {
            return std::unexpected(makeConstructionError("JOIN without a FROM source", "JOIN", ctx.dialect().name()));
        }

        for (const auto& join : state.joins) {
            ClauseScope scope(ctx, "JOIN");
            auto table = renderSource_(ctx, join.source);
            if (!table) return table;
            std::optional<std::string> on_sql;
            if (join.on) {
                auto on = ctx.render(join.on);
                if (!on) return on;
                on_sql = std::move(*on);
            }
            auto rendered = ctx.dialect().formatJoin(join.type, *table, on_sql);
            if (!rendered) return rendered;
            sql += " " + *rendered;
        }

        if (state.where) {
            ClauseScope scope(ctx, "WHERE");
            auto where = ctx.render(state.where);
            if (!where) return where;
            sql += " WHERE " + *where;
        }

        if (!state.group_by.empty()) {
            ClauseScope scope(ctx, "GROUP BY");
            std::vector<std::string> groups;
            for (const auto& g : state.group_by) {
                auto rendered = ctx.render(g);
                if (!rendered) return rendered;
                groups.push_back(std::move(*rendered));
            }
            sql += " GROUP BY " + joinStrings(groups, ", ");
        }

        if (state.having) {
            ClauseScope scope(ctx, "HAVING");
            if (state.group_by.empty()) {
                qWarning("cppquery ActiveQuery: HAVING without GROUP BY treats the whole result as one group.");
            }
            auto having = ctx.render(state.having);
            if (!having) return having;
            sql += " HAVING " + *having;
        }

        if (!state.order_by.empty()) {
            ClauseScope scope(ctx, "ORDER BY");
            std::vector<std::string> terms;
            for (const auto& term : state.order_by) {
                auto rendered = ctx.renderOrderTerm(term);
                if (!rendered) return rendered;
                terms.push_back(std::move(*rendered));
            }
            sql += " ORDER BY " + joinStrings(terms, ", ");
        }

        if (state.limit || state.offset) {
            ClauseScope scope(ctx, "LIMIT");
            auto limit = ctx.dialect().formatLimitOffset(ctx, state.limit, state.offset);
            if (!limit) return limit;
            if (!limit->empty()) sql += " " + *limit;
        }

        if (state.lock != LockMode::None) {
            auto lock = ctx.dialect().formatLockClause(state.lock);
            if (!lock) return lock;
            if (!lock->empty()) sql += " " + *lock;
        }

        return sql;
    }

    std::expected<std::string, Error> ActiveQuery::renderInto(RenderContext& ctx) const {
        return renderState_(ctx, state_, std::nullopt);
    }

    std::expected<CompiledStatement, Error> ActiveQuery::compileOne() const {
        if (state_.limit) {
            return compileSelect();
        }
        ActiveQueryState one = state_;
        one.limit = 1;
        return compileWith([&one](RenderContext& ctx) { return renderState_(ctx, one, std::nullopt); });
    }

    std::expected<CompiledStatement, Error> ActiveQuery::compileCount() const {
        // DISTINCT / GROUP BY / HAVING / 分页会改变行数, 只能对子查询计数
        if (state_.distinct || !state_.group_by.empty() || state_.having || state_.limit || state_.offset) {
            return QueryBase::compileCount();
        }
        ActiveQueryState counting = state_;
        counting.select_items.clear();
        counting.order_by.clear();
        counting.lock = LockMode::None;
        return compileWith([&counting](RenderContext& ctx) { return renderState_(ctx, counting, std::string("COUNT(*)")); });
    }

    std::expected<CompiledStatement, Error> ActiveQuery::compileExists() const {
        ActiveQueryState exists_state = state_;
        exists_state.order_by.clear();
        if (!exists_state.limit || *exists_state.limit > 1) {
            exists_state.limit = 1;
        }
        return compileWith([&exists_state](RenderContext& ctx) { return renderState_(ctx, exists_state, ctx.dialect().formatExistsProjection()); });
    }

    std::optional<std::size_t> ActiveQuery::projectedColumnCount() const {
        if (state_.select_items.empty()) {
            return std::nullopt;
        }
        for (const auto& item : state_.select_items) {
            const auto* column = dynamic_cast<const ColumnExpression*>(item.expr.get());
            if (column && column->isWildcard()) {
                return std::nullopt;
            }
        }
        return state_.select_items.size();
    }

    std::vector<std::string> ActiveQuery::projectedColumnNames() const {
        std::vector<std::string> names;
        for (const auto& item : state_.select_items) {
            if (item.alias) {
                names.push_back(*item.alias);
                continue;
            }
            const auto* column = dynamic_cast<const ColumnExpression*>(item.expr.get());
            if (column && !column->isWildcard()) {
                names.push_back(column->alias().value_or(column->name()));
            } else {
                names.emplace_back();
            }
        }
        return names;
    }

    bool ActiveQuery::hasTrailingClauses() const {
        return !state_.order_by.empty() || state_.limit.has_value() || state_.offset.has_value() || state_.lock != LockMode::None;
    }

    void ActiveQuery::collectCteReferences(std::set<std::string>& names) const {
        auto collect_source = [&names](const TableSource& source) {
            if (source.kind == TableSource::Kind::Cte) {
                names.insert(source.name);
            } else if (source.kind == TableSource::Kind::Subquery && source.subquery) {
                source.subquery->collectCteReferences(names);
            }
        };
        CteReferenceCollector collector(names);
        collect_source(state_.from);
        for (const auto& item : state_.select_items) collector.collect(item.expr);
        for (const auto& join : state_.joins) {
            collect_source(join.source);
            collector.collect(join.on);
        }
        collector.collect(state_.where);
        for (const auto& g : state_.group_by) collector.collect(g);
        collector.collect(state_.having);
        for (const auto& term : state_.order_by) collector.collect(term.expr);
    }

}  // namespace cppquery
