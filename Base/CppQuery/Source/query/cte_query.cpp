// cppquery/query/cte_query.cpp
#include "cppquery/query/cte_query.h"

#include <QDebug>
#include <algorithm>

#include "cppquery/dialect/render_context.h"
#include "cppquery/expression/expression_builders.h"

namespace cppquery {

    namespace {

        // 递归分支中引用 CTE 自身时使用的名字 (别名优先)
        std::optional<std::string> selfReferenceName(const ActiveQuery& query, const std::string& cte_name) {
            const TableSource& from = query.getFrom();
            if (from.kind == TableSource::Kind::Cte && from.name == cte_name) {
                return from.referenceName();
            }
            for (const auto& join : query.getJoins()) {
                if (join.source.kind == TableSource::Kind::Cte && join.source.name == cte_name) {
                    return join.source.referenceName();
                }
            }
            return std::nullopt;
        }

        bool references(const QuerySource& query, const std::string& name) {
            std::set<std::string> names;
            query.collectCteReferences(names);
            return names.count(name) > 0;
        }

    }  // namespace

    CTEQuery::CTEQuery(DialectPtr dialect) : QueryBase(std::move(dialect)) {
    }

    CTEQuery::CTEQuery(IQueryExecutor* executor) : QueryBase(executor) {
    }

    CTEQuery::CTEQuery(IAsyncQueryExecutor* executor) : QueryBase(executor) {
    }

    bool CTEQuery::isDefined_(const std::string& name) const {
        return std::any_of(ctes_.begin(), ctes_.end(), [&name](const CteDefinition& d) { return d.name == name; });
    }

    void CTEQuery::fail_(Error error, const char* method) {
        qWarning("cppquery CTEQuery::%s: %s", method, error.message.c_str());
        if (!pending_error_) {
            error.clause = "WITH";
            if (dialect()) error.dialect = dialect()->name();
            pending_error_ = std::move(error);
        }
    }

    CTEQuery& CTEQuery::With(const std::string& name, const QueryBase& query, std::vector<std::string> columns) {
        if (name.empty()) {
            fail_(makeConstructionError("CTE name must not be empty"), "With");
            return *this;
        }
        if (isDefined_(name)) {
            fail_(makeConstructionError("CTE '" + name + "' is defined more than once"), "With");
            return *this;
        }
        std::set<std::string> refs;
        query.collectCteReferences(refs);
        for (const auto& ref : refs) {
            if (ref == name) {
                fail_(makeConstructionError("CTE '" + name + "' references itself; use WithRecursive"), "With");
                return *this;
            }
            if (!isDefined_(ref)) {
                fail_(makeConstructionError("CTE '" + name + "' references undefined or later CTE '" + ref + "'"), "With");
                return *this;
            }
        }
        auto count = query.projectedColumnCount();
        if (!columns.empty() && count && *count != columns.size()) {
            fail_(makeConstructionError("CTE '" + name + "' declares " + std::to_string(columns.size()) + " columns but its query projects " + std::to_string(*count)), "With");
            return *this;
        }

        CteDefinition def;
        def.name = name;
        def.columns = std::move(columns);
        def.body = query.clone();
        ctes_.push_back(std::move(def));
        return *this;
    }

    CTEQuery& CTEQuery::WithRecursive(const std::string& name, const ActiveQuery& anchor, const ActiveQuery& recursive, std::vector<std::string> columns, RecursionGuard guard) {
        if (name.empty()) {
            fail_(makeConstructionError("CTE name must not be empty"), "WithRecursive");
            return *this;
        }
        if (isDefined_(name)) {
            fail_(makeConstructionError("CTE '" + name + "' is defined more than once"), "WithRecursive");
            return *this;
        }
        if (guard.max_depth < 0 || guard.depth_column.empty()) {
            fail_(makeConstructionError("Recursion guard needs a non-negative max_depth and a depth column name"), "WithRecursive");
            return *this;
        }
        if (references(anchor, name)) {
            fail_(makeConstructionError("Anchor of recursive CTE '" + name + "' must not reference the CTE itself"), "WithRecursive");
            return *this;
        }
        auto self_name = selfReferenceName(recursive, name);
        if (!self_name) {
            fail_(makeConstructionError("Recursive branch of CTE '" + name + "' must reference the CTE through FromCte or JoinCte"), "WithRecursive");
            return *this;
        }
        for (const QuerySource* part : {static_cast<const QuerySource*>(&anchor), static_cast<const QuerySource*>(&recursive)}) {
            std::set<std::string> refs;
            part->collectCteReferences(refs);
            for (const auto& ref : refs) {
                if (ref != name && !isDefined_(ref)) {
                    fail_(makeConstructionError("CTE '" + name + "' references undefined or later CTE '" + ref + "'"), "WithRecursive");
                    return *this;
                }
            }
        }
        if (anchor.hasTrailingClauses() || recursive.hasTrailingClauses()) {
            fail_(makeConstructionError("Branches of recursive CTE '" + name + "' must not carry ORDER BY, LIMIT, OFFSET or locking clauses"), "WithRecursive");
            return *this;
        }
        auto anchor_count = anchor.projectedColumnCount();
        auto recursive_count = recursive.projectedColumnCount();
        // 深度列追加在投影末尾, 递归分支的列数必须在构造时可知
        if (!recursive_count) {
            fail_(makeConstructionError("Recursive branch of CTE '" + name + "' must select explicit columns, not *"), "WithRecursive");
            return *this;
        }
        if (anchor_count && recursive_count && *anchor_count != *recursive_count) {
            fail_(makeConstructionError("Anchor and recursive branch of CTE '" + name + "' project " + std::to_string(*anchor_count) + " and " + std::to_string(*recursive_count) + " columns"), "WithRecursive");
            return *this;
        }
        if (!columns.empty() && anchor_count && *anchor_count != columns.size()) {
            fail_(makeConstructionError("CTE '" + name + "' declares " + std::to_string(columns.size()) + " columns but its anchor projects " + std::to_string(*anchor_count)), "WithRecursive");
            return *this;
        }

        // 注入深度计数: 锚点 0, 递归分支 depth + 1, 并以 depth 限制递归
        ActiveQuery guarded_anchor = anchor;
        if (guarded_anchor.getSelectItems().empty()) {
            guarded_anchor.AddSelect(star());
        }
        guarded_anchor.AddSelect(lit(Value(0LL), LogicalType::Integer), guard.depth_column);

        ActiveQuery guarded_recursive = recursive;
        ExprPtr depth = col(*self_name, guard.depth_column);
        guarded_recursive.AddSelect(add(depth, lit(Value(1LL), LogicalType::Integer)), guard.depth_column);
        if (guard.policy == RecursionGuard::Policy::Truncate) {
            guarded_recursive.Where(lt(depth, lit(Value(guard.max_depth), LogicalType::Integer)));
        } else {
            // 多算一层, 由探测语句判断是否越界
            guarded_recursive.Where(le(depth, lit(Value(guard.max_depth), LogicalType::Integer)));
        }

        CteDefinition def;
        def.name = name;
        def.columns = std::move(columns);
        if (!def.columns.empty()) {
            def.columns.push_back(guard.depth_column);
        }
        def.recursive = true;
        def.anchor = guarded_anchor.snapshot();
        def.recursive_part = guarded_recursive.snapshot();
        def.guard = std::move(guard);
        ctes_.push_back(std::move(def));
        return *this;
    }

    CTEQuery& CTEQuery::Query(const QueryBase& main) {
        main_ = main.clone();
        for (const auto& [column, type] : main.columnTypes()) {
            column_types_.emplace(column, type);
        }
        return *this;
    }

    CTEQuery& CTEQuery::ColumnTypes(std::map<std::string, LogicalType> types) {
        for (auto& [column, type] : types) {
            column_types_[column] = type;
        }
        return *this;
    }

    std::vector<std::string> CTEQuery::cteNames() const {
        std::vector<std::string> names;
        for (const auto& def : ctes_) names.push_back(def.name);
        return names;
    }

    std::shared_ptr<const QueryBase> CTEQuery::clone() const {
        return std::make_shared<const CTEQuery>(*this);
    }

    std::expected<void, Error> CTEQuery::validate_(const Dialect& dialect) const {
        if (pending_error_) {
            return std::unexpected(*pending_error_);
        }
        if (!main_) {
            return std::unexpected(makeConstructionError("CTE query has no main query", "WITH", dialect.name()));
        }
        std::set<std::string> refs;
        main_->collectCteReferences(refs);
        for (const auto& ref : refs) {
            if (!isDefined_(ref)) {
                return std::unexpected(makeConstructionError("Main query references undefined CTE '" + ref + "'", "WITH", dialect.name()));
            }
        }
        return {};
    }

    std::expected<std::string, Error> CTEQuery::renderWithClause_(RenderContext& ctx) const {
        auto valid = validate_(ctx.dialect());
        if (!valid) {
            return std::unexpected(valid.error());
        }
        if (ctes_.empty()) {
            return std::string();
        }

        ClauseScope scope(ctx, "WITH");
        auto cte_supported = ctx.requireFeature(DialectFeature::Cte);
        if (!cte_supported) return std::unexpected(cte_supported.error());

        bool any_recursive = false;
        std::vector<std::string> definitions;
        for (const auto& def : ctes_) {
            std::string body;
            if (def.recursive) {
                any_recursive = true;
                auto recursive_supported = ctx.requireFeature(DialectFeature::RecursiveCte);
                if (!recursive_supported) return std::unexpected(recursive_supported.error());
                auto anchor_sql = def.anchor->renderInto(ctx);
                if (!anchor_sql) return anchor_sql;
                auto recursive_sql = def.recursive_part->renderInto(ctx);
                if (!recursive_sql) return recursive_sql;
                body = *anchor_sql + " UNION ALL " + *recursive_sql;
            } else {
                auto body_sql = def.body->renderInto(ctx);
                if (!body_sql) return body_sql;
                body = std::move(*body_sql);
            }
            definitions.push_back(ctx.dialect().formatCte(def.name, def.recursive, def.columns, body));
        }
        return ctx.dialect().formatWithClause(any_recursive, definitions);
    }

    std::expected<std::string, Error> CTEQuery::renderMain_(RenderContext& ctx) const {
        return main_->renderInto(ctx);
    }

    std::expected<std::string, Error> CTEQuery::renderInto(RenderContext& ctx) const {
        auto with = renderWithClause_(ctx);
        if (!with) return with;
        auto main = renderMain_(ctx);
        if (!main) return main;
        return with->empty() ? *main : *with + " " + *main;
    }

    std::expected<CompiledStatement, Error> CTEQuery::compileCount() const {
        return compileWith([this](RenderContext& ctx) -> std::expected<std::string, Error> {
            auto with = renderWithClause_(ctx);
            if (!with) return with;
            auto main = renderMain_(ctx);
            if (!main) return main;
            std::string sql = "SELECT COUNT(*) FROM " + ctx.dialect().formatSubquery(*main) + " AS " + ctx.dialect().formatIdentifier("cppquery_count");
            return with->empty() ? sql : *with + " " + sql;
        });
    }

    std::expected<CompiledStatement, Error> CTEQuery::compileExists() const {
        return compileWith([this](RenderContext& ctx) -> std::expected<std::string, Error> {
            auto with = renderWithClause_(ctx);
            if (!with) return with;
            auto main = renderMain_(ctx);
            if (!main) return main;
            auto limit = ctx.dialect().formatLimitOffset(ctx, 1, std::nullopt);
            if (!limit) return limit;
            std::string sql = "SELECT " + ctx.dialect().formatExistsProjection() + " FROM " + ctx.dialect().formatSubquery(*main) + " AS " + ctx.dialect().formatIdentifier("cppquery_exists") + " " + *limit;
            return with->empty() ? sql : *with + " " + sql;
        });
    }

    std::expected<std::optional<CompiledStatement>, Error> CTEQuery::compileGuardCheck() const {
        const bool needs_guard = std::any_of(ctes_.begin(), ctes_.end(), [](const CteDefinition& d) { return d.recursive && d.guard.policy == RecursionGuard::Policy::Fail; });
        if (!needs_guard) {
            return std::optional<CompiledStatement>();
        }
        // 任一 Fail 守卫的 CTE 中出现 depth > max_depth 的行即越界
        auto guard = compileWith([this](RenderContext& ctx) -> std::expected<std::string, Error> {
            auto with = renderWithClause_(ctx);
            if (!with) return with;
            std::vector<std::string> parts;
            for (const auto& def : ctes_) {
                if (!def.recursive || def.guard.policy != RecursionGuard::Policy::Fail) continue;
                auto bound = ctx.bind(Value(def.guard.max_depth), LogicalType::Integer);
                if (!bound) return bound;
                parts.push_back("SELECT 1 FROM " + ctx.dialect().formatIdentifier(def.name) + " WHERE " + ctx.dialect().formatColumnReference(def.name, def.guard.depth_column) + " > " + *bound);
            }
            std::string sql;
            for (std::size_t i = 0; i < parts.size(); ++i) {
                if (i) sql += " UNION ALL ";
                sql += parts[i];
            }
            auto limit = ctx.dialect().formatLimitOffset(ctx, 1, std::nullopt);
            if (!limit) return limit;
            return *with + " " + sql + " " + *limit;
        });
        if (!guard) {
            return std::unexpected(guard.error());
        }
        return std::optional<CompiledStatement>(std::move(*guard));
    }

    Error CTEQuery::guardCheckFailure() const {
        std::string names;
        for (const auto& def : ctes_) {
            if (!def.recursive || def.guard.policy != RecursionGuard::Policy::Fail) continue;
            if (!names.empty()) names += ", ";
            names += def.name + " (max depth " + std::to_string(def.guard.max_depth) + ")";
        }
        Error err(ErrorCode::RecursionLimitExceeded, "Recursive CTE exceeded its depth bound, the data is likely cyclic: " + names);
        err.clause = "WITH";
        if (dialect()) err.dialect = dialect()->name();
        return err;
    }

    std::optional<std::size_t> CTEQuery::projectedColumnCount() const {
        return main_ ? main_->projectedColumnCount() : std::nullopt;
    }

    std::vector<std::string> CTEQuery::projectedColumnNames() const {
        return main_ ? main_->projectedColumnNames() : std::vector<std::string>();
    }

    bool CTEQuery::hasTrailingClauses() const {
        return !ctes_.empty() || (main_ && main_->hasTrailingClauses());
    }

    void CTEQuery::collectCteReferences(std::set<std::string>& names) const {
        std::set<std::string> inner;
        for (const auto& def : ctes_) {
            if (def.body) def.body->collectCteReferences(inner);
            if (def.anchor) def.anchor->collectCteReferences(inner);
            if (def.recursive_part) def.recursive_part->collectCteReferences(inner);
        }
        if (main_) main_->collectCteReferences(inner);
        for (const auto& name : inner) {
            if (!isDefined_(name)) names.insert(name);
        }
    }

}  // namespace cppquery
