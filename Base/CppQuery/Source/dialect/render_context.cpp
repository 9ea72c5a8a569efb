// cppquery/dialect/render_context.cpp
#include "cppquery/dialect/render_context.h"

#include "cppquery/dialect/sql_renderer.h"
#include "cppquery/type_mapping.h"

namespace cppquery {

    RenderContext::RenderContext(const Dialect& dialect) : dialect_(dialect) {
    }

    std::expected<std::string, Error> RenderContext::bind(const Value& value, std::optional<LogicalType> type) {
        if (isNull(value)) {
            return bindRaw(cppquery_sqldriver::SqlValue());
        }
        std::optional<LogicalType> effective = type ? type : inferLogicalType(value);
        if (!effective) {
            return std::unexpected(constructionError("Cannot determine the logical type of a literal value"));
        }
        auto converted = dialect_.typeMappings().toDatabase(dialect_.name(), value, *effective);
        if (!converted) {
            Error err = converted.error();
            if (err.clause.empty() || err.clause == "bind") err.clause = clause_;
            err.dialect = dialect_.name();
            return std::unexpected(err);
        }
        return bindRaw(std::move(*converted));
    }

    std::string RenderContext::bindRaw(cppquery_sqldriver::SqlValue value) {
        params_.push_back(std::move(value));
        return dialect_.formatLiteralPlaceholder(params_.size());
    }

    std::vector<cppquery_sqldriver::SqlValue> RenderContext::takeParams() {
        std::vector<cppquery_sqldriver::SqlValue> out;
        out.swap(params_);
        return out;
    }

    std::expected<std::string, Error> RenderContext::render(const ExprPtr& expr) {
        SqlRenderer renderer(*this);
        return renderer.render(expr);
    }

    std::expected<std::string, Error> RenderContext::renderSelectItem(const ExprPtr& expr, const std::optional<std::string>& alias) {
        auto sql = render(expr);
        if (!sql) {
            return sql;
        }
        std::optional<std::string> effective_alias = alias;
        if (!effective_alias) {
            if (const auto* column = dynamic_cast<const ColumnExpression*>(expr.get())) {
                effective_alias = column->alias();
            }
        }
        if (effective_alias && !effective_alias->empty()) {
            return *sql + " AS " + dialect_.formatIdentifier(*effective_alias);
        }
        return sql;
    }

    std::expected<std::string, Error> RenderContext::renderOrderTerm(const OrderTerm& term) {
        if (term.nulls != NullsOrder::Default) {
            auto supported = requireFeature(DialectFeature::NullsOrdering);
            if (!supported) {
                return std::unexpected(supported.error());
            }
        }
        auto sql = render(term.expr);
        if (!sql) {
            return sql;
        }
        return dialect_.formatOrderTerm(*sql, term.direction, term.nulls);
    }

    Error RenderContext::constructionError(const std::string& message) const {
        return makeConstructionError(message, clause_, dialect_.name());
    }

    Error RenderContext::capabilityError(const std::string& message) const {
        return makeCapabilityError(message, clause_, dialect_.name());
    }

    std::expected<void, Error> RenderContext::requireFeature(DialectFeature feature) const {
        if (dialect_.supports(feature)) {
            return {};
        }
        return std::unexpected(capabilityError(std::string(dialectFeatureName(feature)) + " is not supported by " + dialect_.name() + " " + dialect_.version().toString()));
    }

}  // namespace cppquery
