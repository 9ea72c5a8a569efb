// cppquery/dialect/mysql_dialect.cpp
#include "cppquery/dialect/mysql_dialect.h"

namespace cppquery {

    MySqlDialect::MySqlDialect(DialectVersion version, std::shared_ptr<const TypeMappingRegistry> registry, PlaceholderStyle placeholder_style) : BaseDialect(NAME, version, std::move(registry), placeholder_style) {
    }

    std::expected<std::shared_ptr<const MySqlDialect>, Error> MySqlDialect::create(DialectVersion version, std::shared_ptr<const TypeMappingRegistry> registry, PlaceholderStyle placeholder_style) {
        if (placeholder_style == PlaceholderStyle::Numbered) {
            return std::unexpected(makeConstructionError("MySQL does not accept numbered placeholders", "", NAME));
        }
        auto valid = validateRegistry(NAME, registry);
        if (!valid) {
            return std::unexpected(valid.error());
        }
        return std::shared_ptr<const MySqlDialect>(new MySqlDialect(version, std::move(registry), placeholder_style));
    }

    bool MySqlDialect::supports(DialectFeature feature) const {
        const DialectVersion v = version();
        switch (feature) {
            case DialectFeature::Cte:
            case DialectFeature::RecursiveCte:
                return v >= DialectVersion{8, 0, 1};
            case DialectFeature::WindowFunctions:
                return v >= DialectVersion{8, 0, 2};
            case DialectFeature::IntersectExcept:
                return v >= DialectVersion{8, 0, 31};
            case DialectFeature::JsonFunctions:
                return v >= DialectVersion{5, 7, 8};
            case DialectFeature::RowLocking:
            case DialectFeature::Savepoint:
            case DialectFeature::RightJoin:
            case DialectFeature::Upsert:
                return true;
            case DialectFeature::Returning:
            case DialectFeature::FullJoin:
            case DialectFeature::AggregateFilter:
            case DialectFeature::NullsOrdering:
                return false;
        }
        return false;
    }

    std::expected<std::string, Error> MySqlDialect::castTypeName(LogicalType target) const {
        switch (target) {
            case LogicalType::Integer:
            case LogicalType::Boolean:
                return std::string("SIGNED");
            case LogicalType::Real:
                return std::string("DOUBLE");
            case LogicalType::Decimal:
                return std::string("DECIMAL(38,10)");
            case LogicalType::Text:
                return std::string("CHAR");
            case LogicalType::Blob:
                return std::string("BINARY");
            case LogicalType::Date:
                return std::string("DATE");
            case LogicalType::Time:
                return std::string("TIME(3)");
            case LogicalType::Timestamp:
                return std::string("DATETIME(3)");
            case LogicalType::Uuid:
                return std::string("CHAR(36)");
            case LogicalType::Json:
                return std::string("JSON");
        }
        return std::string("CHAR");
    }

    std::string MySqlDialect::formatArithmetic(const RenderedOperand& left, ArithmeticOp op, const RenderedOperand& right) const {
        // MySQL 默认把 || 当作逻辑或
        if (op == ArithmeticOp::Concat) {
            return "CONCAT(" + left.sql + ", " + right.sql + ")";
        }
        return BaseDialect::formatArithmetic(left, op, right);
    }

    std::expected<std::string, Error> MySqlDialect::formatLockClause(LockMode mode) const {
        if (mode == LockMode::ForShare && version() < DialectVersion{8, 0, 1}) {
            return std::string("LOCK IN SHARE MODE");
        }
        return BaseDialect::formatLockClause(mode);
    }

    std::expected<std::string, Error> MySqlDialect::formatOnConflictClause(const std::vector<std::string>& /*target_columns*/, bool do_nothing, const std::vector<std::string>& assignments, const std::optional<std::string>& where_sql) const {
        // DO NOTHING 由 INSERT IGNORE 表达
        if (do_nothing) {
            return std::string();
        }
        if (where_sql) {
            return std::unexpected(makeCapabilityError("ON DUPLICATE KEY UPDATE does not take a WHERE condition", "ON CONFLICT", NAME));
        }
        if (assignments.empty()) {
            return std::unexpected(makeConstructionError("ON DUPLICATE KEY UPDATE has no assignments", "ON CONFLICT", NAME));
        }
        std::string sql = "ON DUPLICATE KEY UPDATE ";
        for (size_t i = 0; i < assignments.size(); ++i) {
            if (i) sql += ", ";
            sql += assignments[i];
        }
        return sql;
    }

    std::string MySqlDialect::formatExcludedColumn(const std::string& column) const {
        return "VALUES(" + formatIdentifier(column) + ")";
    }

    std::string MySqlDialect::formatInsertVerb(bool ignore_conflicts) const {
        return ignore_conflicts ? "INSERT IGNORE INTO" : "INSERT INTO";
    }

}  // namespace cppquery
