// cppquery/dialect/sqlite_dialect.cpp
#include "cppquery/dialect/sqlite_dialect.h"

namespace cppquery {

    SqliteDialect::SqliteDialect(DialectVersion version, std::shared_ptr<const TypeMappingRegistry> registry) : BaseDialect(NAME, version, std::move(registry), PlaceholderStyle::QuestionMark) {
    }

    std::expected<std::shared_ptr<const SqliteDialect>, Error> SqliteDialect::create(DialectVersion version, std::shared_ptr<const TypeMappingRegistry> registry) {
        auto valid = validateRegistry(NAME, registry);
        if (!valid) {
            return std::unexpected(valid.error());
        }
        return std::shared_ptr<const SqliteDialect>(new SqliteDialect(version, std::move(registry)));
    }

    bool SqliteDialect::supports(DialectFeature feature) const {
        const DialectVersion v = version();
        switch (feature) {
            case DialectFeature::Cte:
            case DialectFeature::RecursiveCte:
                return v >= DialectVersion{3, 8, 3};
            case DialectFeature::WindowFunctions:
                return v >= DialectVersion{3, 25, 0};
            case DialectFeature::AggregateFilter:
            case DialectFeature::NullsOrdering:
                return v >= DialectVersion{3, 30, 0};
            case DialectFeature::Returning:
                return v >= DialectVersion{3, 35, 0};
            case DialectFeature::Upsert:
                return v >= DialectVersion{3, 24, 0};
            case DialectFeature::RightJoin:
            case DialectFeature::FullJoin:
                return v >= DialectVersion{3, 39, 0};
            case DialectFeature::JsonFunctions:
                return v >= DialectVersion{3, 38, 0};
            case DialectFeature::Savepoint:
            case DialectFeature::IntersectExcept:
                return true;
            case DialectFeature::RowLocking:
                return false;
        }
        return false;
    }

    std::expected<std::string, Error> SqliteDialect::castTypeName(LogicalType target) const {
        switch (target) {
            case LogicalType::Integer:
            case LogicalType::Boolean:
                return std::string("INTEGER");
            case LogicalType::Real:
                return std::string("REAL");
            case LogicalType::Blob:
                return std::string("BLOB");
            default:
                return std::string("TEXT");
        }
    }

    std::expected<std::string, Error> SqliteDialect::formatCast(const std::string& expr_sql, LogicalType target) const {
        if (target == LogicalType::Json) {
            // SQLite 没有 JSON 列类型, 用 json() 规范化文本
            if (!supports(DialectFeature::JsonFunctions)) {
                return std::unexpected(capabilityError(DialectFeature::JsonFunctions, "CAST"));
            }
            return "json(" + expr_sql + ")";
        }
        return BaseDialect::formatCast(expr_sql, target);
    }

    std::string SqliteDialect::formatSetOperationOperand(const std::string& operand_sql, bool has_trailing_clauses) const {
        if (has_trailing_clauses) {
            // 操作数自带 ORDER BY / LIMIT 时只能作为子查询出现
            return "SELECT * FROM (" + operand_sql + ")";
        }
        return operand_sql;
    }

}  // namespace cppquery
