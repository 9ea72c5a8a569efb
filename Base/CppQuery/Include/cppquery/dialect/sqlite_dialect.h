#ifndef cppquery_SQLITE_DIALECT_H
#define cppquery_SQLITE_DIALECT_H

#include "cppquery/dialect/base_dialect.h"

namespace cppquery {

    class SqliteDialect : public BaseDialect {
      public:
        static constexpr const char* NAME = "sqlite";

        static std::expected<std::shared_ptr<const SqliteDialect>, Error> create(DialectVersion version, std::shared_ptr<const TypeMappingRegistry> registry);

        bool supports(DialectFeature feature) const override;
        bool requiresLimitForOffset() const override {
            return true;
        }

        std::expected<std::string, Error> formatCast(const std::string& expr_sql, LogicalType target) const override;
        // SQLite 不接受带括号的复合查询操作数
        std::string formatSetOperationOperand(const std::string& operand_sql, bool has_trailing_clauses) const override;
        // 复合运算符同级且左结合, 无需分组
        std::string formatSetOperationGroup(const std::string& compound_sql) const override {
            return compound_sql;
        }

      protected:
        std::expected<std::string, Error> castTypeName(LogicalType target) const override;

      private:
        SqliteDialect(DialectVersion version, std::shared_ptr<const TypeMappingRegistry> registry);
    };

}  // namespace cppquery

#endif  // cppquery_SQLITE_DIALECT_H
