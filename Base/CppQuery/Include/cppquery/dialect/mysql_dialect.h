#ifndef cppquery_MYSQL_DIALECT_H
#define cppquery_MYSQL_DIALECT_H

#include "cppquery/dialect/base_dialect.h"

namespace cppquery {

    class MySqlDialect : public BaseDialect {
      public:
        static constexpr const char* NAME = "mysql";

        // placeholder_style 可选 QuestionMark (C API) 或 Format (%s, 部分客户端库)
        static std::expected<std::shared_ptr<const MySqlDialect>, Error> create(DialectVersion version, std::shared_ptr<const TypeMappingRegistry> registry, PlaceholderStyle placeholder_style = PlaceholderStyle::QuestionMark);

        bool supports(DialectFeature feature) const override;
        bool requiresLimitForOffset() const override {
            return true;
        }

        std::string formatArithmetic(const RenderedOperand& left, ArithmeticOp op, const RenderedOperand& right) const override;
        std::expected<std::string, Error> formatLockClause(LockMode mode) const override;
        // ON DUPLICATE KEY UPDATE 按任意唯一键匹配, 冲突目标列不参与渲染
        std::expected<std::string, Error> formatOnConflictClause(const std::vector<std::string>& target_columns, bool do_nothing, const std::vector<std::string>& assignments, const std::optional<std::string>& where_sql) const override;
        std::string formatExcludedColumn(const std::string& column) const override;
        std::string formatInsertVerb(bool ignore_conflicts) const override;

      protected:
        char identifierQuote() const override {
            return '`';
        }
        std::expected<std::string, Error> castTypeName(LogicalType target) const override;

      private:
        MySqlDialect(DialectVersion version, std::shared_ptr<const TypeMappingRegistry> registry, PlaceholderStyle placeholder_style);
    };

}  // namespace cppquery

#endif  // cppquery_MYSQL_DIALECT_H
