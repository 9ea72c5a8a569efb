#ifndef cppquery_RENDER_CONTEXT_H
#define cppquery_RENDER_CONTEXT_H

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "cppquery/dialect/dialect.h"
#include "cppquery/error.h"
#include "cppquery/expression/expression.h"
#include "cppquery_sqldriver/sql_value.h"

namespace cppquery {

    // 一次语句渲染的可变状态: 参数列表与当前子句.
    // 参数按占位符在最终 SQL 中从左到右的顺序追加
    class RenderContext {
      public:
        explicit RenderContext(const Dialect& dialect);

        const Dialect& dialect() const {
            return dialect_;
        }

        // 经类型映射 to_database 转换后追加参数, 返回方言占位符.
        // type 为空时按值推断; null 直接绑定为 NULL
        std::expected<std::string, Error> bind(const Value& value, std::optional<LogicalType> type = std::nullopt);
        // 绑定已是驱动层表示的值 (LIMIT / OFFSET 等内部参数)
        std::string bindRaw(cppquery_sqldriver::SqlValue value);

        std::size_t parameterCount() const {
            return params_.size();
        }
        const std::vector<cppquery_sqldriver::SqlValue>& params() const {
            return params_;
        }
        std::vector<cppquery_sqldriver::SqlValue> takeParams();

        // 渲染一个表达式节点
        std::expected<std::string, Error> render(const ExprPtr& expr);
        // SELECT 列表项: 表达式加可选别名 (列节点自带的别名在无显式别名时生效)
        std::expected<std::string, Error> renderSelectItem(const ExprPtr& expr, const std::optional<std::string>& alias);
        // ORDER BY 项, NULLS FIRST/LAST 需要方言支持
        std::expected<std::string, Error> renderOrderTerm(const OrderTerm& term);

        const std::string& clause() const {
            return clause_;
        }
        void setClause(std::string clause) {
            clause_ = std::move(clause);
        }

        // 生成带方言与子句信息的错误
        Error constructionError(const std::string& message) const;
        Error capabilityError(const std::string& message) const;
        std::expected<void, Error> requireFeature(DialectFeature feature) const;

      private:
        const Dialect& dialect_;
        std::vector<cppquery_sqldriver::SqlValue> params_;
        std::string clause_;
    };

    // 在作用域内切换 RenderContext 的当前子句
    class ClauseScope {
      public:
        ClauseScope(RenderContext& ctx, std::string clause) : ctx_(ctx), previous_(ctx.clause()) {
            ctx_.setClause(std::move(clause));
        }
        ~ClauseScope() {
            ctx_.setClause(std::move(previous_));
        }
        ClauseScope(const ClauseScope&) = delete;
        ClauseScope& operator=(const ClauseScope&) = delete;

      private:
        RenderContext& ctx_;
        std::string previous_;
    };

}  // namespace cppquery

#endif  // cppquery_RENDER_CONTEXT_H
