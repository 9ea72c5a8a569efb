#ifndef cppquery_ACTIVE_QUERY_CLAUSES_MIXIN_H
#define cppquery_ACTIVE_QUERY_CLAUSES_MIXIN_H

#include <QDebug>
#include <optional>
#include <string>
#include <vector>

#include "cppquery/expression/expression_builders.h"
#include "cppquery/query/builder_parts/active_query_state.h"

namespace cppquery {

    template <typename Derived>
    class ActiveQueryClausesMixin {
      protected:
        ActiveQueryState& _state() {
            return static_cast<Derived*>(this)->getState_();
        }
        const ActiveQueryState& _state() const {
            return static_cast<const Derived*>(this)->getState_();
        }

      public:
        // 替换 SELECT 列表
        Derived& Select(std::vector<ExprPtr> exprs) {
            _state().select_items.clear();
            for (auto& e : exprs) {
                addSelectItem_(std::move(e), std::nullopt, "Select");
            }
            return static_cast<Derived&>(*this);
        }
        // 追加一个 SELECT 项
        Derived& AddSelect(ExprPtr expr, std::optional<std::string> alias = std::nullopt) {
            addSelectItem_(std::move(expr), std::move(alias), "AddSelect");
            return static_cast<Derived&>(*this);
        }

        Derived& Distinct(bool distinct = true) {
            _state().distinct = distinct;
            return static_cast<Derived&>(*this);
        }

        Derived& GroupBy(ExprPtr expr) {
            if (!expr) {
                qWarning("cppquery ActiveQuery::GroupBy: null expression ignored.");
                return static_cast<Derived&>(*this);
            }
            _state().group_by.push_back(std::move(expr));
            return static_cast<Derived&>(*this);
        }
        Derived& GroupBy(const std::string& column) {
            return GroupBy(col(column));
        }

        Derived& OrderBy(ExprPtr expr, SortDirection direction = SortDirection::Asc, NullsOrder nulls = NullsOrder::Default) {
            return OrderBy(OrderTerm{std::move(expr), direction, nulls});
        }
        Derived& OrderBy(const std::string& column, SortDirection direction = SortDirection::Asc) {
            return OrderBy(OrderTerm{col(column), direction, NullsOrder::Default});
        }
        Derived& OrderBy(OrderTerm term) {
            if (!term.expr) {
                qWarning("cppquery ActiveQuery::OrderBy: null expression ignored.");
                return static_cast<Derived&>(*this);
            }
            _state().order_by.push_back(std::move(term));
            return static_cast<Derived&>(*this);
        }

        // 负数视为取消 LIMIT
        // 负数在编译语句时报告为构造错误
        Derived& Limit(long long limit) {
            _state().limit = limit;
            return static_cast<Derived&>(*this);
        }

        Derived& Offset(long long offset) {
            _state().offset = offset;
            return static_cast<Derived&>(*this);
        }

        Derived& LockForUpdate() {
            _state().lock = LockMode::ForUpdate;
            return static_cast<Derived&>(*this);
        }
        Derived& LockForShare() {
            _state().lock = LockMode::ForShare;
            return static_cast<Derived&>(*this);
        }

        std::optional<long long> getLimit() const {
            return _state().limit;
        }
        std::optional<long long> getOffset() const {
            return _state().offset;
        }
        const std::vector<OrderTerm>& getOrderBy() const {
            return _state().order_by;
        }
        const std::vector<ExprPtr>& getGroupBy() const {
            return _state().group_by;
        }
        const std::vector<SelectItem>& getSelectItems() const {
            return _state().select_items;
        }

      private:
        void addSelectItem_(ExprPtr expr, std::optional<std::string> alias, const char* method) {
            if (!expr) {
                qWarning("cppquery ActiveQuery::%s: null expression ignored.", method);
                return;
            }
            _state().select_items.push_back(SelectItem{std::move(expr), std::move(alias)});
        }
    };

}  // namespace cppquery

#endif  // cppquery_ACTIVE_QUERY_CLAUSES_MIXIN_H
