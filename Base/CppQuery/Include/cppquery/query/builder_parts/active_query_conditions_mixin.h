#ifndef cppquery_ACTIVE_QUERY_CONDITIONS_MIXIN_H
#define cppquery_ACTIVE_QUERY_CONDITIONS_MIXIN_H

#include <QDebug>
#include <vector>

#include "cppquery/expression/expression.h"
#include "cppquery/expression/expression_builders.h"
#include "cppquery/query/builder_parts/active_query_state.h"

namespace cppquery {

    // 把 child 追加到 AND 链上, 两侧已有的 AND 节点会被展开,
    // 使 Where(a).Where(b) 与 Where(and_(a, b)) 得到同样的树
    inline ExprPtr conjoin(const ExprPtr& existing, const ExprPtr& child) {
        if (!existing) return child;
        std::vector<ExprPtr> children;
        auto append = [&children](const ExprPtr& e) {
            const auto* logical = dynamic_cast<const LogicalExpression*>(e.get());
            if (logical && logical->op() == LogicalOp::And) {
                children.insert(children.end(), logical->children().begin(), logical->children().end());
            } else {
                children.push_back(e);
            }
        };
        append(existing);
        append(child);
        return and_(std::move(children));
    }

    template <typename Derived>
    class ActiveQueryConditionsMixin {
      protected:
        ActiveQueryState& _state() {
            return static_cast<Derived*>(this)->getState_();
        }
        const ActiveQueryState& _state() const {
            return static_cast<const Derived*>(this)->getState_();
        }

      public:
        // 与已有 WHERE 条件做 AND, 从不替换
        Derived& Where(ExprPtr condition) {
            if (!condition) {
                qWarning("cppquery ActiveQuery::Where: null condition ignored.");
                return static_cast<Derived&>(*this);
            }
            _state().where = conjoin(_state().where, condition);
            return static_cast<Derived&>(*this);
        }

        // (已有条件) OR condition
        Derived& OrWhere(ExprPtr condition) {
            if (!condition) {
                qWarning("cppquery ActiveQuery::OrWhere: null condition ignored.");
                return static_cast<Derived&>(*this);
            }
            if (!_state().where) {
                _state().where = std::move(condition);
            } else {
                _state().where = or_(_state().where, std::move(condition));
            }
            return static_cast<Derived&>(*this);
        }

        Derived& WhereNot(ExprPtr condition) {
            if (!condition) {
                qWarning("cppquery ActiveQuery::WhereNot: null condition ignored.");
                return static_cast<Derived&>(*this);
            }
            return Where(not_(std::move(condition)));
        }

        Derived& Having(ExprPtr condition) {
            if (!condition) {
                qWarning("cppquery ActiveQuery::Having: null condition ignored.");
                return static_cast<Derived&>(*this);
            }
            _state().having = conjoin(_state().having, condition);
            return static_cast<Derived&>(*this);
        }

        const ExprPtr& getWhere() const {
            return _state().where;
        }
        const ExprPtr& getHaving() const {
            return _state().having;
        }
    };

}  // namespace cppquery

#endif  // cppquery_ACTIVE_QUERY_CONDITIONS_MIXIN_H
