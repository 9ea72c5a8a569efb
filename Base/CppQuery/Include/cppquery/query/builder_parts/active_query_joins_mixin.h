#ifndef cppquery_ACTIVE_QUERY_JOINS_MIXIN_H
#define cppquery_ACTIVE_QUERY_JOINS_MIXIN_H

#include <QDebug>
#include <optional>
#include <string>

#include "cppquery/query/builder_parts/active_query_state.h"

namespace cppquery {

    template <typename Derived>
    class ActiveQueryJoinsMixin {
      protected:
        ActiveQueryState& _state() {
            return static_cast<Derived*>(this)->getState_();
        }
        const ActiveQueryState& _state() const {
            return static_cast<const Derived*>(this)->getState_();
        }

      public:
        // JOIN 类型合法性 (ON 的有无, RIGHT / FULL 的方言支持) 在渲染时检查
        Derived& Join(JoinType type, TableSource source, ExprPtr on = nullptr) {
            if (source.empty()) {
                qWarning("cppquery ActiveQuery::Join: empty join source ignored.");
                return static_cast<Derived&>(*this);
            }
            _state().joins.push_back(JoinClause{type, std::move(source), std::move(on)});
            return static_cast<Derived&>(*this);
        }

        Derived& InnerJoin(const std::string& table, ExprPtr on, std::optional<std::string> alias = std::nullopt) {
            return Join(JoinType::Inner, TableSource::table(table, std::move(alias)), std::move(on));
        }
        Derived& LeftJoin(const std::string& table, ExprPtr on, std::optional<std::string> alias = std::nullopt) {
            return Join(JoinType::Left, TableSource::table(table, std::move(alias)), std::move(on));
        }
        Derived& RightJoin(const std::string& table, ExprPtr on, std::optional<std::string> alias = std::nullopt) {
            return Join(JoinType::Right, TableSource::table(table, std::move(alias)), std::move(on));
        }
        Derived& FullJoin(const std::string& table, ExprPtr on, std::optional<std::string> alias = std::nullopt) {
            return Join(JoinType::Full, TableSource::table(table, std::move(alias)), std::move(on));
        }
        Derived& CrossJoin(const std::string& table, std::optional<std::string> alias = std::nullopt) {
            return Join(JoinType::Cross, TableSource::table(table, std::move(alias)), nullptr);
        }
        // 连接一个 CTE
        Derived& JoinCte(JoinType type, const std::string& cte_name, ExprPtr on, std::optional<std::string> alias = std::nullopt) {
            return Join(type, TableSource::cte(cte_name, std::move(alias)), std::move(on));
        }

        const std::vector<JoinClause>& getJoins() const {
            return _state().joins;
        }
    };

}  // namespace cppquery

#endif  // cppquery_ACTIVE_QUERY_JOINS_MIXIN_H
