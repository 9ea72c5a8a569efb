#ifndef cppquery_QUERY_RESULT_H
#define cppquery_QUERY_RESULT_H

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cppquery/value.h"

namespace cppquery {

    enum class StatementKind { Select, Insert, Update, Delete, DDL, TransactionControl, Other };

    const char* statementKindName(StatementKind kind);

    // 结果集中的一行. 同一结果集的所有行共享列名列表
    class Row {
      public:
        Row() = default;
        Row(std::shared_ptr<const std::vector<std::string>> columns, std::vector<Value> values);

        std::size_t size() const {
            return values_.size();
        }
        const std::vector<std::string>& columns() const;
        const std::vector<Value>& values() const {
            return values_;
        }

        // 越界时抛出 std::out_of_range
        const Value& at(std::size_t index) const;
        const Value& operator[](std::size_t index) const {
            return values_[index];
        }

        bool contains(const std::string& column) const;
        // 列不存在时返回 nullptr
        const Value* find(const std::string& column) const;

        // 列存在且值为 T 时返回该值
        template <typename T>
        std::optional<T> get(const std::string& column) const {
            const Value* v = find(column);
            if (!v) return std::nullopt;
            if (const auto* typed = std::get_if<T>(v)) return *typed;
            return std::nullopt;
        }

      private:
        std::shared_ptr<const std::vector<std::string>> columns_;
        std::vector<Value> values_;
    };

    struct QueryResult {
        std::vector<Row> rows;  // 仅对返回行的语句 (SELECT / 带 RETURNING 的 DML) 填充
        long long affected_rows = 0;
        std::optional<long long> last_insert_id;
        std::chrono::microseconds duration{0};
        StatementKind kind = StatementKind::Other;
    };

}  // namespace cppquery

#endif  // cppquery_QUERY_RESULT_H
