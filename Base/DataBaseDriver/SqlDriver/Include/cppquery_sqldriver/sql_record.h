// cppquery_sqldriver/sql_record.h
#pragma once
#include <optional>
#include <string>
#include <vector>

#include "sql_field.h"
#include "sql_value.h"

namespace cppquery_sqldriver {

    // 一行结果. 列顺序与 SELECT 列表一致; 同名列按第一次出现匹配
    class SqlRecord {
      public:
        SqlRecord() = default;

        int count() const {
            return static_cast<int>(fields_.size());
        }
        bool isEmpty() const {
            return fields_.empty();
        }

        // 越界抛出 std::out_of_range
        const SqlField& field(int index) const;
        std::string fieldName(int index) const;
        std::optional<int> indexOf(const std::string& name) const;

        // 未知列或越界返回 Null
        SqlValue value(int index) const;
        SqlValue value(const std::string& name) const;
        bool isNull(const std::string& name) const;

        void append(SqlField field);
        void setValue(int index, SqlValue value);
        void clear() {
            fields_.clear();
        }

      private:
        std::vector<SqlField> fields_;
    };

}  // namespace cppquery_sqldriver
