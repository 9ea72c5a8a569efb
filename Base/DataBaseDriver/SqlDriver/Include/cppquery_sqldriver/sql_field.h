// cppquery_sqldriver/sql_field.h
#pragma once
#include <string>
#include <utility>

#include "sql_value.h"

namespace cppquery_sqldriver {

    // 结果集中的一列: 列名, 声明类型与当前行的值
    class SqlField {
      public:
        explicit SqlField(std::string name = "", std::string declared_type = "") : name_(std::move(name)), declared_type_(std::move(declared_type)) {
        }

        const std::string& name() const {
            return name_;
        }
        // 声明类型 (例如 SQLite 的 sqlite3_column_decltype), 表达式列为空
        const std::string& databaseTypeName() const {
            return declared_type_;
        }

        const SqlValue& value() const {
            return value_;
        }
        void setValue(SqlValue value) {
            value_ = std::move(value);
        }
        bool isNull() const {
            return value_.isNull();
        }

      private:
        std::string name_;
        std::string declared_type_;
        SqlValue value_;
    };

}  // namespace cppquery_sqldriver
