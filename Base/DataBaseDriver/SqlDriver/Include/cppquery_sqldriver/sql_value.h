// cppquery_sqldriver/sql_value.h
#pragma once
#include <cstdint>
#include <iosfwd>
#include <string>
#include <variant>
#include <vector>

namespace cppquery_sqldriver {

    // 驱动层的值只覆盖存储引擎原生能表示的类型; 应用层类型由 cppquery 的类型映射负责
    enum class SqlValueType { Null, Bool, Int64, Double, String, ByteArray };

    class SqlValue {
      public:
        using Bytes = std::vector<unsigned char>;

        SqlValue();                // Null 状态
        SqlValue(std::nullptr_t);  // 显式 Null
        SqlValue(bool val);
        SqlValue(int val);
        SqlValue(long val);
        SqlValue(long long val);
        SqlValue(double val);
        SqlValue(const char* val);
        SqlValue(const std::string& val);
        SqlValue(std::string&& val);
        SqlValue(const Bytes& val);

        SqlValue(const SqlValue& other) = default;
        SqlValue& operator=(const SqlValue& other) = default;
        SqlValue(SqlValue&& other) noexcept;
        SqlValue& operator=(SqlValue&& other) noexcept;
        ~SqlValue() = default;

        bool isNull() const;
        SqlValueType type() const;
        const char* typeName() const;

        // 类型转换方法 (ok 参数表示转换是否成功)
        bool toBool(bool* ok = nullptr) const;
        int64_t toInt64(bool* ok = nullptr) const;
        double toDouble(bool* ok = nullptr) const;
        std::string toString(bool* ok = nullptr) const;
        Bytes toBytes(bool* ok = nullptr) const;

        bool operator==(const SqlValue& other) const;
        bool operator!=(const SqlValue& other) const;

        void clear();

      private:
        using StorageType = std::variant<std::monostate,  // 代表 Null
                                         bool,
                                         int64_t,
                                         double,
                                         std::string,
                                         Bytes>;
        StorageType value_;
    };

    std::ostream& operator<<(std::ostream& os, const SqlValue& value);

}  // namespace cppquery_sqldriver
