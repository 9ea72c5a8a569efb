// SqlDriver/Source/sql_value.cpp
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstring>
#include <limits>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

#include "cppquery_sqldriver/sql_value.h"

namespace cppquery_sqldriver {

    namespace {
        void setOk(bool* ok, bool value) {
            if (ok) *ok = value;
        }

        std::string lowerCopy(const std::string& s) {
            std::string out = s;
            std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        std::string doubleToString(double d) {
            char buf[64];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
            if (ec != std::errc()) {
                return std::to_string(d);
            }
            return std::string(buf, ptr);
        }
    }  // namespace

    // --- 核心构造函数 ---
    SqlValue::SqlValue() : value_(std::monostate{}) {
    }
    SqlValue::SqlValue(std::nullptr_t) : value_(std::monostate{}) {
    }
    SqlValue::SqlValue(bool val) : value_(val) {
    }
    SqlValue::SqlValue(int val) : value_(static_cast<int64_t>(val)) {
    }
    SqlValue::SqlValue(long val) : value_(static_cast<int64_t>(val)) {
    }
    SqlValue::SqlValue(long long val) : value_(static_cast<int64_t>(val)) {
    }
    SqlValue::SqlValue(double val) : value_(val) {
    }
    SqlValue::SqlValue(const char* val) {
        if (val) {
            value_ = std::string(val);
        } else {
            value_ = std::monostate{};
        }
    }
    SqlValue::SqlValue(const std::string& val) : value_(val) {
    }
    SqlValue::SqlValue(std::string&& val) : value_(std::move(val)) {
    }
    SqlValue::SqlValue(const Bytes& val) : value_(val) {
    }

    SqlValue::SqlValue(SqlValue&& other) noexcept : value_(std::move(other.value_)) {
        other.value_ = std::monostate{};
    }

    SqlValue& SqlValue::operator=(SqlValue&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            other.value_ = std::monostate{};
        }
        return *this;
    }

    bool SqlValue::isNull() const {
        return std::holds_alternative<std::monostate>(value_);
    }

    SqlValueType SqlValue::type() const {
        switch (value_.index()) {
            case 1:
                return SqlValueType::Bool;
            case 2:
                return SqlValueType::Int64;
            case 3:
                return SqlValueType::Double;
            case 4:
                return SqlValueType::String;
            case 5:
                return SqlValueType::ByteArray;
            default:
                return SqlValueType::Null;
        }
    }

    const char* SqlValue::typeName() const {
        switch (type()) {
            case SqlValueType::Null:
                return "NULL";
            case SqlValueType::Bool:
                return "BOOL";
            case SqlValueType::Int64:
                return "INT64";
            case SqlValueType::Double:
                return "DOUBLE";
            case SqlValueType::String:
                return "STRING";
            case SqlValueType::ByteArray:
                return "BYTEARRAY";
        }
        return "UNKNOWN";
    }

    bool SqlValue::toBool(bool* ok) const {
        setOk(ok, true);
        if (const auto* b = std::get_if<bool>(&value_)) return *b;
        if (const auto* i = std::get_if<int64_t>(&value_)) return *i != 0;
        if (const auto* d = std::get_if<double>(&value_)) return *d != 0.0;
        if (const auto* s = std::get_if<std::string>(&value_)) {
            const std::string lowered = lowerCopy(*s);
            if (lowered == "1" || lowered == "true") return true;
            if (lowered == "0" || lowered == "false") return false;
        }
        setOk(ok, false);
        return false;
    }

    int64_t SqlValue::toInt64(bool* ok) const {
        setOk(ok, true);
        if (const auto* i = std::get_if<int64_t>(&value_)) return *i;
        if (const auto* b = std::get_if<bool>(&value_)) return *b ? 1 : 0;
        if (const auto* d = std::get_if<double>(&value_)) {
            // 只接受无小数部分且在范围内的浮点数
            if (std::isfinite(*d) && std::trunc(*d) == *d && *d >= static_cast<double>(std::numeric_limits<int64_t>::min()) && *d < static_cast<double>(std::numeric_limits<int64_t>::max())) {
                return static_cast<int64_t>(*d);
            }
        }
        if (const auto* s = std::get_if<std::string>(&value_)) {
            int64_t result = 0;
            const char* begin = s->data();
            const char* end = s->data() + s->size();
            auto [ptr, ec] = std::from_chars(begin, end, result);
            if (ec == std::errc() && ptr == end && !s->empty()) return result;
        }
        setOk(ok, false);
        return 0;
    }

    double SqlValue::toDouble(bool* ok) const {
        setOk(ok, true);
        if (const auto* d = std::get_if<double>(&value_)) return *d;
        if (const auto* i = std::get_if<int64_t>(&value_)) return static_cast<double>(*i);
        if (const auto* b = std::get_if<bool>(&value_)) return *b ? 1.0 : 0.0;
        if (const auto* s = std::get_if<std::string>(&value_)) {
            double result = 0.0;
            const char* begin = s->data();
            const char* end = s->data() + s->size();
            auto [ptr, ec] = std::from_chars(begin, end, result);
            if (ec == std::errc() && ptr == end && !s->empty()) return result;
        }
        setOk(ok, false);
        return 0.0;
    }

    std::string SqlValue::toString(bool* ok) const {
        setOk(ok, true);
        if (const auto* s = std::get_if<std::string>(&value_)) return *s;
        if (const auto* i = std::get_if<int64_t>(&value_)) return std::to_string(*i);
        if (const auto* d = std::get_if<double>(&value_)) return doubleToString(*d);
        if (const auto* b = std::get_if<bool>(&value_)) return *b ? "true" : "false";
        if (const auto* bytes = std::get_if<Bytes>(&value_)) return std::string(bytes->begin(), bytes->end());
        setOk(ok, false);
        return std::string();
    }

    SqlValue::Bytes SqlValue::toBytes(bool* ok) const {
        setOk(ok, true);
        if (const auto* bytes = std::get_if<Bytes>(&value_)) return *bytes;
        if (const auto* s = std::get_if<std::string>(&value_)) return Bytes(s->begin(), s->end());
        setOk(ok, false);
        return Bytes();
    }

    bool SqlValue::operator==(const SqlValue& other) const {
        return value_ == other.value_;
    }

    bool SqlValue::operator!=(const SqlValue& other) const {
        return !(*this == other);
    }

    void SqlValue::clear() {
        value_ = std::monostate{};
    }

    std::ostream& operator<<(std::ostream& os, const SqlValue& value) {
        switch (value.type()) {
            case SqlValueType::Null:
                return os << "NULL";
            case SqlValueType::String:
                return os << '\'' << value.toString() << '\'';
            case SqlValueType::ByteArray:
                return os << "<" << value.toBytes().size() << " bytes>";
            default:
                return os << value.toString();
        }
    }

}  // namespace cppquery_sqldriver
