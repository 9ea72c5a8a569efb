// cppquery/value.cpp
#include "cppquery/value.h"

#include <QJsonDocument>
#include <cctype>
#include <sstream>

namespace cppquery {

    std::optional<Decimal> Decimal::fromString(const std::string& text) {
        if (text.empty()) {
            return std::nullopt;
        }
        size_t pos = 0;
        bool negative = false;
        if (text[pos] == '+' || text[pos] == '-') {
            negative = text[pos] == '-';
            ++pos;
        }
        size_t int_begin = pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) ++pos;
        std::string int_part = text.substr(int_begin, pos - int_begin);
        std::string frac_part;
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            size_t frac_begin = pos;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) ++pos;
            frac_part = text.substr(frac_begin, pos - frac_begin);
            if (frac_part.empty()) {
                return std::nullopt;
            }
        }
        if (pos != text.size() || int_part.empty()) {
            return std::nullopt;
        }

        // 去掉整数部分的前导零, 小数部分保留原有精度
        size_t first_non_zero = int_part.find_first_not_of('0');
        int_part = first_non_zero == std::string::npos ? "0" : int_part.substr(first_non_zero);

        bool is_zero = int_part == "0" && frac_part.find_first_not_of('0') == std::string::npos;
        std::string normalized = (negative && !is_zero) ? "-" : "";
        normalized += int_part;
        if (!frac_part.empty()) {
            normalized += "." + frac_part;
        }
        return Decimal(normalized);
    }

    Decimal Decimal::fromInteger(long long value) {
        return Decimal(std::to_string(value));
    }

    bool Decimal::operator==(const Decimal& other) const {
        auto significant = [](const std::string& text) {
            auto dot = text.find('.');
            if (dot == std::string::npos) return text;
            auto last = text.find_last_not_of('0');
            return text.substr(0, last == dot ? dot : last + 1);
        };
        return significant(text_) == significant(other.text_);
    }

    std::optional<LogicalType> inferLogicalType(const Value& value) {
        return std::visit(
            [](const auto& v) -> std::optional<LogicalType> {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::nullptr_t>) {
                    return std::nullopt;
                } else if constexpr (std::is_same_v<T, bool>) {
                    return LogicalType::Boolean;
                } else if constexpr (std::is_same_v<T, long long>) {
                    return LogicalType::Integer;
                } else if constexpr (std::is_same_v<T, double>) {
                    return LogicalType::Real;
                } else if constexpr (std::is_same_v<T, Decimal>) {
                    return LogicalType::Decimal;
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return LogicalType::Text;
                } else if constexpr (std::is_same_v<T, QByteArray>) {
                    return LogicalType::Blob;
                } else if constexpr (std::is_same_v<T, QDate>) {
                    return LogicalType::Date;
                } else if constexpr (std::is_same_v<T, QTime>) {
                    return LogicalType::Time;
                } else if constexpr (std::is_same_v<T, QDateTime>) {
                    return LogicalType::Timestamp;
                } else if constexpr (std::is_same_v<T, QUuid>) {
                    return LogicalType::Uuid;
                } else {
                    return LogicalType::Json;
                }
            },
            value);
    }

    std::string valueToDebugString(const Value& value) {
        return std::visit(
            [](const auto& v) -> std::string {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::nullptr_t>) {
                    return "NULL";
                } else if constexpr (std::is_same_v<T, bool>) {
                    return v ? "true" : "false";
                } else if constexpr (std::is_same_v<T, long long>) {
                    return std::to_string(v);
                } else if constexpr (std::is_same_v<T, double>) {
                    std::ostringstream oss;
                    oss << v;
                    return oss.str();
                } else if constexpr (std::is_same_v<T, Decimal>) {
                    return v.toString();
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return "'" + v + "'";
                } else if constexpr (std::is_same_v<T, QByteArray>) {
                    return "x'" + v.toHex().toStdString() + "'";
                } else if constexpr (std::is_same_v<T, QDate>) {
                    return v.toString(Qt::ISODate).toStdString();
                } else if constexpr (std::is_same_v<T, QTime>) {
                    return v.toString(Qt::ISODateWithMs).toStdString();
                } else if constexpr (std::is_same_v<T, QDateTime>) {
                    return v.toString(Qt::ISODateWithMs).toStdString();
                } else if constexpr (std::is_same_v<T, QUuid>) {
                    return v.toString(QUuid::WithoutBraces).toStdString();
                } else {
                    return v.toJson(QJsonDocument::Compact).toStdString();
                }
            },
            value);
    }

}  // namespace cppquery
