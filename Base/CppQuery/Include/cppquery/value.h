#ifndef cppquery_VALUE_H
#define cppquery_VALUE_H

#include <QByteArray>
#include <QDate>
#include <QDateTime>
#include <QJsonDocument>
#include <QTime>
#include <QUuid>
#include <optional>
#include <string>
#include <variant>

#include "cppquery/logical_type.h"

namespace cppquery {

    // 精确十进制数, 以规范化文本保存, 不经过浮点
    class Decimal {
      public:
        Decimal() : text_("0") {
        }

        // 接受 [+-]digits[.digits], 其他输入返回 nullopt
        static std::optional<Decimal> fromString(const std::string& text);
        static Decimal fromInteger(long long value);

        const std::string& toString() const {
            return text_;
        }
        bool isNegative() const {
            return !text_.empty() && text_[0] == '-';
        }

        // 按数值比较: "12.50" == "12.5"
        bool operator==(const Decimal& other) const;
        bool operator!=(const Decimal& other) const {
            return !(*this == other);
        }

      private:
        explicit Decimal(std::string normalized) : text_(std::move(normalized)) {
        }
        std::string text_;
    };

    // 应用层的值. 数据库原生表示由 TypeMappingRegistry 负责转换
    using Value = std::variant<std::nullptr_t, bool, long long, double, Decimal, std::string, QByteArray, QDate, QTime, QDateTime, QUuid, QJsonDocument>;

    inline bool isNull(const Value& value) {
        return std::holds_alternative<std::nullptr_t>(value);
    }

    // 为未显式指定类型的字面量推断逻辑类型; null 没有可推断的类型
    std::optional<LogicalType> inferLogicalType(const Value& value);

    // 仅用于日志与调试输出
    std::string valueToDebugString(const Value& value);

}  // namespace cppquery

#endif  // cppquery_VALUE_H
