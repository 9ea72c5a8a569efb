#ifndef cppquery_LOGICAL_TYPE_H
#define cppquery_LOGICAL_TYPE_H

#include <array>
#include <optional>
#include <string>

namespace cppquery {

    // 与后端无关的逻辑类型
    enum class LogicalType { Integer, Real, Decimal, Text, Blob, Boolean, Date, Time, Timestamp, Uuid, Json };

    inline constexpr std::array<LogicalType, 11> kAllLogicalTypes = {
        LogicalType::Integer, LogicalType::Real, LogicalType::Decimal, LogicalType::Text, LogicalType::Blob, LogicalType::Boolean,
        LogicalType::Date,    LogicalType::Time, LogicalType::Timestamp, LogicalType::Uuid, LogicalType::Json,
    };

    const char* logicalTypeName(LogicalType type);
    // 大小写不敏感, 例如 "timestamp" -> LogicalType::Timestamp
    std::optional<LogicalType> logicalTypeFromName(const std::string& name);

}  // namespace cppquery

#endif  // cppquery_LOGICAL_TYPE_H
