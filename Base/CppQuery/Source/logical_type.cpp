// cppquery/logical_type.cpp
#include "cppquery/logical_type.h"

#include <algorithm>
#include <cctype>

namespace cppquery {

    const char* logicalTypeName(LogicalType type) {
        switch (type) {
            case LogicalType::Integer:
                return "INTEGER";
            case LogicalType::Real:
                return "REAL";
            case LogicalType::Decimal:
                return "DECIMAL";
            case LogicalType::Text:
                return "TEXT";
            case LogicalType::Blob:
                return "BLOB";
            case LogicalType::Boolean:
                return "BOOLEAN";
            case LogicalType::Date:
                return "DATE";
            case LogicalType::Time:
                return "TIME";
            case LogicalType::Timestamp:
                return "TIMESTAMP";
            case LogicalType::Uuid:
                return "UUID";
            case LogicalType::Json:
                return "JSON";
        }
        return "UNKNOWN";
    }

    std::optional<LogicalType> logicalTypeFromName(const std::string& name) {
        std::string upper = name;
        std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        for (LogicalType type : kAllLogicalTypes) {
            if (upper == logicalTypeName(type)) {
                return type;
            }
        }
        return std::nullopt;
    }

}  // namespace cppquery
