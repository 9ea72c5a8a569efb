// cppquery/dialect/dialect.cpp
#include "cppquery/dialect/dialect.h"

#include <charconv>

namespace cppquery {

    std::optional<DialectVersion> DialectVersion::parse(const std::string& text) {
        DialectVersion version;
        int* parts[] = {&version.major_version, &version.minor_version, &version.patch_version};
        const char* p = text.data();
        const char* end = text.data() + text.size();
        int index = 0;
        while (p < end && index < 3) {
            auto [next, ec] = std::from_chars(p, end, *parts[index]);
            if (ec != std::errc() || *parts[index] < 0) {
                return std::nullopt;
            }
            ++index;
            p = next;
            if (p == end) break;
            if (*p != '.') {
                // 允许 "8.0.36-log" / "16.2 (Debian ...)" 之类的后缀
                break;
            }
            ++p;
        }
        if (index == 0) {
            return std::nullopt;
        }
        return version;
    }

    std::string DialectVersion::toString() const {
        return std::to_string(major_version) + "." + std::to_string(minor_version) + "." + std::to_string(patch_version);
    }

    const char* dialectFeatureName(DialectFeature feature) {
        switch (feature) {
            case DialectFeature::Cte:
                return "WITH (common table expressions)";
            case DialectFeature::RecursiveCte:
                return "WITH RECURSIVE";
            case DialectFeature::WindowFunctions:
                return "window functions";
            case DialectFeature::AggregateFilter:
                return "aggregate FILTER clause";
            case DialectFeature::NullsOrdering:
                return "NULLS FIRST/LAST ordering";
            case DialectFeature::Returning:
                return "RETURNING";
            case DialectFeature::Savepoint:
                return "SAVEPOINT";
            case DialectFeature::RowLocking:
                return "row locking (FOR UPDATE / FOR SHARE)";
            case DialectFeature::RightJoin:
                return "RIGHT JOIN";
            case DialectFeature::FullJoin:
                return "FULL JOIN";
            case DialectFeature::IntersectExcept:
                return "INTERSECT / EXCEPT";
            case DialectFeature::JsonFunctions:
                return "JSON functions";
            case DialectFeature::Upsert:
                return "upsert (ON CONFLICT)";
        }
        return "unknown feature";
    }

}  // namespace cppquery
