// cppquery_sqldriver/sql_connection_parameters.h
#pragma once

#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "sql_value.h"  // For SqlValue used as map value

namespace cppquery_sqldriver {

    struct ConnectionParameters : public std::map<std::string, SqlValue> {
        static const std::string KEY_DRIVER_TYPE;
        static const std::string KEY_DB_NAME;
        static const std::string KEY_CONNECTION_NAME;
        static const std::string KEY_BUSY_TIMEOUT_MS;
        static const std::string KEY_READ_ONLY;
        static const std::string KEY_CREATE_IF_MISSING;

        // 按声明顺序在连接建立后执行的 PRAGMA / SET 语句
        std::vector<std::pair<std::string, std::string>> session_settings;

        void setDriverType(const std::string& v);
        void setDbName(const std::string& v);
        void setConnectionName(const std::string& v);
        void setBusyTimeoutMs(long long v);
        void setReadOnly(bool v);
        void setCreateIfMissing(bool v);
        void addSessionSetting(const std::string& name, const std::string& value);

        template <typename T>
        std::optional<T> get(const std::string& key) const;

        std::optional<std::string> driverType() const;
        std::optional<std::string> dbName() const;
        std::optional<std::string> connectionName() const;
        std::optional<long long> busyTimeoutMs() const;
        std::optional<bool> readOnly() const;
        std::optional<bool> createIfMissing() const;
    };

    template <typename T>
    std::optional<T> ConnectionParameters::get(const std::string& key) const {
        auto it = find(key);
        if (it != end() && !it->second.isNull()) {
            bool ok = false;
            T result{};
            if constexpr (std::is_same_v<T, std::string>) {
                result = it->second.toString(&ok);
            } else if constexpr (std::is_same_v<T, bool>) {
                result = it->second.toBool(&ok);
            } else if constexpr (std::is_integral_v<T>) {
                result = static_cast<T>(it->second.toInt64(&ok));
            } else if constexpr (std::is_floating_point_v<T>) {
                result = static_cast<T>(it->second.toDouble(&ok));
            }
            if (ok) return result;
        }
        return std::nullopt;
    }

}  // namespace cppquery_sqldriver
