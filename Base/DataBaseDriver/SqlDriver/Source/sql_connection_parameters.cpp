// Source/sql_connection_parameters.cpp
#include "cppquery_sqldriver/sql_connection_parameters.h"

#include "cppquery_sqldriver/sql_value.h"

namespace cppquery_sqldriver {

    // 定义静态常量成员
    const std::string ConnectionParameters::KEY_DRIVER_TYPE = "driver_type";
    const std::string ConnectionParameters::KEY_DB_NAME = "db_name";
    const std::string ConnectionParameters::KEY_CONNECTION_NAME = "connection_name";
    const std::string ConnectionParameters::KEY_BUSY_TIMEOUT_MS = "busy_timeout_ms";
    const std::string ConnectionParameters::KEY_READ_ONLY = "read_only";
    const std::string ConnectionParameters::KEY_CREATE_IF_MISSING = "create_if_missing";

    // Setters (实现)
    void ConnectionParameters::setDriverType(const std::string& v) {
        (*this)[KEY_DRIVER_TYPE] = SqlValue(v);
    }
    void ConnectionParameters::setDbName(const std::string& v) {
        (*this)[KEY_DB_NAME] = SqlValue(v);
    }
    void ConnectionParameters::setConnectionName(const std::string& v) {
        (*this)[KEY_CONNECTION_NAME] = SqlValue(v);
    }
    void ConnectionParameters::setBusyTimeoutMs(long long v) {
        (*this)[KEY_BUSY_TIMEOUT_MS] = SqlValue(v);
    }
    void ConnectionParameters::setReadOnly(bool v) {
        (*this)[KEY_READ_ONLY] = SqlValue(v);
    }
    void ConnectionParameters::setCreateIfMissing(bool v) {
        (*this)[KEY_CREATE_IF_MISSING] = SqlValue(v);
    }
    void ConnectionParameters::addSessionSetting(const std::string& name, const std::string& value) {
        for (auto& setting : session_settings) {
            if (setting.first == name) {
                setting.second = value;
                return;
            }
        }
        session_settings.emplace_back(name, value);
    }

    // Getters (实现)
    std::optional<std::string> ConnectionParameters::driverType() const {
        return get<std::string>(KEY_DRIVER_TYPE);
    }
    std::optional<std::string> ConnectionParameters::dbName() const {
        return get<std::string>(KEY_DB_NAME);
    }
    std::optional<std::string> ConnectionParameters::connectionName() const {
        return get<std::string>(KEY_CONNECTION_NAME);
    }
    std::optional<long long> ConnectionParameters::busyTimeoutMs() const {
        return get<long long>(KEY_BUSY_TIMEOUT_MS);
    }
    std::optional<bool> ConnectionParameters::readOnly() const {
        return get<bool>(KEY_READ_ONLY);
    }
    std::optional<bool> ConnectionParameters::createIfMissing() const {
        return get<bool>(KEY_CREATE_IF_MISSING);
    }

}  // namespace cppquery_sqldriver
