// cppquery/Source/backend/backend_config.cpp
#include "cppquery/backend/backend_config.h"

#include <QProcessEnvironment>
#include <QString>
#include <QUrl>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <map>

namespace cppquery {

    namespace {

        const std::string kSqliteScheme = "sqlite://";

        std::string toLower(std::string text) {
            std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return text;
        }

        std::string percentDecode(const std::string& text) {
            return QUrl::fromPercentEncoding(QByteArray::fromStdString(text)).toStdString();
        }

        std::optional<bool> parseFlag(const std::string& text) {
            const std::string lowered = toLower(text);
            if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") return true;
            if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") return false;
            return std::nullopt;
        }

        std::optional<double> parseSeconds(const std::string& text) {
            try {
                std::size_t consumed = 0;
                double value = std::stod(text, &consumed);
                if (consumed != text.size() || !std::isfinite(value)) return std::nullopt;
                return value;
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }

        std::optional<long long> parseMillis(const std::string& text) {
            try {
                std::size_t consumed = 0;
                long long value = std::stoll(text, &consumed);
                if (consumed != text.size()) return std::nullopt;
                return value;
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }

        Error configError(const std::string& message) {
            return Error(ErrorCode::InvalidConfiguration, message).withDialect("sqlite");
        }

        // timeout / statement_timeout_ms / mode / read_only 之外的键都视为 PRAGMA
        std::expected<void, Error> applyOption(BackendConfig& config, const std::string& raw_key, const std::string& value) {
            const std::string key = toLower(raw_key);
            if (key == "timeout") {
                auto seconds = parseSeconds(value);
                if (!seconds) return std::unexpected(configError("Invalid timeout '" + value + "'"));
                config.lock_wait_timeout_s = *seconds;
            } else if (key == "statement_timeout_ms") {
                auto millis = parseMillis(value);
                if (!millis) return std::unexpected(configError("Invalid statement_timeout_ms '" + value + "'"));
                if (*millis > 0) {
                    config.statement_timeout = std::chrono::milliseconds(*millis);
                } else {
                    config.statement_timeout.reset();
                }
            } else if (key == "mode") {
                const std::string mode = toLower(value);
                if (mode == "ro") {
                    config.read_only = true;
                    config.create_if_missing = false;
                } else if (mode == "rw") {
                    config.read_only = false;
                    config.create_if_missing = false;
                } else if (mode == "rwc") {
                    config.read_only = false;
                    config.create_if_missing = true;
                } else {
                    return std::unexpected(configError("Invalid mode '" + value + "', expected ro / rw / rwc"));
                }
            } else if (key == "read_only") {
                auto flag = parseFlag(value);
                if (!flag) return std::unexpected(configError("Invalid read_only '" + value + "'"));
                config.read_only = *flag;
            } else if (key == "delete_on_close") {
                auto flag = parseFlag(value);
                if (!flag) return std::unexpected(configError("Invalid delete_on_close '" + value + "'"));
                config.delete_on_close = *flag;
            } else {
                config.setPragma(key, value);
            }
            return {};
        }

    }  // namespace

    std::expected<BackendConfig, Error> BackendConfig::fromUri(const std::string& uri) {
        if (uri.size() < kSqliteScheme.size() || toLower(uri.substr(0, kSqliteScheme.size())) != kSqliteScheme) {
            return std::unexpected(configError("Unsupported URI '" + uri + "', expected sqlite://"));
        }
        std::string rest = uri.substr(kSqliteScheme.size());
        std::string query;
        if (auto pos = rest.find('?'); pos != std::string::npos) {
            query = rest.substr(pos + 1);
            rest = rest.substr(0, pos);
        }

        BackendConfig config;
        if (rest.empty() || rest == ":memory:" || rest == "/:memory:") {
            config.database = ":memory:";
        } else if (rest.front() == '/') {
            // sqlite:///relative.db -> relative.db, sqlite:////abs.db -> /abs.db
            config.database = percentDecode(rest.substr(1));
            if (config.database.empty()) {
                config.database = ":memory:";
            }
        } else {
            return std::unexpected(configError("Invalid SQLite URI '" + uri + "', host part is not supported"));
        }

        std::size_t start = 0;
        while (start < query.size()) {
            std::size_t end = query.find('&', start);
            if (end == std::string::npos) end = query.size();
            const std::string pair = query.substr(start, end - start);
            start = end + 1;
            if (pair.empty()) continue;

            auto eq = pair.find('=');
            if (eq == std::string::npos || eq == 0) {
                return std::unexpected(configError("Invalid URI option '" + pair + "'"));
            }
            auto applied = applyOption(config, percentDecode(pair.substr(0, eq)), percentDecode(pair.substr(eq + 1)));
            if (!applied) return std::unexpected(applied.error());
        }

        if (auto valid = config.validate(); !valid) {
            return std::unexpected(valid.error());
        }
        return config;
    }

    std::expected<BackendConfig, Error> BackendConfig::fromEnvironment(const std::string& prefix) {
        const QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
        const QString q_prefix = QString::fromStdString(prefix);
        BackendConfig config;

        std::map<std::string, std::string> options;
        const QStringList keys = env.keys();
        for (const QString& key : keys) {
            if (!key.startsWith(q_prefix)) continue;
            const std::string suffix = key.mid(q_prefix.size()).toStdString();
            const std::string value = env.value(key).toStdString();
            if (suffix == "DATABASE") {
                config.database = value.empty() ? std::string(":memory:") : value;
            } else if (suffix == "TIMEOUT") {
                options["timeout"] = value;
            } else if (suffix == "STATEMENT_TIMEOUT_MS") {
                options["statement_timeout_ms"] = value;
            } else if (suffix == "READ_ONLY") {
                options["read_only"] = value;
            } else if (suffix == "DELETE_ON_CLOSE") {
                options["delete_on_close"] = value;
            } else if (suffix.rfind("PRAGMA_", 0) == 0 && suffix.size() > 7) {
                options[toLower(suffix.substr(7))] = value;
            }
        }
        // QProcessEnvironment 的键无序, 按名字排序后应用保证结果确定
        for (const auto& [key, value] : options) {
            auto applied = applyOption(config, key, value);
            if (!applied) return std::unexpected(applied.error());
        }

        if (auto valid = config.validate(); !valid) {
            return std::unexpected(valid.error());
        }
        return config;
    }

    bool BackendConfig::isMemoryDatabase() const {
        return database.empty() || database == ":memory:" || database.rfind("file::memory:", 0) == 0;
    }

    std::expected<void, Error> BackendConfig::validate() const {
        if (driver_type.empty()) {
            return std::unexpected(configError("driver_type must not be empty"));
        }
        if (!(lock_wait_timeout_s >= 0.0) || !std::isfinite(lock_wait_timeout_s)) {
            return std::unexpected(configError("lock_wait_timeout_s must be a non-negative number"));
        }
        if (statement_timeout && statement_timeout->count() <= 0) {
            return std::unexpected(configError("statement_timeout must be positive"));
        }
        if (read_only && isMemoryDatabase()) {
            return std::unexpected(configError("An in-memory database cannot be opened read-only"));
        }
        for (const auto& [name, value] : pragmas) {
            if (name.empty() || value.empty()) {
                return std::unexpected(configError("PRAGMA name and value must not be empty"));
            }
        }
        return {};
    }

    void BackendConfig::setPragma(const std::string& name, const std::string& value) {
        auto it = std::find_if(pragmas.begin(), pragmas.end(), [&](const auto& entry) { return toLower(entry.first) == toLower(name); });
        if (it != pragmas.end()) {
            it->second = value;
        } else {
            pragmas.emplace_back(name, value);
        }
    }

    cppquery_sqldriver::ConnectionParameters BackendConfig::toDriverParameters() const {
        cppquery_sqldriver::ConnectionParameters params;
        params.setDriverType(driver_type);
        params.setDbName(database.empty() ? std::string(":memory:") : database);
        params.setConnectionName(connection_name);
        params.setBusyTimeoutMs(static_cast<long long>(std::llround(lock_wait_timeout_s * 1000.0)));
        params.setReadOnly(read_only);
        params.setCreateIfMissing(create_if_missing);
        for (const auto& [name, value] : pragmas) {
            // 内存数据库不支持 WAL
            if (isMemoryDatabase() && toLower(name) == "journal_mode" && toLower(value) == "wal") continue;
            // 只读连接不能切换日志模式
            if (read_only && toLower(name) == "journal_mode") continue;
            params.addSessionSetting(name, value);
        }
        return params;
    }

    std::shared_ptr<spdlog::logger> BackendConfig::getOrCreateLogger(const std::string& logger_name) {
        if (logger) {
            logger->set_level(log_level);
            return logger;
        }
        auto default_logger = spdlog::get(logger_name);
        if (!default_logger) {
            try {
                default_logger = spdlog::stdout_color_mt(logger_name);
                default_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] [tid %t] %v");
                default_logger->set_level(log_level);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "Logger (" << logger_name << ") initialization failed: " << ex.what() << std::endl;
                return nullptr;
            }
        } else {
            default_logger->set_level(log_level);
        }
        logger = default_logger;
        return default_logger;
    }

}  // namespace cppquery
