// cppquery/type_mapping_builtins.cpp
// 内置方言的类型映射. 没有原生表示的类型使用确定且可往返的文本/整数编码
#include <QDebug>
#include <QJsonParseError>
#include <QLocale>
#include <QTimeZone>

#include "cppquery/type_mapping.h"

namespace cppquery {

    namespace {
        using cppquery_sqldriver::SqlValue;
        using cppquery_sqldriver::SqlValueType;

        using ToDb = std::expected<SqlValue, Error>;
        using ToNative = std::expected<Value, Error>;

        const char* kNilUuidText = "00000000-0000-0000-0000-000000000000";

        Error storeMismatch(LogicalType type, const Value& value) {
            return makeConstructionError(std::string("Value ") + valueToDebugString(value) + " cannot be stored as " + logicalTypeName(type), "bind");
        }

        Error decodeFailure(LogicalType type, const SqlValue& value, const std::string& detail = "") {
            std::string msg = std::string("Database value of storage class ") + value.typeName() + " cannot be read as " + logicalTypeName(type);
            if (!detail.empty()) msg += ": " + detail;
            return Error(ErrorCode::TypeConversionError, msg);
        }

        QString textOf(const SqlValue& value) {
            return QString::fromStdString(value.toString());
        }

        // --- 各逻辑类型的编解码器 ---

        TypeMapping integerMapping(const std::string& native) {
            return TypeMapping{native,
                               [](const Value& v) -> ToDb {
                                   if (const auto* i = std::get_if<long long>(&v)) return SqlValue(*i);
                                   return std::unexpected(storeMismatch(LogicalType::Integer, v));
                               },
                               [](const SqlValue& v) -> ToNative {
                                   bool ok = false;
                                   long long result = v.toInt64(&ok);
                                   if (!ok || v.type() == SqlValueType::ByteArray) return std::unexpected(decodeFailure(LogicalType::Integer, v));
                                   return Value(result);
                               }};
        }

        TypeMapping realMapping(const std::string& native) {
            return TypeMapping{native,
                               [](const Value& v) -> ToDb {
                                   if (const auto* d = std::get_if<double>(&v)) return SqlValue(*d);
                                   if (const auto* i = std::get_if<long long>(&v)) return SqlValue(static_cast<double>(*i));
                                   return std::unexpected(storeMismatch(LogicalType::Real, v));
                               },
                               [](const SqlValue& v) -> ToNative {
                                   bool ok = false;
                                   double result = v.toDouble(&ok);
                                   if (!ok) return std::unexpected(decodeFailure(LogicalType::Real, v));
                                   return Value(result);
                               }};
        }

        // 十进制数一律以文本写入. 读取时整数和文本精确还原;
        // real_storage 为 true 时接受浮点存储类, 按最短往返文本还原 (SQLite 的 NUMERIC 亲和性会把数值文本存成 REAL)
        TypeMapping decimalMapping(const std::string& native, bool real_storage = false) {
            return TypeMapping{native,
                               [](const Value& v) -> ToDb {
                                   if (const auto* d = std::get_if<Decimal>(&v)) return SqlValue(d->toString());
                                   if (const auto* i = std::get_if<long long>(&v)) return SqlValue(Decimal::fromInteger(*i).toString());
                                   return std::unexpected(storeMismatch(LogicalType::Decimal, v));
                               },
                               [real_storage](const SqlValue& v) -> ToNative {
                                   if (v.type() == SqlValueType::Int64) return Value(Decimal::fromInteger(v.toInt64()));
                                   std::string text;
                                   if (v.type() == SqlValueType::String) {
                                       text = v.toString();
                                   } else if (v.type() == SqlValueType::Double && real_storage) {
                                       text = QString::number(v.toDouble(), 'f', QLocale::FloatingPointShortest).toStdString();
                                   } else {
                                       return std::unexpected(decodeFailure(LogicalType::Decimal, v, "inexact storage"));
                                   }
                                   auto parsed = Decimal::fromString(text);
                                   if (!parsed) return std::unexpected(decodeFailure(LogicalType::Decimal, v, "'" + text + "' is not a decimal number"));
                                   return Value(*parsed);
                               }};
        }

        TypeMapping textMapping(const std::string& native) {
            return TypeMapping{native,
                               [](const Value& v) -> ToDb {
                                   if (const auto* s = std::get_if<std::string>(&v)) return SqlValue(*s);
                                   return std::unexpected(storeMismatch(LogicalType::Text, v));
                               },
                               [](const SqlValue& v) -> ToNative {
                                   if (v.type() == SqlValueType::ByteArray) return std::unexpected(decodeFailure(LogicalType::Text, v));
                                   return Value(v.toString());
                               }};
        }

        TypeMapping blobMapping(const std::string& native) {
            return TypeMapping{native,
                               [](const Value& v) -> ToDb {
                                   if (const auto* b = std::get_if<QByteArray>(&v)) {
                                       return SqlValue(SqlValue::Bytes(reinterpret_cast<const unsigned char*>(b->constData()), reinterpret_cast<const unsigned char*>(b->constData()) + b->size()));
                                   }
                                   return std::unexpected(storeMismatch(LogicalType::Blob, v));
                               },
                               [](const SqlValue& v) -> ToNative {
                                   bool ok = false;
                                   auto bytes = v.toBytes(&ok);
                                   if (!ok) return std::unexpected(decodeFailure(LogicalType::Blob, v));
                                   return Value(QByteArray(reinterpret_cast<const char*>(bytes.data()), static_cast<qsizetype>(bytes.size())));
                               }};
        }

        // 没有原生布尔类型的后端以整数 0/1 存储; 读取时只接受 0 和 1
        TypeMapping integerBooleanMapping(const std::string& native) {
            return TypeMapping{native,
                               [](const Value& v) -> ToDb {
                                   if (const auto* b = std::get_if<bool>(&v)) return SqlValue(static_cast<long long>(*b ? 1 : 0));
                                   return std::unexpected(storeMismatch(LogicalType::Boolean, v));
                               },
                               [](const SqlValue& v) -> ToNative {
                                   if (v.type() == SqlValueType::Bool) return Value(v.toBool());
                                   if (v.type() == SqlValueType::Int64) {
                                       auto i = v.toInt64();
                                       if (i == 0 || i == 1) return Value(i == 1);
                                   }
                                   return std::unexpected(decodeFailure(LogicalType::Boolean, v, "expected 0 or 1"));
                               }};
        }

        TypeMapping nativeBooleanMapping(const std::string& native) {
            return TypeMapping{native,
                               [](const Value& v) -> ToDb {
                                   if (const auto* b = std::get_if<bool>(&v)) return SqlValue(*b);
                                   return std::unexpected(storeMismatch(LogicalType::Boolean, v));
                               },
                               [](const SqlValue& v) -> ToNative {
                                   if (v.type() == SqlValueType::Bool) return Value(v.toBool());
                                   if (v.type() == SqlValueType::String) {
                                       const std::string s = v.toString();
                                       if (s == "t" || s == "true") return Value(true);
                                       if (s == "f" || s == "false") return Value(false);
                                   }
                                   if (v.type() == SqlValueType::Int64 && (v.toInt64() == 0 || v.toInt64() == 1)) return Value(v.toInt64() == 1);
                                   return std::unexpected(decodeFailure(LogicalType::Boolean, v));
                               }};
        }

        TypeMapping dateMapping(const std::string& native) {
            return TypeMapping{native,
                               [](const Value& v) -> ToDb {
                                   const auto* d = std::get_if<QDate>(&v);
                                   if (!d || !d->isValid()) return std::unexpected(storeMismatch(LogicalType::Date, v));
                                   return SqlValue(d->toString(QStringLiteral("yyyy-MM-dd")).toStdString());
                               },
                               [](const SqlValue& v) -> ToNative {
                                   if (v.type() != SqlValueType::String) return std::unexpected(decodeFailure(LogicalType::Date, v));
                                   QDate date = QDate::fromString(textOf(v), Qt::ISODate);
                                   if (!date.isValid()) return std::unexpected(decodeFailure(LogicalType::Date, v, "'" + v.toString() + "' is not an ISO date"));
                                   return Value(date);
                               }};
        }

        TypeMapping timeMapping(const std::string& native) {
            return TypeMapping{native,
                               [](const Value& v) -> ToDb {
                                   const auto* t = std::get_if<QTime>(&v);
                                   if (!t || !t->isValid()) return std::unexpected(storeMismatch(LogicalType::Time, v));
                                   return SqlValue(t->toString(QStringLiteral("HH:mm:ss.zzz")).toStdString());
                               },
                               [](const SqlValue& v) -> ToNative {
                                   if (v.type() != SqlValueType::String) return std::unexpected(decodeFailure(LogicalType::Time, v));
                                   QTime time = QTime::fromString(textOf(v), Qt::ISODateWithMs);
                                   if (!time.isValid()) time = QTime::fromString(textOf(v), Qt::ISODate);
                                   if (!time.isValid()) return std::unexpected(decodeFailure(LogicalType::Time, v, "'" + v.toString() + "' is not an ISO time"));
                                   return Value(time);
                               }};
        }

        // 时间戳统一规范化为 UTC 存储.
        // with_zone_suffix: 输出 "2024-01-01T00:00:00.000Z"; 否则输出 "2024-01-01 00:00:00.000" (隐含 UTC)
        TypeMapping timestampMapping(const std::string& native, bool with_zone_suffix) {
            return TypeMapping{native,
                               [with_zone_suffix](const Value& v) -> ToDb {
                                   const auto* dt = std::get_if<QDateTime>(&v);
                                   if (!dt || !dt->isValid()) return std::unexpected(storeMismatch(LogicalType::Timestamp, v));
                                   QDateTime utc = dt->toUTC();
                                   if (with_zone_suffix) return SqlValue(utc.toString(Qt::ISODateWithMs).toStdString());
                                   return SqlValue(utc.toString(QStringLiteral("yyyy-MM-dd HH:mm:ss.zzz")).toStdString());
                               },
                               [](const SqlValue& v) -> ToNative {
                                   if (v.type() != SqlValueType::String) return std::unexpected(decodeFailure(LogicalType::Timestamp, v));
                                   const QString text = textOf(v);
                                   QDateTime dt = QDateTime::fromString(text, Qt::ISODateWithMs);
                                   if (!dt.isValid()) {
                                       // SQLite CURRENT_TIMESTAMP 以及 MySQL DATETIME 的格式, 不带时区即视为 UTC
                                       for (const QString& format : {QStringLiteral("yyyy-MM-dd HH:mm:ss.zzz"), QStringLiteral("yyyy-MM-dd HH:mm:ss")}) {
                                           dt = QDateTime::fromString(text, format);
                                           if (dt.isValid()) {
                                               dt = QDateTime(dt.date(), dt.time(), QTimeZone::utc());
                                               break;
                                           }
                                       }
                                   } else if (dt.timeSpec() == Qt::LocalTime) {
                                       dt = QDateTime(dt.date(), dt.time(), QTimeZone::utc());
                                   }
                                   if (!dt.isValid()) return std::unexpected(decodeFailure(LogicalType::Timestamp, v, "'" + v.toString() + "' is not an ISO-8601 timestamp"));
                                   return Value(dt.toUTC());
                               }};
        }

        TypeMapping uuidMapping(const std::string& native) {
            return TypeMapping{native,
                               [](const Value& v) -> ToDb {
                                   const auto* u = std::get_if<QUuid>(&v);
                                   if (!u) return std::unexpected(storeMismatch(LogicalType::Uuid, v));
                                   return SqlValue(u->toString(QUuid::WithoutBraces).toLower().toStdString());
                               },
                               [](const SqlValue& v) -> ToNative {
                                   if (v.type() != SqlValueType::String) return std::unexpected(decodeFailure(LogicalType::Uuid, v));
                                   const std::string text = v.toString();
                                   QUuid uuid = QUuid::fromString(QString::fromStdString(text));
                                   if (uuid.isNull() && text != kNilUuidText) return std::unexpected(decodeFailure(LogicalType::Uuid, v, "'" + text + "' is not a UUID"));
                                   return Value(uuid);
                               }};
        }

        // JSON 以紧凑文本存储, 空文档对应 JSON null
        TypeMapping jsonMapping(const std::string& native) {
            return TypeMapping{native,
                               [](const Value& v) -> ToDb {
                                   const auto* doc = std::get_if<QJsonDocument>(&v);
                                   if (!doc) return std::unexpected(storeMismatch(LogicalType::Json, v));
                                   if (doc->isNull()) return SqlValue(std::string("null"));
                                   return SqlValue(doc->toJson(QJsonDocument::Compact).toStdString());
                               },
                               [](const SqlValue& v) -> ToNative {
                                   if (v.type() != SqlValueType::String) return std::unexpected(decodeFailure(LogicalType::Json, v, "top-level JSON value must be an object or array"));
                                   const std::string text = v.toString();
                                   if (text == "null") return Value(QJsonDocument());
                                   QJsonParseError parse_error;
                                   QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(text), &parse_error);
                                   if (parse_error.error != QJsonParseError::NoError) {
                                       return std::unexpected(decodeFailure(LogicalType::Json, v, parse_error.errorString().toStdString()));
                                   }
                                   return Value(doc);
                               }};
        }

        void registerOrWarn(TypeMappingRegistry& registry, const std::string& dialect, LogicalType type, TypeMapping mapping) {
            // 内置表只在空注册表上注册一次, 冲突时保留已有的自定义条目
            auto registered = registry.registerMapping(dialect, type, std::move(mapping));
            if (!registered) {
                qWarning("cppquery TypeMappingRegistry: keeping existing %s mapping for %s", logicalTypeName(type), dialect.c_str());
            }
        }

    }  // namespace

    namespace type_mapping_builtins {

        void registerSqlite(TypeMappingRegistry& registry) {
            const std::string d = "sqlite";
            registerOrWarn(registry, d, LogicalType::Integer, integerMapping("INTEGER"));
            registerOrWarn(registry, d, LogicalType::Real, realMapping("REAL"));
            // 原生类型用 TEXT 以保持精确; 用户声明为 DECIMAL/NUMERIC 的列由 NUMERIC 亲和性存成 REAL, 读取时按浮点还原
            registerOrWarn(registry, d, LogicalType::Decimal, decimalMapping("TEXT", true));
            registerOrWarn(registry, d, LogicalType::Text, textMapping("TEXT"));
            registerOrWarn(registry, d, LogicalType::Blob, blobMapping("BLOB"));
            registerOrWarn(registry, d, LogicalType::Boolean, integerBooleanMapping("BOOLEAN"));
            registerOrWarn(registry, d, LogicalType::Date, dateMapping("DATE"));
            registerOrWarn(registry, d, LogicalType::Time, timeMapping("TIME"));
            registerOrWarn(registry, d, LogicalType::Timestamp, timestampMapping("TIMESTAMP", true));
            registerOrWarn(registry, d, LogicalType::Uuid, uuidMapping("TEXT"));
            registerOrWarn(registry, d, LogicalType::Json, jsonMapping("JSON"));

            for (const char* t : {"INTEGER", "INT", "BIGINT", "SMALLINT", "TINYINT", "MEDIUMINT"}) registry.registerDeclaredType(d, t, LogicalType::Integer);
            for (const char* t : {"REAL", "DOUBLE", "FLOAT", "DOUBLE PRECISION"}) registry.registerDeclaredType(d, t, LogicalType::Real);
            for (const char* t : {"DECIMAL", "NUMERIC"}) registry.registerDeclaredType(d, t, LogicalType::Decimal);
            for (const char* t : {"TEXT", "VARCHAR", "CHAR", "CLOB", "NVARCHAR", "NCHAR", "CHARACTER"}) registry.registerDeclaredType(d, t, LogicalType::Text);
            registry.registerDeclaredType(d, "BLOB", LogicalType::Blob);
            for (const char* t : {"BOOLEAN", "BOOL"}) registry.registerDeclaredType(d, t, LogicalType::Boolean);
            registry.registerDeclaredType(d, "DATE", LogicalType::Date);
            registry.registerDeclaredType(d, "TIME", LogicalType::Time);
            for (const char* t : {"TIMESTAMP", "DATETIME"}) registry.registerDeclaredType(d, t, LogicalType::Timestamp);
            registry.registerDeclaredType(d, "UUID", LogicalType::Uuid);
            registry.registerDeclaredType(d, "JSON", LogicalType::Json);
        }

        void registerMySql(TypeMappingRegistry& registry) {
            const std::string d = "mysql";
            registerOrWarn(registry, d, LogicalType::Integer, integerMapping("BIGINT"));
            registerOrWarn(registry, d, LogicalType::Real, realMapping("DOUBLE"));
            registerOrWarn(registry, d, LogicalType::Decimal, decimalMapping("DECIMAL(38,10)"));
            registerOrWarn(registry, d, LogicalType::Text, textMapping("TEXT"));
            registerOrWarn(registry, d, LogicalType::Blob, blobMapping("LONGBLOB"));
            registerOrWarn(registry, d, LogicalType::Boolean, integerBooleanMapping("TINYINT(1)"));
            registerOrWarn(registry, d, LogicalType::Date, dateMapping("DATE"));
            registerOrWarn(registry, d, LogicalType::Time, timeMapping("TIME(3)"));
            registerOrWarn(registry, d, LogicalType::Timestamp, timestampMapping("DATETIME(3)", false));
            registerOrWarn(registry, d, LogicalType::Uuid, uuidMapping("CHAR(36)"));
            registerOrWarn(registry, d, LogicalType::Json, jsonMapping("JSON"));

            for (const char* t : {"BIGINT", "INT", "INTEGER", "SMALLINT", "MEDIUMINT", "TINYINT"}) registry.registerDeclaredType(d, t, LogicalType::Integer);
            registry.registerDeclaredType(d, "TINYINT(1)", LogicalType::Boolean);
            for (const char* t : {"DOUBLE", "FLOAT", "REAL"}) registry.registerDeclaredType(d, t, LogicalType::Real);
            for (const char* t : {"DECIMAL", "NUMERIC"}) registry.registerDeclaredType(d, t, LogicalType::Decimal);
            for (const char* t : {"TEXT", "VARCHAR", "CHAR", "LONGTEXT", "MEDIUMTEXT", "TINYTEXT"}) registry.registerDeclaredType(d, t, LogicalType::Text);
            registry.registerDeclaredType(d, "CHAR(36)", LogicalType::Uuid);
            for (const char* t : {"BLOB", "LONGBLOB", "MEDIUMBLOB", "TINYBLOB", "VARBINARY", "BINARY"}) registry.registerDeclaredType(d, t, LogicalType::Blob);
            for (const char* t : {"BOOLEAN", "BOOL"}) registry.registerDeclaredType(d, t, LogicalType::Boolean);
            registry.registerDeclaredType(d, "DATE", LogicalType::Date);
            registry.registerDeclaredType(d, "TIME", LogicalType::Time);
            for (const char* t : {"DATETIME", "TIMESTAMP"}) registry.registerDeclaredType(d, t, LogicalType::Timestamp);
            registry.registerDeclaredType(d, "JSON", LogicalType::Json);
        }

        void registerPostgres(TypeMappingRegistry& registry) {
            const std::string d = "postgresql";
            registerOrWarn(registry, d, LogicalType::Integer, integerMapping("BIGINT"));
            registerOrWarn(registry, d, LogicalType::Real, realMapping("DOUBLE PRECISION"));
            registerOrWarn(registry, d, LogicalType::Decimal, decimalMapping("NUMERIC"));
            registerOrWarn(registry, d, LogicalType::Text, textMapping("TEXT"));
            registerOrWarn(registry, d, LogicalType::Blob, blobMapping("BYTEA"));
            registerOrWarn(registry, d, LogicalType::Boolean, nativeBooleanMapping("BOOLEAN"));
            registerOrWarn(registry, d, LogicalType::Date, dateMapping("DATE"));
            registerOrWarn(registry, d, LogicalType::Time, timeMapping("TIME"));
            registerOrWarn(registry, d, LogicalType::Timestamp, timestampMapping("TIMESTAMPTZ", true));
            registerOrWarn(registry, d, LogicalType::Uuid, uuidMapping("UUID"));
            registerOrWarn(registry, d, LogicalType::Json, jsonMapping("JSONB"));

            for (const char* t : {"BIGINT", "INTEGER", "INT", "INT2", "INT4", "INT8", "SMALLINT", "SERIAL", "BIGSERIAL"}) registry.registerDeclaredType(d, t, LogicalType::Integer);
            for (const char* t : {"DOUBLE PRECISION", "REAL", "FLOAT4", "FLOAT8"}) registry.registerDeclaredType(d, t, LogicalType::Real);
            registry.registerDeclaredType(d, "NUMERIC", LogicalType::Decimal);
            for (const char* t : {"TEXT", "VARCHAR", "CHARACTER VARYING", "CHAR", "BPCHAR"}) registry.registerDeclaredType(d, t, LogicalType::Text);
            registry.registerDeclaredType(d, "BYTEA", LogicalType::Blob);
            for (const char* t : {"BOOLEAN", "BOOL"}) registry.registerDeclaredType(d, t, LogicalType::Boolean);
            registry.registerDeclaredType(d, "DATE", LogicalType::Date);
            for (const char* t : {"TIME", "TIMETZ"}) registry.registerDeclaredType(d, t, LogicalType::Time);
            for (const char* t : {"TIMESTAMP", "TIMESTAMPTZ", "TIMESTAMP WITH TIME ZONE"}) registry.registerDeclaredType(d, t, LogicalType::Timestamp);
            registry.registerDeclaredType(d, "UUID", LogicalType::Uuid);
            for (const char* t : {"JSON", "JSONB"}) registry.registerDeclaredType(d, t, LogicalType::Json);
        }

    }  // namespace type_mapping_builtins

}  // namespace cppquery
