// SqlDriver/Source/sqlite/sqlite_value_converter.cpp
#include <sqlite3.h>

#include "cppquery_sqldriver/sqlite/sqlite_driver_helper.h"

namespace cppquery_sqldriver {

    namespace sqlite_helper {

        int bindValue(sqlite3_stmt* stmt, int one_based_index, const SqlValue& value) {
            switch (value.type()) {
                case SqlValueType::Null:
                    return sqlite3_bind_null(stmt, one_based_index);
                case SqlValueType::Bool:
                    return sqlite3_bind_int(stmt, one_based_index, value.toBool() ? 1 : 0);
                case SqlValueType::Int64:
                    return sqlite3_bind_int64(stmt, one_based_index, static_cast<sqlite3_int64>(value.toInt64()));
                case SqlValueType::Double:
                    return sqlite3_bind_double(stmt, one_based_index, value.toDouble());
                case SqlValueType::String: {
                    std::string text = value.toString();
                    return sqlite3_bind_text64(stmt, one_based_index, text.data(), static_cast<sqlite3_uint64>(text.size()), SQLITE_TRANSIENT, SQLITE_UTF8);
                }
                case SqlValueType::ByteArray: {
                    SqlValue::Bytes bytes = value.toBytes();
                    if (bytes.empty()) {
                        return sqlite3_bind_zeroblob(stmt, one_based_index, 0);
                    }
                    return sqlite3_bind_blob64(stmt, one_based_index, bytes.data(), static_cast<sqlite3_uint64>(bytes.size()), SQLITE_TRANSIENT);
                }
            }
            return SQLITE_MISUSE;
        }

        SqlValue columnValue(sqlite3_stmt* stmt, int column_index) {
            switch (sqlite3_column_type(stmt, column_index)) {
                case SQLITE_INTEGER:
                    return SqlValue(static_cast<long long>(sqlite3_column_int64(stmt, column_index)));
                case SQLITE_FLOAT:
                    return SqlValue(sqlite3_column_double(stmt, column_index));
                case SQLITE_TEXT: {
                    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column_index));
                    int len = sqlite3_column_bytes(stmt, column_index);
                    return SqlValue(std::string(text ? text : "", static_cast<size_t>(len)));
                }
                case SQLITE_BLOB: {
                    const auto* data = static_cast<const unsigned char*>(sqlite3_column_blob(stmt, column_index));
                    int len = sqlite3_column_bytes(stmt, column_index);
                    if (!data || len <= 0) {
                        return SqlValue(SqlValue::Bytes{});
                    }
                    return SqlValue(SqlValue::Bytes(data, data + len));
                }
                case SQLITE_NULL:
                default:
                    return SqlValue();
            }
        }

        SqlField columnField(sqlite3_stmt* stmt, int column_index) {
            const char* name = sqlite3_column_name(stmt, column_index);
            const char* decl_type = sqlite3_column_decltype(stmt, column_index);
            return SqlField(name ? name : "", decl_type ? decl_type : "");
        }

    }  // namespace sqlite_helper
}  // namespace cppquery_sqldriver
