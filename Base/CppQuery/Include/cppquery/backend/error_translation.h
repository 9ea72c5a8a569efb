#ifndef cppquery_ERROR_TRANSLATION_H
#define cppquery_ERROR_TRANSLATION_H

#include <string>

#include "cppquery/error.h"
#include "cppquery_sqldriver/sql_error.h"

namespace cppquery {

    // 驱动层 SqlError 只在存储后端边界转换为 Error
    ErrorCode errorCodeForCategory(cppquery_sqldriver::ErrorCategory category);
    Error translateSqlError(const cppquery_sqldriver::SqlError& sql_error, const std::string& dialect, const std::string& failed_query = "");

}  // namespace cppquery

#endif  // cppquery_ERROR_TRANSLATION_H
