#ifndef cppquery_ERROR_H
#define cppquery_ERROR_H

#include <string>

namespace cppquery {

    // 错误码枚举
    enum class ErrorCode {
        Ok = 0,
        // 配置与构造错误
        InvalidConfiguration,
        ConstructionError,
        UnsupportedFeature,
        // 连接相关错误
        ConnectionFailed,
        ConnectionAlreadyOpen,
        ConnectionNotOpen,
        DriverNotFound,
        // 完整性与并发
        ConstraintViolation,
        LockTimeout,
        Deadlock,
        VersionConflict,
        // 类型映射
        TypeConversionError,
        // SQL 执行错误
        StatementPreparationError,
        QueryExecutionError,
        TransactionError,
        IsolationLevelError,
        RecursionLimitExceeded,
        QueryAlreadyConsumed,
        // 取消与超时
        OperationCancelled,
        Timeout,
        // 其他
        InternalError,
        UnknownError,
    };

    // 面向调用方的错误种类, 多个错误码归入同一种类
    enum class ErrorKind { None, Construction, Capability, Connection, Integrity, Concurrency, TypeConversion, Execution, Transaction, Cancellation, Timeout, Internal };

    const char* errorCodeName(ErrorCode code);
    const char* errorKindName(ErrorKind kind);
    ErrorKind errorKindOf(ErrorCode code);

    // Error 结构体，用于封装错误信息
    struct Error {
        ErrorCode code = ErrorCode::Ok;
        std::string message;
        int native_db_error_code = 0;  // 可选的数据库原生错误码
        std::string sql_state;         // 可选的 SQLSTATE
        std::string dialect;           // 出错时使用的方言 (sqlite / mysql / postgresql)
        std::string clause;            // 构造/能力错误所在的子句 (WHERE, JOIN, WITH ...)
        std::string constraint_name;   // 完整性错误中数据库报告的约束对象
        std::string failed_query;

        Error() = default;
        Error(ErrorCode c, std::string msg = "", int native_code = 0, std::string state = "")
            : code(c), message(std::move(msg)), native_db_error_code(native_code), sql_state(std::move(state)) {
        }

        // 检查是否为成功状态
        bool isOk() const {
            return code == ErrorCode::Ok;
        }

        // 允许在布尔上下文中使用 (if (error))
        explicit operator bool() const {
            return !isOk();
        }

        ErrorKind kind() const {
            return errorKindOf(code);
        }

        Error& withDialect(std::string d) {
            dialect = std::move(d);
            return *this;
        }

        Error& withClause(std::string c) {
            clause = std::move(c);
            return *this;
        }

        // 获取错误描述, 始终包含错误种类与方言
        std::string toString() const;
    };

    // 一个辅助函数，用于快速创建 Ok 状态的 Error
    inline Error make_ok() {
        return Error(ErrorCode::Ok);
    }

    Error makeConstructionError(std::string message, std::string clause = "", std::string dialect = "");
    Error makeCapabilityError(std::string message, std::string clause, std::string dialect);

}  // namespace cppquery

#endif  // cppquery_ERROR_H
