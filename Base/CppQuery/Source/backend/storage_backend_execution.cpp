// cppquery/Source/backend/storage_backend_execution.cpp
#include <chrono>

#include "cppquery/backend/error_translation.h"
#include "cppquery/backend/storage_backend.h"
#include "cppquery_sqldriver/sql_result.h"

namespace cppquery {

    std::expected<void, Error> StorageBackend::checkExecutable_(const std::string& sql, const StatementClassification& classification, const ExecutionOptions& options) const {
        if (!isConnected()) {
            return std::unexpected(Error(ErrorCode::ConnectionNotOpen, "Connection '" + config_.connection_name + "' is not open").withDialect(dialect_->name()));
        }
        if (sql.empty()) {
            return std::unexpected(Error(ErrorCode::StatementPreparationError, "SQL text is empty").withDialect(dialect_->name()));
        }
        if (classification.kind == StatementKind::TransactionControl) {
            Error err(ErrorCode::TransactionError, "Transaction control statements must go through beginTransaction() / commit() / rollback()");
            err.dialect = dialect_->name();
            err.failed_query = sql;
            return std::unexpected(err);
        }
        if (classification.kind == StatementKind::DDL && transactions_->isActive() && !options.allow_ddl_in_transaction) {
            Error err(ErrorCode::TransactionError, "DDL inside an explicit transaction requires allow_ddl_in_transaction");
            err.dialect = dialect_->name();
            err.failed_query = sql;
            return std::unexpected(err);
        }
        return {};
    }

    Error StorageBackend::handleExecutionFailure_(const cppquery_sqldriver::SqlError& sql_error, const std::string& sql) {
        Error err = translateSqlError(sql_error, dialect_->name(), sql);
        if (err.code == ErrorCode::Timeout && transactions_->isActive()) {
            // 超时的语句可能只执行了一部分, 整个事务作废
            if (logger_) logger_->warn("[StorageBackend] statement timed out inside a transaction, rolling back all {} level(s)", transactions_->level());
            if (auto rolled_back = transactions_->rollbackAll(); !rolled_back && logger_) {
                logger_->error("[StorageBackend] rollback after timeout failed: {}", rolled_back.error().toString());
            }
        } else {
            transactions_->resynchronize();
        }
        if (logger_) logger_->warn("[StorageBackend] {} ({}): {}", errorCodeName(err.code), sql, err.message);
        return err;
    }

    std::expected<Value, Error> StorageBackend::convertValue_(const cppquery_sqldriver::SqlValue& value, const std::string& column, const std::string& declared_type, const ExecutionOptions& options) const {
        if (value.isNull()) {
            return Value(nullptr);
        }
        const std::string dialect_name = dialect_->name();

        std::optional<LogicalType> type;
        if (auto hint = options.column_types.find(column); hint != options.column_types.end()) {
            type = hint->second;
        } else if (!declared_type.empty()) {
            type = type_registry_->logicalTypeForDeclaredType(dialect_name, declared_type);
        }
        if (!type) {
            return defaultNativeValue(value);
        }

        auto converted = type_registry_->toNative(dialect_name, value, *type);
        if (!converted) {
            Error err = converted.error();
            err.code = ErrorCode::TypeConversionError;
            err.message = "Column '" + column + "': " + err.message;
            err.dialect = dialect_name;
            return std::unexpected(err);
        }
        return converted;
    }

    std::expected<Row, Error> StorageBackend::convertRow_(const cppquery_sqldriver::SqlRecord& record, const std::shared_ptr<const std::vector<std::string>>& columns, const ExecutionOptions& options) const {
        std::vector<Value> values;
        values.reserve(static_cast<std::size_t>(record.count()));
        for (int i = 0; i < record.count(); ++i) {
            const auto& field = record.field(i);
            auto value = convertValue_(field.value(), field.name(), field.databaseTypeName(), options);
            if (!value) {
                return std::unexpected(value.error());
            }
            values.push_back(std::move(*value));
        }
        return Row(columns, std::move(values));
    }

    std::expected<QueryResult, Error> StorageBackend::execute(const CompiledStatement& statement, const ExecutionOptions& options) {
        return execute(statement.sql, statement.params, options);
    }

    std::expected<QueryResult, Error> StorageBackend::execute(const std::string& sql, const std::vector<cppquery_sqldriver::SqlValue>& params, const ExecutionOptions& options) {
        StatementClassification classification = StatementClassifier::classify(sql);
        if (options.classification) {
            classification.kind = *options.classification;
        }
        if (options.returning) {
            classification.has_returning = true;
            classification.returns_rows = true;
        }
        if (auto allowed = checkExecutable_(sql, classification, options); !allowed) {
            return std::unexpected(allowed.error());
        }

        if (logger_) logger_->debug("[StorageBackend] {} [{} param(s)]", sql, params.size());
        const auto started = std::chrono::steady_clock::now();

        auto result = driver_->createResult();
        if (!result) {
            return std::unexpected(Error(ErrorCode::InternalError, "Driver could not create a statement").withDialect(dialect_->name()));
        }
        if (!result->prepare(sql)) {
            return std::unexpected(handleExecutionFailure_(result->error(), sql));
        }
        if (auto timeout = options.timeout ? options.timeout : config_.statement_timeout) {
            if (!result->setQueryTimeout(*timeout) && logger_) {
                logger_->warn("[StorageBackend] driver rejected a statement timeout of {} ms", timeout->count());
            }
        }
        for (const auto& param : params) {
            result->addPositionalBindValue(param);
        }
        if (!result->exec()) {
            return std::unexpected(handleExecutionFailure_(result->error(), sql));
        }

        QueryResult query_result;
        query_result.kind = classification.kind;

        if (result->isSelect()) {
            const cppquery_sqldriver::SqlRecord metadata = result->recordMetadata();
            auto columns = std::make_shared<std::vector<std::string>>();
            columns->reserve(static_cast<std::size_t>(metadata.count()));
            for (int i = 0; i < metadata.count(); ++i) {
                columns->push_back(metadata.fieldName(i));
            }
            std::shared_ptr<const std::vector<std::string>> shared_columns = std::move(columns);

            cppquery_sqldriver::SqlRecord record;
            while (result->fetchNext(record)) {
                auto row = convertRow_(record, shared_columns, options);
                if (!row) {
                    result->finish();
                    return std::unexpected(row.error());
                }
                query_result.rows.push_back(std::move(*row));
            }
            if (result->error().isValid()) {
                return std::unexpected(handleExecutionFailure_(result->error(), sql));
            }
        }

        if (classification.kind == StatementKind::Insert || classification.kind == StatementKind::Update || classification.kind == StatementKind::Delete) {
            query_result.affected_rows = result->numRowsAffected();
        }
        if (classification.kind == StatementKind::Insert && query_result.affected_rows > 0) {
            auto id = result->lastInsertId();
            if (!id.isNull()) {
                bool ok = false;
                long long value = id.toInt64(&ok);
                if (ok) query_result.last_insert_id = value;
            }
        }
        result->finish();

        transactions_->noteStatementExecuted();
        query_result.duration = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started);
        if (logger_) logger_->trace("[StorageBackend] {} finished in {} us, {} row(s), {} affected", statementKindName(query_result.kind), query_result.duration.count(), query_result.rows.size(), query_result.affected_rows);
        return query_result;
    }

    std::expected<QueryResult, Error> StorageBackend::executeMany(const std::string& sql, const std::vector<std::vector<cppquery_sqldriver::SqlValue>>& param_sets, const ExecutionOptions& options) {
        StatementClassification classification = StatementClassifier::classify(sql);
        if (options.classification) {
            classification.kind = *options.classification;
        }
        if (auto allowed = checkExecutable_(sql, classification, options); !allowed) {
            return std::unexpected(allowed.error());
        }
        if (classification.returns_rows || options.returning) {
            return std::unexpected(Error(ErrorCode::ConstructionError, "executeMany() does not accept statements that return rows").withDialect(dialect_->name()));
        }

        if (logger_) logger_->debug("[StorageBackend] {} [{} parameter set(s)]", sql, param_sets.size());
        const auto started = std::chrono::steady_clock::now();

        auto result = driver_->createResult();
        if (!result) {
            return std::unexpected(Error(ErrorCode::InternalError, "Driver could not create a statement").withDialect(dialect_->name()));
        }
        if (!result->prepare(sql)) {
            return std::unexpected(handleExecutionFailure_(result->error(), sql));
        }
        if (auto timeout = options.timeout ? options.timeout : config_.statement_timeout) {
            if (!result->setQueryTimeout(*timeout) && logger_) {
                logger_->warn("[StorageBackend] driver rejected a statement timeout of {} ms", timeout->count());
            }
        }

        QueryResult query_result;
        query_result.kind = classification.kind;
        for (const auto& params : param_sets) {
            result->clearBindValues();
            for (const auto& param : params) {
                result->addPositionalBindValue(param);
            }
            if (!result->exec()) {
                return std::unexpected(handleExecutionFailure_(result->error(), sql));
            }
            query_result.affected_rows += result->numRowsAffected();
            if (classification.kind == StatementKind::Insert) {
                auto id = result->lastInsertId();
                bool ok = false;
                long long value = id.isNull() ? 0 : id.toInt64(&ok);
                if (ok) query_result.last_insert_id = value;
            }
            transactions_->noteStatementExecuted();
        }
        result->finish();

        query_result.duration = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started);
        return query_result;
    }

}  // namespace cppquery
