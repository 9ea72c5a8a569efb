// cppquery/Source/backend/storage_backend_lifecycle.cpp
#include <QFile>
#include <QString>

#include "cppquery/backend/error_translation.h"
#include "cppquery/backend/storage_backend.h"
#include "cppquery/dialect/dialect_factory.h"

namespace cppquery {

    StorageBackend::StorageBackend(BackendConfig config, std::shared_ptr<const TypeMappingRegistry> type_registry, std::unique_ptr<cppquery_sqldriver::ISqlDriver> driver, DialectPtr dialect)
        : config_(std::move(config)), type_registry_(std::move(type_registry)), driver_(std::move(driver)), dialect_(std::move(dialect)) {
        logger_ = config_.getOrCreateLogger();
        transactions_ = std::make_unique<TransactionManager>(*driver_, dialect_->name(), dialect_->supports(DialectFeature::Savepoint), logger_);
    }

    std::expected<std::unique_ptr<StorageBackend>, Error> StorageBackend::create(BackendConfig config, std::shared_ptr<const TypeMappingRegistry> type_registry, const cppquery_sqldriver::SqlDriverRegistry& drivers) {
        if (auto valid = config.validate(); !valid) {
            return std::unexpected(valid.error());
        }
        if (!type_registry) {
            type_registry = TypeMappingRegistry::createWithBuiltins();
        }

        auto driver = drivers.createDriver(config.driver_type);
        if (!driver) {
            return std::unexpected(Error(ErrorCode::DriverNotFound, "No driver registered for '" + config.driver_type + "'"));
        }

        DialectVersion version;
        if (config.dialect_version) {
            version = *config.dialect_version;
        } else {
            const std::string reported = driver->engineVersion();
            auto parsed = DialectVersion::parse(reported);
            if (!parsed) {
                return std::unexpected(Error(ErrorCode::InvalidConfiguration, "Cannot parse server version '" + reported + "', set dialect_version explicitly"));
            }
            version = *parsed;
        }

        auto dialect = makeDialect(config.driver_type, version, type_registry);
        if (!dialect) {
            return std::unexpected(dialect.error());
        }

        return std::unique_ptr<StorageBackend>(new StorageBackend(std::move(config), std::move(type_registry), std::move(driver), std::move(*dialect)));
    }

    StorageBackend::~StorageBackend() {
        if (isConnected()) {
            if (auto closed = disconnect(); !closed) {
                if (logger_) logger_->warn("[StorageBackend] disconnect during destruction failed: {}", closed.error().toString());
            }
        }
    }

    std::expected<void, Error> StorageBackend::connect() {
        if (driver_->isOpen()) {
            return std::unexpected(Error(ErrorCode::ConnectionAlreadyOpen, "Connection '" + config_.connection_name + "' is already open").withDialect(dialect_->name()));
        }
        if (!driver_->open(config_.toDriverParameters())) {
            Error err = translateSqlError(driver_->lastError(), dialect_->name());
            if (err.code != ErrorCode::ConnectionFailed) {
                err.message = "open failed: " + err.message;
                err.code = ErrorCode::ConnectionFailed;
            }
            if (logger_) logger_->error("[StorageBackend] failed to open '{}': {}", config_.database, err.message);
            return std::unexpected(err);
        }
        transactions_->reset();
        if (logger_) logger_->info("[StorageBackend] connected to '{}' ({} {}, connection '{}')", config_.database, dialect_->name(), dialect_->version().toString(), config_.connection_name);
        return {};
    }

    std::expected<void, Error> StorageBackend::disconnect() {
        if (!driver_->isOpen()) {
            return {};
        }
        std::expected<void, Error> outcome;
        if (transactions_->isActive()) {
            if (logger_) logger_->warn("[StorageBackend] disconnecting with an open transaction (level {}), rolling back", transactions_->level());
            outcome = transactions_->rollbackAll();
        }
        driver_->close();
        transactions_->reset();

        if (config_.delete_on_close && !config_.isMemoryDatabase()) {
            const QString path = QString::fromStdString(config_.database);
            for (const QString& file : {path, path + "-wal", path + "-shm", path + "-journal"}) {
                if (QFile::exists(file) && !QFile::remove(file)) {
                    if (logger_) logger_->warn("[StorageBackend] could not delete '{}'", file.toStdString());
                }
            }
        }
        if (logger_) logger_->info("[StorageBackend] disconnected from '{}'", config_.database);
        return outcome;
    }

    bool StorageBackend::isConnected() const {
        return driver_ && driver_->isOpen();
    }

    void StorageBackend::cancel() {
        if (logger_) logger_->info("[StorageBackend] cancel requested");
        driver_->interrupt();
    }

    std::string StorageBackend::serverVersion() const {
        return driver_->engineVersion();
    }

}  // namespace cppquery
