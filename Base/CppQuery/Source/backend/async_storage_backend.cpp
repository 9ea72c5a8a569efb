// cppquery/Source/backend/async_storage_backend.cpp
#include "cppquery/backend/async_storage_backend.h"

#include <exception>

namespace cppquery {

    AsyncStorageBackend::AsyncStorageBackend(std::unique_ptr<StorageBackend> backend) : backend_(std::move(backend)) {
    }

    std::expected<std::unique_ptr<AsyncStorageBackend>, Error> AsyncStorageBackend::create(BackendConfig config, std::shared_ptr<const TypeMappingRegistry> type_registry, const cppquery_sqldriver::SqlDriverRegistry& drivers) {
        auto backend = StorageBackend::create(std::move(config), std::move(type_registry), drivers);
        if (!backend) {
            return std::unexpected(backend.error());
        }
        return std::unique_ptr<AsyncStorageBackend>(new AsyncStorageBackend(std::move(*backend)));
    }

    AsyncStorageBackend::~AsyncStorageBackend() {
        // 等待已提交的 I/O 完成后再释放连接
        pool_.join();
        if (backend_ && backend_->isConnected()) {
            if (auto closed = backend_->disconnect(); !closed && backend_->logger()) {
                backend_->logger()->warn("[AsyncBackend] disconnect during destruction failed: {}", closed.error().toString());
            }
        }
    }

    boost::asio::awaitable<std::expected<void, Error>> AsyncStorageBackend::connectAsync() {
        co_return co_await dispatch_([this] { return backend_->connect(); });
    }

    boost::asio::awaitable<std::expected<void, Error>> AsyncStorageBackend::disconnectAsync() {
        co_return co_await dispatch_([this] { return backend_->disconnect(); });
    }

    bool AsyncStorageBackend::isConnected() const {
        return backend_->isConnected();
    }

    boost::asio::awaitable<std::expected<QueryResult, Error>> AsyncStorageBackend::executeAsync(CompiledStatement statement, ExecutionOptions options) {
        co_return co_await dispatch_([this, statement = std::move(statement), options = std::move(options)] { return backend_->execute(statement, options); });
    }

    boost::asio::awaitable<std::expected<QueryResult, Error>> AsyncStorageBackend::executeManyAsync(std::string sql, std::vector<std::vector<cppquery_sqldriver::SqlValue>> param_sets, ExecutionOptions options) {
        co_return co_await dispatch_([this, sql = std::move(sql), param_sets = std::move(param_sets), options = std::move(options)] { return backend_->executeMany(sql, param_sets, options); });
    }

    boost::asio::awaitable<std::expected<void, Error>> AsyncStorageBackend::beginTransactionAsync(std::optional<cppquery_sqldriver::TransactionIsolationLevel> isolation) {
        co_return co_await dispatch_([this, isolation] { return backend_->beginTransaction(isolation); });
    }

    boost::asio::awaitable<std::expected<void, Error>> AsyncStorageBackend::commitAsync() {
        co_return co_await dispatch_([this] { return backend_->commit(); });
    }

    boost::asio::awaitable<std::expected<void, Error>> AsyncStorageBackend::rollbackAsync() {
        co_return co_await dispatch_([this] { return backend_->rollback(); });
    }

    boost::asio::awaitable<std::expected<void, Error>> AsyncStorageBackend::setIsolationLevelAsync(cppquery_sqldriver::TransactionIsolationLevel level) {
        co_return co_await dispatch_([this, level] { return backend_->setIsolationLevel(level); });
    }

    boost::asio::awaitable<std::expected<void, Error>> AsyncStorageBackend::runInTransactionAsync(std::function<boost::asio::awaitable<std::expected<void, Error>>(AsyncStorageBackend&)> work,
                                                                                                   std::optional<cppquery_sqldriver::TransactionIsolationLevel> isolation) {
        auto begun = co_await beginTransactionAsync(isolation);
        if (!begun) {
            co_return begun;
        }
        const int level = backend_->transactionLevel();

        std::expected<void, Error> outcome;
        std::exception_ptr failure;
        try {
            outcome = co_await work(*this);
        } catch (const std::exception& ex) {
            if (backend_->logger()) backend_->logger()->error("[AsyncBackend] exception inside transaction: {}", ex.what());
            failure = std::current_exception();
        }

        if (backend_->transactionLevel() < level) {
            if (failure) std::rethrow_exception(failure);
            if (!outcome) co_return outcome;
            co_return std::unexpected(Error(ErrorCode::TransactionError, "Transaction ended before the work completed").withDialect(dialect()->name()));
        }

        if (failure || !outcome) {
            auto rolled_back = co_await rollbackAsync();
            if (!rolled_back && backend_->logger()) {
                backend_->logger()->error("[AsyncBackend] rollback failed: {}", rolled_back.error().toString());
            }
            if (failure) std::rethrow_exception(failure);
            co_return outcome;
        }
        co_return co_await commitAsync();
    }

    int AsyncStorageBackend::transactionLevel() const {
        return backend_->transactionLevel();
    }

    void AsyncStorageBackend::cancel() {
        backend_->cancel();
    }

}  // namespace cppquery
