#ifndef cppquery_ASYNC_STORAGE_BACKEND_H
#define cppquery_ASYNC_STORAGE_BACKEND_H

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>

#include "cppquery/backend/storage_backend.h"
#include "cppquery/query/i_query_executor.h"

namespace cppquery {

    // StorageBackend 的异步外观. 所有 I/O 在一个单线程池上按提交顺序执行,
    // 协程在 I/O 处挂起并在调用方的执行器上恢复
    class AsyncStorageBackend : public IAsyncQueryExecutor {
      public:
        static std::expected<std::unique_ptr<AsyncStorageBackend>, Error> create(BackendConfig config, std::shared_ptr<const TypeMappingRegistry> type_registry, const cppquery_sqldriver::SqlDriverRegistry& drivers);

        ~AsyncStorageBackend() override;
        AsyncStorageBackend(const AsyncStorageBackend&) = delete;
        AsyncStorageBackend& operator=(const AsyncStorageBackend&) = delete;

        boost::asio::awaitable<std::expected<void, Error>> connectAsync();
        boost::asio::awaitable<std::expected<void, Error>> disconnectAsync();
        bool isConnected() const;

        // IAsyncQueryExecutor
        DialectPtr dialect() const override {
            return backend_->dialect();
        }
        boost::asio::awaitable<std::expected<QueryResult, Error>> executeAsync(CompiledStatement statement, ExecutionOptions options = {}) override;

        boost::asio::awaitable<std::expected<QueryResult, Error>> executeManyAsync(std::string sql, std::vector<std::vector<cppquery_sqldriver::SqlValue>> param_sets, ExecutionOptions options = {});

        boost::asio::awaitable<std::expected<void, Error>> beginTransactionAsync(std::optional<cppquery_sqldriver::TransactionIsolationLevel> isolation = std::nullopt);
        boost::asio::awaitable<std::expected<void, Error>> commitAsync();
        boost::asio::awaitable<std::expected<void, Error>> rollbackAsync();
        boost::asio::awaitable<std::expected<void, Error>> setIsolationLevelAsync(cppquery_sqldriver::TransactionIsolationLevel level);
        boost::asio::awaitable<std::expected<void, Error>> runInTransactionAsync(std::function<boost::asio::awaitable<std::expected<void, Error>>(AsyncStorageBackend&)> work,
                                                                                  std::optional<cppquery_sqldriver::TransactionIsolationLevel> isolation = std::nullopt);
        int transactionLevel() const;

        // 中断正在执行的语句, 线程安全
        void cancel();

        const BackendConfig& config() const {
            return backend_->config();
        }

      private:
        explicit AsyncStorageBackend(std::unique_ptr<StorageBackend> backend);

        // 在 I/O 线程上执行 fn, 挂起调用方直到完成
        template <typename Fn>
        boost::asio::awaitable<std::invoke_result_t<Fn&>> dispatch_(Fn fn) {
            using Result = std::invoke_result_t<Fn&>;
            co_return co_await boost::asio::co_spawn(
                pool_.get_executor(), [fn = std::move(fn)]() mutable -> boost::asio::awaitable<Result> { co_return fn(); }, boost::asio::use_awaitable);
        }

        std::unique_ptr<StorageBackend> backend_;
        boost::asio::thread_pool pool_{1};
    };

}  // namespace cppquery

#endif  // cppquery_ASYNC_STORAGE_BACKEND_H
