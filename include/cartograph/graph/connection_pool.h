#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <type_traits>
#include <cartograph/graph/database.h>

namespace cartograph::graph {

/**
 * @brief Configuration for connection pool
 */
struct ConnectionPoolConfig {
    size_t minConnections = 1;                        ///< Connections opened at initialize()
    size_t maxConnections = 4;                        ///< Maximum connections allowed
    std::chrono::milliseconds acquireTimeout{5000};   ///< Wait bound for a free connection
    std::chrono::milliseconds busyTimeout{5000};      ///< SQLite busy timeout
    bool enableWAL = true;                            ///< Enable WAL mode
    bool enableForeignKeys = true;                    ///< Enable foreign key constraints
};

/**
 * @brief Database connection handed out by the pool; returns itself on destruction.
 */
class PooledConnection {
public:
    PooledConnection(std::unique_ptr<Database> db, std::function<void(PooledConnection*)> returnFunc);
    ~PooledConnection();

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    Database* operator->() { return db_.get(); }
    Database& operator*() { return *db_; }

private:
    friend class ConnectionPool;

    std::unique_ptr<Database> db_;
    std::function<void(PooledConnection*)> returnFunc_;
    bool returned_ = false;
};

/**
 * @brief Thread-safe database connection pool
 *
 * The pool is the only store resource shared across projects. It holds no
 * application-level locks beyond handing out connections; write isolation comes from
 * SQLite transactions.
 */
class ConnectionPool {
public:
    explicit ConnectionPool(const std::string& dbPath, const ConnectionPoolConfig& config = {});
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    Result<void> initialize();
    void shutdown();

    /**
     * @brief Acquire a connection, waiting up to the configured timeout.
     *
     * Returns StoreUnavailable when the pool is exhausted past the deadline or shut down.
     */
    Result<std::unique_ptr<PooledConnection>> acquire();

    /**
     * @brief Execute a function with a connection
     */
    template <typename Func>
    auto withConnection(Func&& func) -> std::invoke_result_t<Func, Database&> {
        auto connResult = acquire();
        if (!connResult) {
            return connResult.error();
        }

        auto conn = std::move(connResult).value();
        try {
            return func(**conn);
        } catch (const std::exception& e) {
            return Error{ErrorCode::DatabaseError, e.what()};
        }
    }

private:
    std::string dbPath_;
    ConnectionPoolConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::unique_ptr<PooledConnection>> available_;
    size_t totalConnections_{0};
    size_t activeConnections_{0};
    bool shutdown_{false};

    Result<std::unique_ptr<Database>> createConnection();
    Result<void> configureConnection(Database& db);
    std::unique_ptr<PooledConnection> wrap(std::unique_ptr<Database> db);
    void returnConnection(PooledConnection* conn);
};

} // namespace cartograph::graph
