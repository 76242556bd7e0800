#include <spdlog/spdlog.h>
#include <cstdlib>
#include <string>
#include <cartograph/graph/connection_pool.h>

namespace cartograph::graph {

// PooledConnection implementation
PooledConnection::PooledConnection(std::unique_ptr<Database> db,
                                   std::function<void(PooledConnection*)> returnFunc)
    : db_(std::move(db)), returnFunc_(std::move(returnFunc)) {}

PooledConnection::~PooledConnection() {
    if (db_ && returnFunc_ && !returned_) {
        returnFunc_(this);
    }
}

// ConnectionPool implementation
ConnectionPool::ConnectionPool(const std::string& dbPath, const ConnectionPoolConfig& config)
    : dbPath_(dbPath), config_(config) {
    if (config_.maxConnections == 0) {
        config_.maxConnections = 1;
    }
    if (config_.minConnections > config_.maxConnections) {
        config_.minConnections = config_.maxConnections;
    }
}

ConnectionPool::~ConnectionPool() {
    shutdown();
}

Result<void> ConnectionPool::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        return Error{ErrorCode::InvalidState, "Pool is shut down"};
    }

    for (size_t i = 0; i < config_.minConnections; ++i) {
        auto connResult = createConnection();
        if (!connResult) {
            while (!available_.empty()) {
                available_.front()->returned_ = true;
                available_.pop();
            }
            totalConnections_ = 0;
            return connResult.error();
        }
        available_.push(wrap(std::move(connResult).value()));
        totalConnections_++;
    }

    spdlog::debug("Connection pool for {} initialized with {} connections", dbPath_,
                  config_.minConnections);
    return {};
}

void ConnectionPool::shutdown() {
    std::unique_lock<std::mutex> lock(mutex_);

    if (shutdown_) {
        return;
    }

    shutdown_ = true;
    cv_.notify_all();

    while (!available_.empty()) {
        auto conn = std::move(available_.front());
        available_.pop();
        // Mark connection as returned to prevent callback
        conn->returned_ = true;
    }
    totalConnections_ = 0;
    activeConnections_ = 0;
}

Result<std::unique_ptr<PooledConnection>> ConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    if (shutdown_) {
        return Error{ErrorCode::StoreUnavailable, "Pool is shut down"};
    }

    auto deadline = std::chrono::steady_clock::now() + config_.acquireTimeout;

    while (available_.empty()) {
        // Can we create a new connection?
        if (totalConnections_ < config_.maxConnections) {
            totalConnections_++;
            lock.unlock();
            auto connResult = createConnection();
            lock.lock();

            if (!connResult) {
                totalConnections_--;
                return connResult.error();
            }
            activeConnections_++;
            return wrap(std::move(connResult).value());
        }

        if (!cv_.wait_until(lock, deadline, [this] { return !available_.empty() || shutdown_; })) {
            return Error{ErrorCode::StoreUnavailable, "Timeout acquiring database connection"};
        }
        if (shutdown_) {
            return Error{ErrorCode::StoreUnavailable, "Pool is shut down"};
        }
    }

    auto conn = std::move(available_.front());
    available_.pop();
    activeConnections_++;
    return conn;
}

Result<std::unique_ptr<Database>> ConnectionPool::createConnection() {
    auto db = std::make_unique<Database>();

    auto openResult = db->open(dbPath_, ConnectionMode::Create);
    if (!openResult) {
        return openResult.error();
    }

    auto configResult = configureConnection(*db);
    if (!configResult) {
        return configResult.error();
    }

    return db;
}

Result<void> ConnectionPool::configureConnection(Database& db) {
    auto timeoutResult = db.setBusyTimeout(config_.busyTimeout);
    if (!timeoutResult) {
        return timeoutResult.error();
    }

    if (config_.enableWAL) {
        auto walResult = db.enableWAL();
        if (!walResult) {
            spdlog::warn("WAL enable failed: {}", walResult.error().message);
        }
    }

    if (config_.enableForeignKeys) {
        auto fkResult = db.execute("PRAGMA foreign_keys = ON");
        if (!fkResult) {
            return fkResult.error();
        }
    }

    // More relaxed durability when running tests
    const char* sync = std::getenv("CARTOGRAPH_TEST_TMPDIR") ? "PRAGMA synchronous = OFF"
                                                               : "PRAGMA synchronous = NORMAL";
    if (auto r = db.execute(sync); !r) {
        spdlog::debug("Setting synchronous pragma failed: {}", r.error().message);
    }
    if (auto r = db.execute("PRAGMA temp_store = MEMORY"); !r) {
        spdlog::debug("Setting temp_store pragma failed: {}", r.error().message);
    }
    return {};
}

std::unique_ptr<PooledConnection> ConnectionPool::wrap(std::unique_ptr<Database> db) {
    return std::make_unique<PooledConnection>(
        std::move(db), [this](PooledConnection* conn) { returnConnection(conn); });
}

void ConnectionPool::returnConnection(PooledConnection* conn) {
    if (!conn || !conn->db_)
        return;

    // A connection must never go back with an open transaction
    if (conn->db_->inTransaction()) {
        auto rb = conn->db_->rollback();
        if (!rb) {
            spdlog::warn("Failed to rollback transaction, discarding connection: {}",
                         rb.error().message);
            std::lock_guard<std::mutex> lock(mutex_);
            if (!shutdown_) {
                activeConnections_--;
                totalConnections_--;
            }
            cv_.notify_one();
            return;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
        spdlog::debug("Discarding connection during shutdown");
        return;
    }

    available_.push(wrap(std::move(conn->db_)));
    activeConnections_--;
    cv_.notify_one();
}

} // namespace cartograph::graph
