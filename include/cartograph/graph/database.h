#pragma once

#include <cartograph/core/types.h>
#include <sqlite3.h>
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace cartograph::graph {

/**
 * @brief Database connection mode
 */
enum class ConnectionMode {
    ReadWrite, ///< Read-write mode (default)
    ReadOnly,  ///< Read-only mode
    Memory,    ///< In-memory database
    Create     ///< Create if not exists
};

/**
 * @brief Map a SQLite result code onto the store error taxonomy.
 *
 * BUSY/LOCKED/CANTOPEN/IOERR become StoreUnavailable, CONSTRAINT becomes
 * ConstraintViolation, everything else DatabaseError.
 */
ErrorCode translateSqliteError(int rc);

/**
 * @brief SQLite statement wrapper with RAII
 */
class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    // Move-only
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    /**
     * @brief Bind parameters to statement
     */
    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, double value);
    Result<void> bind(int index, const std::string& value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }

    /**
     * @brief Bind multiple parameters using variadic templates
     */
    template <typename... Args> Result<void> bindAll(Args&&... args) {
        return bindHelper(1, std::forward<Args>(args)...);
    }

    /**
     * @brief Execute statement (for non-SELECT queries)
     */
    Result<void> execute();

    /**
     * @brief Step through results (for SELECT queries)
     * @return true if row available, false if done
     */
    Result<bool> step();

    int getInt(int column) const;
    int64_t getInt64(int column) const;
    std::string getString(int column) const;
    bool isNull(int column) const;

private:
    sqlite3_stmt* stmt_ = nullptr;

    template <typename T, typename... Rest>
    Result<void> bindHelper(int index, T&& value, Rest&&... rest) {
        auto result = bind(index, std::forward<T>(value));
        if (!result)
            return result;
        if constexpr (sizeof...(rest) > 0) {
            return bindHelper(index + 1, std::forward<Rest>(rest)...);
        }
        return {};
    }

    Result<void> bindHelper(int) { return {}; }
};

/**
 * @brief Database connection wrapper
 */
class Database {
public:
    Database() = default;
    ~Database();

    // Move-only
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::ReadWrite);
    void close();

    Result<Statement> prepare(const std::string& sql);

    /**
     * @brief Execute SQL directly (for non-SELECT queries)
     */
    Result<void> execute(const std::string& sql);

    /**
     * @brief Begin a write transaction (BEGIN IMMEDIATE so writers serialize up front)
     */
    Result<void> beginTransaction();
    Result<void> commit();
    Result<void> rollback();
    [[nodiscard]] bool inTransaction() const { return inTransaction_; }

    /**
     * @brief Execute within transaction; any error or exception rolls back.
     */
    template <typename Func> Result<void> transaction(Func&& func) {
        auto beginResult = beginTransaction();
        if (!beginResult)
            return beginResult;

        try {
            auto result = func();
            if (!result) {
                auto rb = rollback();
                if (!rb) {
                    logRollbackFailure(rb.error().message);
                }
                return result;
            }
            return commit();
        } catch (...) {
            if (auto rb = rollback(); !rb) {
                logRollbackFailure(rb.error().message);
            }
            throw;
        }
    }

    int64_t lastInsertRowId() const;
    Result<void> setBusyTimeout(std::chrono::milliseconds timeout);
    Result<void> enableWAL();

private:
    sqlite3* db_ = nullptr;
    bool inTransaction_ = false;

    static void logRollbackFailure(const std::string& message);
};

} // namespace cartograph::graph
