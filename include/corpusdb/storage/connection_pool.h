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
#include <corpusdb/storage/database.h>

namespace corpusdb::storage {

/**
 * @brief Configuration for connection pool
 */
struct ConnectionPoolConfig {
    size_t minConnections = 1;                   ///< Connections opened by initialize()
    size_t maxConnections = 4;                   ///< Maximum connections allowed
    std::chrono::milliseconds busyTimeout{5000}; ///< SQLite busy timeout
    bool enableWAL = true;                       ///< Enable WAL mode (file databases only)
};

/**
 * @brief True when the path names a private in-memory database
 */
bool isMemoryPath(const std::string& path);

/**
 * @brief Database connection wrapper with metadata
 */
class PooledConnection {
public:
    explicit PooledConnection(std::unique_ptr<Database> db,
                              std::function<void(PooledConnection*)> returnFunc);
    ~PooledConnection();

    // Move-only
    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;
    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    Database* operator->() { return db_.get(); }
    const Database* operator->() const { return db_.get(); }
    Database& operator*() { return *db_; }
    const Database& operator*() const { return *db_; }

    [[nodiscard]] bool isValid() const { return db_ != nullptr; }

    [[nodiscard]] std::chrono::steady_clock::time_point lastAccessed() const {
        return lastAccessed_;
    }

    void touch() { lastAccessed_ = std::chrono::steady_clock::now(); }

private:
    friend class ConnectionPool;

    std::unique_ptr<Database> db_;
    std::function<void(PooledConnection*)> returnFunc_;
    std::chrono::steady_clock::time_point lastAccessed_;
    bool returned_ = false;
};

/**
 * @brief Thread-safe database connection pool
 *
 * In-memory databases are private to one sqlite3 handle, so a pool over
 * ":memory:" always holds exactly one connection and never replaces it.
 */
class ConnectionPool {
public:
    explicit ConnectionPool(const std::string& dbPath, const ConnectionPoolConfig& config = {});
    ~ConnectionPool();

    // Non-copyable, non-movable
    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;
    ConnectionPool(ConnectionPool&&) = delete;
    ConnectionPool& operator=(ConnectionPool&&) = delete;

    Result<void> initialize();

    void shutdown();

    /**
     * @brief Acquire a connection from the pool
     */
    Result<std::unique_ptr<PooledConnection>>
    acquire(std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

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
        conn->touch();

        try {
            return func(**conn);
        } catch (const std::exception& e) {
            return Error{ErrorCode::DatabaseError, e.what()};
        }
    }

    struct Stats {
        size_t totalConnections;
        size_t availableConnections;
        size_t activeConnections;
        size_t totalAcquired;
        size_t totalReleased;
        size_t failedAcquisitions;
    };

    [[nodiscard]] Stats getStats() const;

    [[nodiscard]] const std::string& path() const { return dbPath_; }

private:
    std::string dbPath_;
    ConnectionPoolConfig config_;
    bool inMemory_ = false;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::unique_ptr<PooledConnection>> available_;
    std::atomic<size_t> totalConnections_{0};
    std::atomic<size_t> activeConnections_{0};
    std::atomic<size_t> totalAcquired_{0};
    std::atomic<size_t> totalReleased_{0};
    std::atomic<size_t> failedAcquisitions_{0};
    std::atomic<bool> shutdown_{false};

    Result<std::unique_ptr<Database>> createConnection();
    Result<void> configureConnection(Database& db);
    void returnConnection(PooledConnection* conn);
    std::unique_ptr<PooledConnection> wrap(std::unique_ptr<Database> db);
};

} // namespace corpusdb::storage
