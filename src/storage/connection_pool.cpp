#include <spdlog/spdlog.h>
#include <algorithm>
#include <string>
#include <corpusdb/storage/connection_pool.h>

namespace corpusdb::storage {

bool isMemoryPath(const std::string& path) {
    return path.empty() || path == ":memory:";
}

// PooledConnection implementation
PooledConnection::PooledConnection(std::unique_ptr<Database> db,
                                   std::function<void(PooledConnection*)> returnFunc)
    : db_(std::move(db)), returnFunc_(std::move(returnFunc)),
      lastAccessed_(std::chrono::steady_clock::now()) {}

PooledConnection::~PooledConnection() {
    if (db_ && returnFunc_ && !returned_) {
        returnFunc_(this);
    }
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : db_(std::move(other.db_)), returnFunc_(std::move(other.returnFunc_)),
      lastAccessed_(other.lastAccessed_), returned_(other.returned_) {
    other.returned_ = true; // Prevent double return
}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        if (db_ && returnFunc_ && !returned_) {
            returnFunc_(this);
        }
        db_ = std::move(other.db_);
        returnFunc_ = std::move(other.returnFunc_);
        lastAccessed_ = other.lastAccessed_;
        returned_ = other.returned_;
        other.returned_ = true;
    }
    return *this;
}

// ConnectionPool implementation
ConnectionPool::ConnectionPool(const std::string& dbPath, const ConnectionPoolConfig& config)
    : dbPath_(isMemoryPath(dbPath) ? std::string(":memory:") : dbPath), config_(config),
      inMemory_(isMemoryPath(dbPath)) {
    if (inMemory_) {
        config_.minConnections = 1;
        config_.maxConnections = 1;
        config_.enableWAL = false;
    }
    config_.maxConnections = std::max<size_t>(config_.maxConnections, 1);
    config_.minConnections = std::clamp<size_t>(config_.minConnections, 1, config_.maxConnections);
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

    spdlog::debug("Connection pool for '{}' initialized with {} connections", dbPath_,
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
        conn->returned_ = true;
    }

    totalConnections_ = 0;
    activeConnections_ = 0;
}

Result<std::unique_ptr<PooledConnection>>
ConnectionPool::acquire(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (shutdown_) {
        return Error{ErrorCode::InvalidState, "Pool is shut down"};
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (available_.empty()) {
        if (!inMemory_ && totalConnections_ < config_.maxConnections) {
            // Reserve the slot before dropping the lock
            totalConnections_++;
            lock.unlock();
            auto connResult = createConnection();
            lock.lock();

            if (!connResult) {
                totalConnections_--;
                failedAcquisitions_++;
                return connResult.error();
            }

            activeConnections_++;
            totalAcquired_++;
            return wrap(std::move(connResult).value());
        }

        if (!cv_.wait_until(lock, deadline, [this] { return !available_.empty() || shutdown_; })) {
            failedAcquisitions_++;
            return Error{ErrorCode::Timeout, "Timeout acquiring connection"};
        }

        if (shutdown_) {
            failedAcquisitions_++;
            return Error{ErrorCode::InvalidState, "Pool is shut down"};
        }
    }

    auto conn = std::move(available_.front());
    available_.pop();

    conn->touch();
    activeConnections_++;
    totalAcquired_++;
    return conn;
}

ConnectionPool::Stats ConnectionPool::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    return {totalConnections_, available_.size(), activeConnections_,
            totalAcquired_,    totalReleased_,    failedAcquisitions_};
}

Result<std::unique_ptr<Database>> ConnectionPool::createConnection() {
    auto db = std::make_unique<Database>();

    auto openResult =
        db->open(dbPath_, inMemory_ ? ConnectionMode::Memory : ConnectionMode::Create);
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

    // The corpus file format declares cascades against a table that does not
    // exist (cwl.wid -> word), so SQLite enforcement must stay off. The store
    // performs reference checks and cascades itself.
    auto fkResult = db.execute("PRAGMA foreign_keys = OFF");
    if (!fkResult) {
        return fkResult.error();
    }

    auto syncResult = db.execute("PRAGMA synchronous = NORMAL");
    if (!syncResult) {
        return syncResult.error();
    }
    return db.execute("PRAGMA temp_store = MEMORY");
}

std::unique_ptr<PooledConnection> ConnectionPool::wrap(std::unique_ptr<Database> db) {
    return std::make_unique<PooledConnection>(
        std::move(db), [this](PooledConnection* conn) { returnConnection(conn); });
}

void ConnectionPool::returnConnection(PooledConnection* conn) {
    if (!conn || !conn->db_)
        return;

    bool valid = conn->db_->isOpen();
    if (valid && conn->db_->inTransaction()) {
        spdlog::warn("Connection returned with an open transaction, rolling back");
        auto rb = conn->db_->rollback();
        if (!rb && !inMemory_) {
            valid = false;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        spdlog::debug("Discarding connection during shutdown");
        return;
    }

    if (!valid) {
        activeConnections_--;
        totalConnections_--;
        spdlog::warn("Returned connection is invalid, discarding");
        cv_.notify_one();
        return;
    }

    auto db = std::move(conn->db_);
    auto pooled = wrap(std::move(db));
    pooled->touch();
    available_.push(std::move(pooled));
    activeConnections_--;
    totalReleased_++;

    cv_.notify_one();
}

} // namespace corpusdb::storage
