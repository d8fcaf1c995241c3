#pragma once

#include <sqlite3.h>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <corpusdb/core/types.h>

namespace corpusdb::storage {

/**
 * @brief Database connection mode
 */
enum class ConnectionMode {
    ReadWrite, ///< Read-write mode (default)
    Memory,    ///< In-memory database
    Create     ///< Create if not exists
};

/**
 * @brief How a transaction acquires its lock
 */
enum class TransactionMode {
    Deferred, ///< Lock on first access (read snapshots)
    Immediate ///< Take the write lock up front
};

/**
 * @brief Map a SQLite result code onto the store's error taxonomy
 */
ErrorCode translateError(int sqliteError);

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
    Result<void> bind(int index, const std::string& value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }

    /**
     * @brief Bind a nullable column; std::nullopt binds SQL NULL
     */
    Result<void> bind(int index, const std::optional<std::string>& value);
    Result<void> bind(int index, const std::optional<int64_t>& value);

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

    /**
     * @brief Get column values
     */
    int getInt(int column) const;
    int64_t getInt64(int column) const;
    std::string getString(int column) const;
    bool isNull(int column) const;

    /**
     * @brief Get nullable column values
     */
    std::optional<std::string> getOptionalString(int column) const;
    std::optional<int64_t> getOptionalInt64(int column) const;

    int columnCount() const;
    std::string columnName(int column) const;

    /**
     * @brief Reset statement for reuse
     */
    Result<void> reset();

    /**
     * @brief Clear all bindings
     */
    Result<void> clearBindings();

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

    Result<void> failure(int rc, const char* what) const;
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

    /**
     * @brief Open database connection
     */
    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::ReadWrite);

    /**
     * @brief Close database connection
     */
    void close();

    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    /**
     * @brief Prepare SQL statement
     */
    Result<Statement> prepare(const std::string& sql);

    /**
     * @brief Execute SQL directly (for non-SELECT queries, may hold several statements)
     */
    Result<void> execute(const std::string& sql);

    Result<void> beginTransaction(TransactionMode mode = TransactionMode::Deferred);
    Result<void> commit();
    Result<void> rollback();

    [[nodiscard]] bool inTransaction() const { return inTransaction_; }

    /**
     * @brief Execute within transaction
     *
     * The transaction commits when func succeeds and rolls back when it
     * returns an error or throws.
     */
    template <typename Func>
    Result<void> transaction(Func&& func, TransactionMode mode = TransactionMode::Deferred) {
        auto beginResult = beginTransaction(mode);
        if (!beginResult)
            return beginResult;

        try {
            Result<void> result = func();
            if (!result) {
                auto rb = rollback();
                (void)rb;
                return result;
            }
            auto commitResult = commit();
            if (!commitResult) {
                auto rb = rollback();
                (void)rb;
            }
            return commitResult;
        } catch (...) {
            auto rb = rollback();
            (void)rb;
            throw;
        }
    }

    int64_t lastInsertRowId() const;

    /**
     * @brief Number of rows affected by the last statement
     */
    int changes() const;

    Result<bool> tableExists(const std::string& table);

    Result<void> setBusyTimeout(std::chrono::milliseconds timeout);
    Result<void> enableWAL();

    /**
     * @brief Schema version stamp kept in the file header
     */
    Result<int> userVersion();
    Result<void> setUserVersion(int version);

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    bool inTransaction_ = false;
};

/**
 * @brief Query builder for the SELECT statements the store composes at runtime
 */
class QueryBuilder {
public:
    QueryBuilder() = default;

    QueryBuilder& select(const std::vector<std::string>& columns = {});
    QueryBuilder& from(const std::string& table);
    QueryBuilder& where(const std::string& condition);
    QueryBuilder& andWhere(const std::string& condition);
    QueryBuilder& orderBy(const std::string& column, bool ascending = true);
    QueryBuilder& groupBy(const std::string& column);
    QueryBuilder& limit(int limit);
    QueryBuilder& offset(int offset);

    [[nodiscard]] std::string build() const;

    void reset();

private:
    std::string table_;
    std::vector<std::string> selectColumns_;
    std::vector<std::string> whereClauses_;
    std::string groupByClause_;
    std::string orderByClause_;
    int limit_ = -1;
    int offset_ = -1;
};

} // namespace corpusdb::storage
