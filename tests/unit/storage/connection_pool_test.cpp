#include <chrono>
#include <filesystem>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <corpusdb/storage/connection_pool.h>

#include "common/test_helpers.h"

using namespace corpusdb;
using namespace corpusdb::storage;

class ConnectionPoolTest : public ::testing::Test {
protected:
    void SetUp() override { dbPath_ = tests::make_temp_db_path("connection_pool_test_"); }

    void TearDown() override { tests::remove_db_files(dbPath_); }

    std::filesystem::path dbPath_;
};

TEST_F(ConnectionPoolTest, AcquireAndReturn) {
    ConnectionPoolConfig config;
    config.minConnections = 2;
    config.maxConnections = 5;

    ConnectionPool pool(dbPath_.string(), config);
    ASSERT_TRUE(pool.initialize().has_value());

    auto stats = pool.getStats();
    EXPECT_EQ(stats.totalConnections, 2u);
    EXPECT_EQ(stats.availableConnections, 2u);
    EXPECT_EQ(stats.activeConnections, 0u);

    {
        auto connResult = pool.acquire();
        ASSERT_TRUE(connResult.has_value());

        auto conn = std::move(connResult).value();
        ASSERT_TRUE(conn->isValid());

        auto result = (**conn).execute("CREATE TABLE corpus (ID INTEGER)");
        ASSERT_TRUE(result.has_value());

        stats = pool.getStats();
        EXPECT_EQ(stats.activeConnections, 1u);
        EXPECT_EQ(stats.availableConnections, 1u);
    }

    stats = pool.getStats();
    EXPECT_EQ(stats.activeConnections, 0u);
    EXPECT_EQ(stats.availableConnections, 2u);
    EXPECT_EQ(stats.totalReleased, 1u);

    pool.shutdown();
}

TEST_F(ConnectionPoolTest, ConnectionsRunWithForeignKeysOff) {
    ConnectionPool pool(dbPath_.string());
    ASSERT_TRUE(pool.initialize().has_value());

    auto result = pool.withConnection([](Database& db) -> Result<int> {
        auto stmtResult = db.prepare("PRAGMA foreign_keys");
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        return stmt.getInt(0);
    });

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), 0);
}

TEST_F(ConnectionPoolTest, OpenTransactionIsRolledBackOnReturn) {
    ConnectionPool pool(dbPath_.string());
    ASSERT_TRUE(pool.initialize().has_value());

    ASSERT_TRUE(pool.withConnection([](Database& db) {
                        return db.execute("CREATE TABLE corpus (ID INTEGER)");
                    })
                    .has_value());

    ASSERT_TRUE(pool.withConnection([](Database& db) -> Result<void> {
                        auto begin = db.beginTransaction();
                        if (!begin)
                            return begin;
                        return db.execute("INSERT INTO corpus (ID) VALUES (1)");
                    })
                    .has_value());

    auto count = pool.withConnection([](Database& db) -> Result<int> {
        EXPECT_FALSE(db.inTransaction());
        auto stmtResult = db.prepare("SELECT COUNT(*) FROM corpus");
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        return stmt.getInt(0);
    });
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(count.value(), 0);
}

TEST_F(ConnectionPoolTest, MemoryPoolHoldsSingleConnection) {
    ConnectionPoolConfig config;
    config.minConnections = 3;
    config.maxConnections = 8;

    ConnectionPool pool(":memory:", config);
    ASSERT_TRUE(pool.initialize().has_value());
    EXPECT_EQ(pool.getStats().totalConnections, 1u);

    auto first = pool.acquire();
    ASSERT_TRUE(first.has_value());

    // The only connection is out; a second caller waits and times out
    auto second = pool.acquire(std::chrono::milliseconds(50));
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, ErrorCode::Timeout);
    EXPECT_EQ(pool.getStats().failedAcquisitions, 1u);
}

TEST_F(ConnectionPoolTest, AcquireAfterShutdownFails) {
    ConnectionPool pool(dbPath_.string());
    ASSERT_TRUE(pool.initialize().has_value());
    pool.shutdown();

    auto conn = pool.acquire();
    ASSERT_FALSE(conn.has_value());
    EXPECT_EQ(conn.error().code, ErrorCode::InvalidState);
}

TEST_F(ConnectionPoolTest, ConcurrentWriters) {
    ConnectionPoolConfig config;
    config.maxConnections = 4;
    ConnectionPool pool(dbPath_.string(), config);
    ASSERT_TRUE(pool.initialize().has_value());

    ASSERT_TRUE(pool.withConnection([](Database& db) {
                        return db.execute(
                            "CREATE TABLE counter (ID INTEGER PRIMARY KEY, value INTEGER);"
                            "INSERT INTO counter (ID, value) VALUES (1, 0);");
                    })
                    .has_value());

    const int numThreads = 4;
    const int incrementsPerThread = 25;
    std::vector<std::thread> threads;

    for (int i = 0; i < numThreads; ++i) {
        threads.emplace_back([&pool]() {
            for (int j = 0; j < incrementsPerThread; ++j) {
                auto result = pool.withConnection([](Database& db) -> Result<void> {
                    return db.transaction(
                        [&db]() -> Result<void> {
                            return db.execute("UPDATE counter SET value = value + 1 WHERE ID = 1");
                        },
                        TransactionMode::Immediate);
                });
                EXPECT_TRUE(result.has_value()) << result.error().message;
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    auto result = pool.withConnection([](Database& db) -> Result<int> {
        auto stmtResult = db.prepare("SELECT value FROM counter WHERE ID = 1");
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();

        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();

        return stmt.getInt(0);
    });

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), numThreads * incrementsPerThread);
}
