#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>
#include <corpusdb/storage/database.h>

namespace corpusdb::storage {

/**
 * @brief Database migration definition
 */
struct Migration {
    int version;         ///< Migration version number
    std::string name;    ///< Human-readable name
    std::string upSQL;   ///< SQL to apply migration
    std::string downSQL; ///< SQL to rollback migration (optional)

    /**
     * @brief Custom migration function (for complex migrations)
     */
    std::function<Result<void>(Database&)> upFunc;
    std::function<Result<void>(Database&)> downFunc;
};

/**
 * @brief Database migration manager
 *
 * The applied version is kept in the SQLite header (PRAGMA user_version) so
 * that migrating a corpus file adds no bookkeeping tables to it.
 */
class MigrationManager {
public:
    explicit MigrationManager(Database& db);

    void registerMigration(Migration migration);
    void registerMigrations(std::vector<Migration> migrations);

    Result<int> getCurrentVersion();
    int getLatestVersion() const;
    Result<bool> needsMigration();

    /**
     * @brief Apply all pending migrations
     */
    Result<void> migrate();
    Result<void> migrateTo(int targetVersion);
    Result<void> rollbackTo(int targetVersion);

    /**
     * @brief Run PRAGMA integrity_check and fail unless it reports "ok"
     */
    Result<void> verifyIntegrity();

private:
    Database& db_;
    std::map<int, Migration> migrations_;

    Result<void> applyMigration(const Migration& migration);
    Result<void> rollbackMigration(const Migration& migration, int previousVersion);
};

/**
 * @brief Built-in migrations for the corpus file schema
 */
class CorpusSchemaMigrations {
public:
    static std::vector<Migration> getAllMigrations();

    /**
     * @brief Tables of the corpus file format, in creation order
     */
    static const std::vector<std::string>& tableNames();

private:
    // Version 1: corpus file layout (meta, hierarchy, annotation layers, indices)
    static Migration createCorpusSchema();
};

} // namespace corpusdb::storage
