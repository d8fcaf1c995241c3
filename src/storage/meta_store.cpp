#include <spdlog/spdlog.h>
#include <corpusdb/storage/corpus_store.h>

#include "store/record_ops.hpp"
#include "store/result_helpers.hpp"

namespace corpusdb::storage {

using namespace detail;

namespace {

struct MetaTable {
    const char* table;      ///< Table holding the pairs
    const char* ownerTable; ///< Table the owner name must exist in; null for Global
};

MetaTable metaTableFor(MetaScope scope) {
    switch (scope) {
        case MetaScope::Document:
            return {"meta_doc", "document"};
        case MetaScope::Corpus:
            return {"meta_cor", "corpus"};
        case MetaScope::Global:
            break;
    }
    return {"meta", nullptr};
}

Result<void> validateKey(const std::string& key) {
    if (key.empty()) {
        return Error{ErrorCode::InvalidArgument, "Metadata key must not be empty"};
    }
    return {};
}

Result<void> requireOwner(Database& db, const MetaTable& meta, const std::string& owner) {
    if (!meta.ownerTable) {
        return {};
    }
    CORPUSDB_TRY_UNWRAP(count, queryScalar(db,
                                           std::string("SELECT COUNT(*) FROM ") + meta.ownerTable +
                                               " WHERE name = ?",
                                           owner));
    if (count == 0) {
        return Error{ErrorCode::DanglingReference,
                     std::string("No ") + meta.ownerTable + " named '" + owner + "'"};
    }
    return {};
}

std::string missingKey(const MetaTable& meta, const std::string& owner, const std::string& key) {
    if (!meta.ownerTable) {
        return "No metadata key '" + key + "'";
    }
    return "No metadata key '" + key + "' on " + meta.ownerTable + " '" + owner + "'";
}

} // namespace

Result<void> CorpusStore::setMeta(MetaScope scope, const std::string& owner,
                                  const std::string& key, const std::string& value) {
    const auto meta = metaTableFor(scope);
    return executeWrite<void>([&](Database& db) -> Result<void> {
        CORPUSDB_TRY(validateKey(key));
        CORPUSDB_TRY(requireOwner(db, meta, owner));

        if (!meta.ownerTable) {
            CORPUSDB_TRY(executeChanges(db, "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?)",
                                        key, value));
        } else {
            CORPUSDB_TRY(executeChanges(db,
                                        std::string("INSERT OR REPLACE INTO ") + meta.table +
                                            " (name, key, value) VALUES (?, ?, ?)",
                                        owner, key, value));
        }
        spdlog::debug("Set {} metadata '{}'", meta.table, key);
        return {};
    });
}

Result<std::string> CorpusStore::getMeta(MetaScope scope, const std::string& owner,
                                         const std::string& key) {
    const auto meta = metaTableFor(scope);
    return executeRead<std::string>([&](Database& db) -> Result<std::string> {
        auto readValue = [](const Statement& stmt) { return stmt.getString(0); };

        Result<std::optional<std::string>> value =
            meta.ownerTable
                ? queryOne(db,
                           std::string("SELECT value FROM ") + meta.table +
                               " WHERE name = ? AND key = ?",
                           readValue, owner, key)
                : queryOne(db, "SELECT value FROM meta WHERE key = ?", readValue, key);
        CORPUSDB_TRY_UNWRAP(found, std::move(value));
        return from_optional(std::move(found),
                             Error{ErrorCode::NotFound, missingKey(meta, owner, key)});
    });
}

Result<std::vector<MetaEntry>> CorpusStore::listMeta(MetaScope scope, const std::string& owner) {
    const auto meta = metaTableFor(scope);
    return executeRead<std::vector<MetaEntry>>([&](Database& db) {
        auto readEntry = [&](const Statement& stmt) {
            return MetaEntry{scope, meta.ownerTable ? owner : std::string(), stmt.getString(0),
                             stmt.getString(1)};
        };
        if (!meta.ownerTable) {
            return queryAll(db, "SELECT key, value FROM meta ORDER BY key", readEntry);
        }
        return queryAll(db,
                        std::string("SELECT key, value FROM ") + meta.table +
                            " WHERE name = ? ORDER BY key",
                        readEntry, owner);
    });
}

Result<void> CorpusStore::deleteMeta(MetaScope scope, const std::string& owner,
                                     const std::string& key) {
    const auto meta = metaTableFor(scope);
    return executeWrite<void>([&](Database& db) -> Result<void> {
        Result<int> removed =
            meta.ownerTable
                ? executeChanges(db,
                                 std::string("DELETE FROM ") + meta.table +
                                     " WHERE name = ? AND key = ?",
                                 owner, key)
                : executeChanges(db, "DELETE FROM meta WHERE key = ?", key);
        CORPUSDB_TRY_UNWRAP(count, std::move(removed));
        if (count == 0) {
            return Error{ErrorCode::NotFound, missingKey(meta, owner, key)};
        }
        return {};
    });
}

} // namespace corpusdb::storage
