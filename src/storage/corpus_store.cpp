#include <spdlog/spdlog.h>
#include <filesystem>
#include <system_error>
#include <corpusdb/storage/corpus_store.h>
#include <corpusdb/storage/migration.h>

#include "store/integrity_ops.hpp"
#include "store/record_ops.hpp"
#include "store/result_helpers.hpp"

namespace corpusdb::storage {

using namespace detail;

namespace {

const std::string kSelectCorpus = std::string("SELECT ") + kCorpusColumns + " FROM corpus";
const std::string kSelectDocument = std::string("SELECT ") + kDocumentColumns + " FROM document";

Result<std::optional<CorpusRecord>> findCorpusByName(Database& db, const std::string& name) {
    return queryOne(db, kSelectCorpus + " WHERE name = ?", mapCorpusRow, name);
}

Result<std::optional<DocumentRecord>> findDocumentByName(Database& db, const std::string& name) {
    return queryOne(db, kSelectDocument + " WHERE name = ?", mapDocumentRow, name);
}

Result<CorpusRecord> addCorpus(Database& db, const std::string& name,
                               const std::optional<std::string>& title) {
    CORPUSDB_TRY(validateName(name, "Corpus"));
    CORPUSDB_TRY(requireUniqueName(db, "corpus", name));

    CorpusRecord corpus{0, name, title};
    CORPUSDB_TRY_UNWRAP(id, insertCorpus(db, corpus));
    corpus.id = id;
    spdlog::debug("Created corpus '{}' ({})", name, id);
    return corpus;
}

Result<DocumentRecord> addDocument(Database& db, const DocumentRecord& draft) {
    CORPUSDB_TRY(validateName(draft.name, "Document"));
    CORPUSDB_TRY(requireParent(db, "corpus", draft.corpusId));
    CORPUSDB_TRY(requireUniqueName(db, "document", draft.name));

    DocumentRecord doc = draft;
    CORPUSDB_TRY_UNWRAP(id, insertDocument(db, doc));
    doc.id = id;
    spdlog::debug("Created document '{}' ({}) in corpus {}", doc.name, id, doc.corpusId);
    return doc;
}

Result<std::string> nameOf(Database& db, const char* table, RowId id) {
    CORPUSDB_TRY_UNWRAP(name, queryOne(
                                  db, std::string("SELECT name FROM ") + table + " WHERE ID = ?",
                                  [](const Statement& stmt) { return stmt.getString(0); }, id));
    if (!name) {
        return Error{ErrorCode::NotFound,
                     std::string("No ") + table + " with ID " + std::to_string(id)};
    }
    return std::move(*name);
}

} // namespace

CorpusStore::CorpusStore(ConnectionPool& pool) : pool_(pool) {}

Result<void> CorpusStore::initialize() {
    std::lock_guard<std::mutex> lock(writeMutex_);
    return pool_.withConnection([](Database& db) -> Result<void> {
        MigrationManager mm(db);
        mm.registerMigrations(CorpusSchemaMigrations::getAllMigrations());

        auto result = mm.migrate();
        if (!result) {
            spdlog::error("Failed to initialize corpus schema: {}", result.error().message);
            return result;
        }
        spdlog::debug("Corpus store ready at '{}'", db.path());
        return {};
    });
}

Result<CorpusStoreHandle> openCorpusStore(const config::StoreConfig& config) {
    if (!config::apply_log_level(config.logLevel)) {
        return Error{ErrorCode::InvalidArgument, "Unknown log level '" + config.logLevel + "'"};
    }

    std::string path = config.dbPath.string();

    if (!isMemoryPath(path)) {
        auto parent = config.dbPath.parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                return Error{ErrorCode::InvalidState, "Cannot create directory '" +
                                                          parent.string() + "': " + ec.message()};
            }
        }
    }

    ConnectionPoolConfig poolConfig;
    poolConfig.maxConnections = config.maxConnections;
    poolConfig.busyTimeout = config.busyTimeout;
    poolConfig.enableWAL = config.enableWAL;

    auto pool = std::make_unique<ConnectionPool>(path, poolConfig);
    CORPUSDB_TRY(pool->initialize());

    auto store = std::make_unique<CorpusStore>(*pool);
    CORPUSDB_TRY(store->initialize());

    return CorpusStoreHandle{std::move(pool), std::move(store)};
}

// Corpus operations

Result<CorpusRecord> CorpusStore::createCorpus(const std::string& name,
                                               const std::optional<std::string>& title) {
    return executeWrite<CorpusRecord>(
        [&](Database& db) -> Result<CorpusRecord> { return addCorpus(db, name, title); });
}

Result<CorpusRecord> CorpusStore::ensureCorpus(const std::string& name,
                                               const std::optional<std::string>& title) {
    return executeWrite<CorpusRecord>([&](Database& db) -> Result<CorpusRecord> {
        CORPUSDB_TRY_UNWRAP(existing, findCorpusByName(db, name));
        if (existing) {
            return std::move(*existing);
        }
        return addCorpus(db, name, title);
    });
}

Result<std::optional<CorpusRecord>> CorpusStore::getCorpus(RowId id) {
    return executeRead<std::optional<CorpusRecord>>([&](Database& db) {
        return queryOne(db, kSelectCorpus + " WHERE ID = ?", mapCorpusRow, id);
    });
}

Result<std::optional<CorpusRecord>> CorpusStore::getCorpusByName(const std::string& name) {
    return executeRead<std::optional<CorpusRecord>>(
        [&](Database& db) { return findCorpusByName(db, name); });
}

Result<std::vector<CorpusRecord>> CorpusStore::listCorpora() {
    return executeRead<std::vector<CorpusRecord>>(
        [&](Database& db) { return queryAll(db, kSelectCorpus + " ORDER BY ID", mapCorpusRow); });
}

Result<void> CorpusStore::updateCorpus(const CorpusRecord& corpus) {
    return executeWrite<void>([&](Database& db) -> Result<void> {
        CORPUSDB_TRY(validateName(corpus.name, "Corpus"));
        CORPUSDB_TRY_UNWRAP(oldName, nameOf(db, "corpus", corpus.id));
        CORPUSDB_TRY(requireUniqueName(db, "corpus", corpus.name, corpus.id));

        CORPUSDB_TRY(executeChanges(db, "UPDATE corpus SET name = ?, title = ? WHERE ID = ?",
                                    corpus.name, corpus.title, corpus.id));
        if (oldName != corpus.name) {
            CORPUSDB_TRY(executeChanges(db, "UPDATE meta_cor SET name = ? WHERE name = ?",
                                        corpus.name, oldName));
            spdlog::debug("Renamed corpus '{}' to '{}'", oldName, corpus.name);
        }
        return {};
    });
}

Result<void> CorpusStore::deleteCorpus(RowId id) {
    return executeWrite<void>([&](Database& db) -> Result<void> {
        CORPUSDB_TRY(requireTarget(db, "corpus", id));
        return purgeCorpus(db, id);
    });
}

// Document operations

Result<DocumentRecord> CorpusStore::createDocument(const std::string& name, RowId corpusId,
                                                   const std::optional<std::string>& title,
                                                   const std::optional<std::string>& lang) {
    return executeWrite<DocumentRecord>([&](Database& db) -> Result<DocumentRecord> {
        return addDocument(db, DocumentRecord{0, name, title, lang, corpusId});
    });
}

Result<DocumentRecord> CorpusStore::ensureDocument(const std::string& name, RowId corpusId,
                                                   const std::optional<std::string>& title,
                                                   const std::optional<std::string>& lang) {
    return executeWrite<DocumentRecord>([&](Database& db) -> Result<DocumentRecord> {
        CORPUSDB_TRY_UNWRAP(existing, findDocumentByName(db, name));
        if (existing) {
            if (existing->corpusId != corpusId) {
                spdlog::debug("Document '{}' already exists in corpus {}", name,
                              existing->corpusId);
            }
            return std::move(*existing);
        }
        return addDocument(db, DocumentRecord{0, name, title, lang, corpusId});
    });
}

Result<std::optional<DocumentRecord>> CorpusStore::getDocument(RowId id) {
    return executeRead<std::optional<DocumentRecord>>([&](Database& db) {
        return queryOne(db, kSelectDocument + " WHERE ID = ?", mapDocumentRow, id);
    });
}

Result<std::optional<DocumentRecord>> CorpusStore::getDocumentByName(const std::string& name) {
    return executeRead<std::optional<DocumentRecord>>(
        [&](Database& db) { return findDocumentByName(db, name); });
}

Result<std::vector<DocumentRecord>> CorpusStore::listDocuments(RowId corpusId) {
    return executeRead<std::vector<DocumentRecord>>(
        [&](Database& db) -> Result<std::vector<DocumentRecord>> {
            CORPUSDB_TRY(requireTarget(db, "corpus", corpusId));
            return queryAll(db, kSelectDocument + " WHERE corpusID = ? ORDER BY ID", mapDocumentRow,
                            corpusId);
        });
}

Result<void> CorpusStore::updateDocument(const DocumentRecord& document) {
    return executeWrite<void>([&](Database& db) -> Result<void> {
        CORPUSDB_TRY(validateName(document.name, "Document"));
        CORPUSDB_TRY_UNWRAP(oldName, nameOf(db, "document", document.id));
        CORPUSDB_TRY(requireParent(db, "corpus", document.corpusId));
        CORPUSDB_TRY(requireUniqueName(db, "document", document.name, document.id));

        CORPUSDB_TRY(executeChanges(
            db, "UPDATE document SET name = ?, title = ?, lang = ?, corpusID = ? WHERE ID = ?",
            document.name, document.title, document.lang, document.corpusId, document.id));
        if (oldName != document.name) {
            CORPUSDB_TRY(executeChanges(db, "UPDATE meta_doc SET name = ? WHERE name = ?",
                                        document.name, oldName));
            spdlog::debug("Renamed document '{}' to '{}'", oldName, document.name);
        }
        return {};
    });
}

Result<void> CorpusStore::deleteDocument(RowId id) {
    return executeWrite<void>([&](Database& db) -> Result<void> {
        CORPUSDB_TRY(requireTarget(db, "document", id));
        return purgeDocument(db, id);
    });
}

// Integrity and statistics

Result<IntegrityReport> CorpusStore::auditIntegrity() {
    return executeRead<IntegrityReport>([](Database& db) { return auditOrphans(db); });
}

Result<StoreStats> CorpusStore::stats() {
    return executeRead<StoreStats>([](Database& db) { return countRows(db); });
}

} // namespace corpusdb::storage
