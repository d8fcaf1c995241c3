#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <iterator>
#include <corpusdb/storage/migration.h>

namespace corpusdb::storage {

// MigrationManager implementation
MigrationManager::MigrationManager(Database& db) : db_(db) {}

void MigrationManager::registerMigration(Migration migration) {
    migrations_[migration.version] = std::move(migration);
}

void MigrationManager::registerMigrations(std::vector<Migration> migrations) {
    for (auto& migration : migrations) {
        registerMigration(std::move(migration));
    }
}

Result<int> MigrationManager::getCurrentVersion() {
    return db_.userVersion();
}

int MigrationManager::getLatestVersion() const {
    if (migrations_.empty())
        return 0;
    return migrations_.rbegin()->first;
}

Result<bool> MigrationManager::needsMigration() {
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();

    return currentResult.value() < getLatestVersion();
}

Result<void> MigrationManager::migrate() {
    return migrateTo(getLatestVersion());
}

Result<void> MigrationManager::migrateTo(int targetVersion) {
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();

    int currentVersion = currentResult.value();

    if (currentVersion == targetVersion) {
        spdlog::debug("Schema already at version {}", targetVersion);
        return {};
    }

    if (currentVersion > targetVersion) {
        return rollbackTo(targetVersion);
    }

    for (const auto& [version, migration] : migrations_) {
        if (version <= currentVersion || version > targetVersion) {
            continue;
        }

        spdlog::debug("Applying migration {} '{}'", version, migration.name);
        auto start = std::chrono::steady_clock::now();

        auto result = applyMigration(migration);
        if (!result) {
            spdlog::error("Migration {} '{}' failed: {}", version, migration.name,
                          result.error().message);
            return result;
        }

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        spdlog::debug("Migration {} applied in {} ms", version, duration.count());
        currentVersion = version;
    }

    spdlog::debug("Migration complete. Now at version {}", currentVersion);
    return {};
}

Result<void> MigrationManager::rollbackTo(int targetVersion) {
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();

    int currentVersion = currentResult.value();

    if (currentVersion <= targetVersion) {
        return Error{ErrorCode::InvalidArgument, "Cannot rollback to a higher version"};
    }

    for (auto it = migrations_.rbegin(); it != migrations_.rend() && it->first > targetVersion;
         ++it) {
        if (it->first > currentVersion) {
            continue;
        }
        spdlog::debug("Rolling back migration {} '{}'", it->first, it->second.name);

        auto next = std::next(it);
        int previousVersion = (next == migrations_.rend()) ? 0 : next->first;
        auto result = rollbackMigration(it->second, std::max(previousVersion, targetVersion));
        if (!result) {
            return result;
        }
    }

    spdlog::debug("Rollback complete. Now at version {}", targetVersion);
    return {};
}

Result<void> MigrationManager::verifyIntegrity() {
    auto stmtResult = db_.prepare("PRAGMA integrity_check");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();

    if (!stepResult.value() || stmt.getString(0) != "ok") {
        return Error{ErrorCode::InvalidData,
                     "Integrity check failed: " + (stepResult.value() ? stmt.getString(0) : "")};
    }
    return {};
}

Result<void> MigrationManager::applyMigration(const Migration& migration) {
    return db_.transaction(
        [&]() -> Result<void> {
            Result<void> result;
            if (migration.upFunc) {
                result = migration.upFunc(db_);
            } else if (!migration.upSQL.empty()) {
                result = db_.execute(migration.upSQL);
            } else {
                return Error{ErrorCode::InvalidData, "Migration has no up function or SQL"};
            }
            if (!result)
                return result;
            return db_.setUserVersion(migration.version);
        },
        TransactionMode::Immediate);
}

Result<void> MigrationManager::rollbackMigration(const Migration& migration,
                                                 int previousVersion) {
    return db_.transaction(
        [&]() -> Result<void> {
            Result<void> result;
            if (migration.downFunc) {
                result = migration.downFunc(db_);
            } else if (!migration.downSQL.empty()) {
                result = db_.execute(migration.downSQL);
            } else {
                return Error{ErrorCode::InvalidData, "Migration has no down function or SQL"};
            }
            if (!result)
                return result;
            return db_.setUserVersion(previousVersion);
        },
        TransactionMode::Immediate);
}

// CorpusSchemaMigrations implementation
std::vector<Migration> CorpusSchemaMigrations::getAllMigrations() {
    return {createCorpusSchema()};
}

const std::vector<std::string>& CorpusSchemaMigrations::tableNames() {
    static const std::vector<std::string> names = {
        "meta", "meta_doc", "meta_cor", "corpus", "document",
        "sentence", "token", "concept", "tag", "cwl"};
    return names;
}

Migration CorpusSchemaMigrations::createCorpusSchema() {
    Migration m;
    m.version = 1;
    m.name = "Create corpus schema";

    // Statement text is kept byte-identical to the corpus file format so the
    // sqlite_master entries match files written by other tools.
    m.upSQL = R"(CREATE TABLE meta (
  'key' TEXT PRIMARY KEY NOT NULL, 
  'value' TEXT
);
CREATE TABLE meta_doc (
  'name' TEXT NOT NULL,
  'key' TEXT NOT NULL, 
  'value' TEXT,
  FOREIGN KEY('name') REFERENCES document('name') ON DELETE CASCADE ON UPDATE CASCADE,
  UNIQUE ('name', 'key')
);
CREATE TABLE meta_cor (
  'name' TEXT NOT NULL,
  'key' TEXT NOT NULL, 
  'value' TEXT,
  FOREIGN KEY('name') REFERENCES corpus('name') ON DELETE CASCADE ON UPDATE CASCADE,
  UNIQUE ('name', 'key')
);
CREATE INDEX IF NOT EXISTS 'meta_|_key' ON 'meta' ('key');
CREATE INDEX IF NOT EXISTS 'meta_doc_|_name' ON 'meta_doc' ('name');
CREATE INDEX IF NOT EXISTS 'meta_doc_|_key' ON 'meta_doc' ('key');
CREATE INDEX IF NOT EXISTS 'meta_cor_|_name' ON 'meta_cor' ('name');
CREATE INDEX IF NOT EXISTS 'meta_cor_|_key' ON 'meta_cor' ('key');

CREATE TABLE IF NOT EXISTS "corpus" (
    "ID" INTEGER PRIMARY KEY AUTOINCREMENT
    , "name" text NOT NULL UNIQUE
    , "title" TEXT
);

CREATE TABLE IF NOT EXISTS "document" (
    "ID" INTEGER PRIMARY KEY AUTOINCREMENT
    , "name" TEXT NOT NULL UNIQUE
    , "title" TEXT
    , "lang" TEXT
    , "corpusID" INTEGER NOT NULL
    , FOREIGN KEY(corpusID) REFERENCES corpus(ID) ON DELETE CASCADE ON UPDATE CASCADE
);

CREATE TABLE IF NOT EXISTS "sentence" (
    "ID" INTEGER PRIMARY KEY AUTOINCREMENT
    , "ident" VARCHAR
    , "text" TEXT
    , "docID" INTEGER
    , "flag" INTEGER
    , "comment" TEXT
    , FOREIGN KEY(docID) REFERENCES document(ID) ON DELETE CASCADE ON UPDATE CASCADE
);

CREATE TABLE IF NOT EXISTS "token" (
    "ID" INTEGER PRIMARY KEY AUTOINCREMENT
    ,"sid" INTEGER
    ,"widx" INTEGER
    ,"cfrom" INTEGER
    ,"cto" INTEGER
    ,"text" TEXT
    ,"lemma" TEXT
    ,"pos" TEXT
    ,"comment" TEXT
    ,FOREIGN KEY(sid) REFERENCES sentence(ID) ON DELETE CASCADE ON UPDATE CASCADE
);

CREATE TABLE IF NOT EXISTS "concept" (
    "ID" INTEGER PRIMARY KEY AUTOINCREMENT
    ,"sid" INTEGER NOT NULL
    ,"cidx" INTEGER
    ,"clemma" TEXT
    ,"tag" TEXT
    ,"flag" TEXT
    ,"comment" TEXT
    ,FOREIGN KEY(sid) REFERENCES sentence(ID) ON DELETE CASCADE ON UPDATE CASCADE
);

CREATE TABLE IF NOT EXISTS "tag" (
    "ID" INTEGER PRIMARY KEY AUTOINCREMENT
    ,"sid" INTEGER NOT NULL
    ,"wid" INTEGER
    ,"cfrom" INTEGER
    ,"cto" INTEGER
    ,"label" TEXT
    ,"source" TEXT
    ,"tagtype" TEXT
    ,FOREIGN KEY(sid) REFERENCES sentence(ID) ON DELETE CASCADE ON UPDATE CASCADE
);

CREATE TABLE IF NOT EXISTS "cwl" (
    "sid" INTEGER NOT NULL
    ,"cid" INTEGER NOT NULL
    ,"wid" INTEGER NOT NULL
    ,FOREIGN KEY(sid) REFERENCES sentence(ID) ON DELETE CASCADE ON UPDATE CASCADE
    ,FOREIGN KEY(cid) REFERENCES concept(ID) ON DELETE CASCADE ON UPDATE CASCADE
    ,FOREIGN KEY(wid) REFERENCES word(ID) ON DELETE CASCADE ON UPDATE CASCADE
);

CREATE INDEX IF NOT EXISTS "corpus_|_name" ON "corpus" ("name");
CREATE INDEX IF NOT EXISTS "document_|_name" ON "document" ("name");
CREATE INDEX IF NOT EXISTS "document_|_lang" ON "document" ("lang");
CREATE INDEX IF NOT EXISTS "document_|_corpusID" ON "document" ("corpusID");
CREATE INDEX IF NOT EXISTS "sentence_|_text" ON "sentence" ("text");
CREATE INDEX IF NOT EXISTS "sentence_|_ident" ON "sentence" ("ident");
CREATE INDEX IF NOT EXISTS "sentence_|_docID" ON "sentence" ("docID");
CREATE INDEX IF NOT EXISTS "sentence_|_flag" ON "sentence" ("flag");
CREATE INDEX IF NOT EXISTS "token_|_sid" ON "token" ("sid");
CREATE INDEX IF NOT EXISTS "token_|_text" ON "token" ("text");
CREATE INDEX IF NOT EXISTS "token_|_lemma" ON "token" ("lemma");
CREATE INDEX IF NOT EXISTS "token_|_pos" ON "token" ("pos");
CREATE INDEX IF NOT EXISTS "concept_|_sid" ON "concept" ("sid");
CREATE INDEX IF NOT EXISTS "concept_|_clemma" ON "concept" ("clemma");
CREATE INDEX IF NOT EXISTS "concept_|_tag" ON "concept" ("tag");
CREATE INDEX IF NOT EXISTS "concept_|_flag" ON "concept" ("flag");
CREATE INDEX IF NOT EXISTS "tag_|_sid" ON "tag" ("sid");
CREATE INDEX IF NOT EXISTS "tag_|_wid" ON "tag" ("wid");
CREATE INDEX IF NOT EXISTS "tag_|_label" ON "tag" ("label");
CREATE INDEX IF NOT EXISTS "tag_|_source" ON "tag" ("source");
CREATE INDEX IF NOT EXISTS "tag_|_tagtype" ON "tag" ("tagtype");
CREATE UNIQUE INDEX IF NOT EXISTS "cwl_|_unique" ON "cwl" ("sid", "cid", "wid");
CREATE INDEX IF NOT EXISTS "cwl_|_sid" ON "cwl" ("sid");
CREATE INDEX IF NOT EXISTS "cwl_|_cid" ON "cwl" ("cid");
CREATE INDEX IF NOT EXISTS "cwl_|_wid" ON "cwl" ("wid");
)";

    // Files written before version stamping carry the tables already; adopt
    // them untouched.
    std::string upSQL = m.upSQL;
    m.upFunc = [upSQL](Database& db) -> Result<void> {
        auto exists = db.tableExists("corpus");
        if (!exists)
            return exists.error();
        if (exists.value()) {
            spdlog::debug("Adopting existing corpus schema in '{}'", db.path());
            return {};
        }
        return db.execute(upSQL);
    };

    m.downSQL = R"(
        DROP TABLE IF EXISTS cwl;
        DROP TABLE IF EXISTS tag;
        DROP TABLE IF EXISTS concept;
        DROP TABLE IF EXISTS token;
        DROP TABLE IF EXISTS sentence;
        DROP TABLE IF EXISTS meta_doc;
        DROP TABLE IF EXISTS meta_cor;
        DROP TABLE IF EXISTS document;
        DROP TABLE IF EXISTS corpus;
        DROP TABLE IF EXISTS meta;
    )";

    return m;
}

} // namespace corpusdb::storage
