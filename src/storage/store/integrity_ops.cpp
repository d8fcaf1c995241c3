#include <spdlog/spdlog.h>
#include <string>

#include "integrity_ops.hpp"
#include "record_ops.hpp"
#include "result_helpers.hpp"

namespace corpusdb::storage::detail {

namespace {

// Delete the annotation layers of the sentences selected by sentenceIds (an
// SQL expression with one parameter), then the sentences themselves.
Result<void> purgeSentences(Database& db, const std::string& sentenceIds, RowId key) {
    for (const char* table : {"cwl", "tag", "token", "concept"}) {
        CORPUSDB_TRY(executeChanges(
            db, std::string("DELETE FROM ") + table + " WHERE sid IN (" + sentenceIds + ")", key));
    }
    CORPUSDB_TRY(executeChanges(db, "DELETE FROM sentence WHERE ID IN (" + sentenceIds + ")", key));
    return {};
}

} // namespace

Result<void> validateName(const std::string& name, const char* what) {
    if (name.empty()) {
        return Error{ErrorCode::InvalidArgument, std::string(what) + " name must not be empty"};
    }
    return {};
}

Result<void> validateSpan(const std::optional<int64_t>& cfrom, const std::optional<int64_t>& cto,
                          const char* what) {
    if (cfrom && cto && *cfrom > *cto) {
        return Error{ErrorCode::InvalidArgument, std::string(what) + " span starts after it ends (" +
                                                     std::to_string(*cfrom) + " > " +
                                                     std::to_string(*cto) + ")"};
    }
    return {};
}

Result<bool> rowExists(Database& db, const char* table, RowId id) {
    CORPUSDB_TRY_UNWRAP(
        count,
        queryScalar(db, std::string("SELECT COUNT(*) FROM ") + table + " WHERE ID = ?", id));
    return count > 0;
}

Result<void> requireParent(Database& db, const char* table, RowId id) {
    CORPUSDB_TRY_UNWRAP(exists, rowExists(db, table, id));
    if (!exists) {
        spdlog::debug("Rejected reference to missing {} {}", table, id);
        return Error{ErrorCode::DanglingReference,
                     std::string("No ") + table + " with ID " + std::to_string(id)};
    }
    return {};
}

Result<void> requireTarget(Database& db, const char* table, RowId id) {
    CORPUSDB_TRY_UNWRAP(exists, rowExists(db, table, id));
    if (!exists) {
        return Error{ErrorCode::NotFound,
                     std::string("No ") + table + " with ID " + std::to_string(id)};
    }
    return {};
}

Result<std::optional<RowId>> owningSentence(Database& db, const char* table, RowId id) {
    return queryOne(
        db, std::string("SELECT sid FROM ") + table + " WHERE ID = ?",
        [](const Statement& stmt) { return stmt.getInt64(0); }, id);
}

Result<void> requireUniqueName(Database& db, const char* table, const std::string& name,
                               RowId exceptId) {
    CORPUSDB_TRY_UNWRAP(
        count, queryScalar(db,
                           std::string("SELECT COUNT(*) FROM ") + table +
                               " WHERE name = ? AND ID != ?",
                           name, exceptId));
    if (count > 0) {
        return Error{ErrorCode::DuplicateKey,
                     std::string(table) + " name '" + name + "' already exists"};
    }
    return {};
}

Result<void> requireLinkAbsent(Database& db, const ConceptWordLink& link) {
    CORPUSDB_TRY_UNWRAP(count,
                        queryScalar(db,
                                    "SELECT COUNT(*) FROM cwl WHERE sid = ? AND cid = ? AND wid = ?",
                                    link.sentenceId, link.conceptId, link.tokenId));
    if (count > 0) {
        return Error{ErrorCode::DuplicateKey, "Concept " + std::to_string(link.conceptId) +
                                                  " is already linked to token " +
                                                  std::to_string(link.tokenId)};
    }
    return {};
}

Result<ConceptWordLink> resolveLink(Database& db, RowId conceptId, RowId tokenId) {
    CORPUSDB_TRY_UNWRAP(conceptSentence, owningSentence(db, "concept", conceptId));
    if (!conceptSentence) {
        return Error{ErrorCode::DanglingReference,
                     "No concept with ID " + std::to_string(conceptId)};
    }
    CORPUSDB_TRY_UNWRAP(tokenSentence, owningSentence(db, "token", tokenId));
    if (!tokenSentence) {
        return Error{ErrorCode::DanglingReference, "No token with ID " + std::to_string(tokenId)};
    }
    if (*conceptSentence != *tokenSentence) {
        return Error{ErrorCode::DanglingReference,
                     "Concept " + std::to_string(conceptId) + " and token " +
                         std::to_string(tokenId) + " belong to different sentences"};
    }
    return ConceptWordLink{*conceptSentence, conceptId, tokenId};
}

Result<void> purgeToken(Database& db, RowId tokenId) {
    CORPUSDB_TRY(executeChanges(db, "DELETE FROM cwl WHERE wid = ?", tokenId));
    CORPUSDB_TRY(executeChanges(db, "DELETE FROM tag WHERE wid = ?", tokenId));
    CORPUSDB_TRY(executeChanges(db, "DELETE FROM token WHERE ID = ?", tokenId));
    return {};
}

Result<void> purgeConcept(Database& db, RowId conceptId) {
    CORPUSDB_TRY(executeChanges(db, "DELETE FROM cwl WHERE cid = ?", conceptId));
    CORPUSDB_TRY(executeChanges(db, "DELETE FROM concept WHERE ID = ?", conceptId));
    return {};
}

Result<void> purgeSentence(Database& db, RowId sentenceId) {
    return purgeSentences(db, "?", sentenceId);
}

Result<void> purgeDocument(Database& db, RowId documentId) {
    CORPUSDB_TRY(purgeSentences(db, "SELECT ID FROM sentence WHERE docID = ?", documentId));
    CORPUSDB_TRY(executeChanges(
        db, "DELETE FROM meta_doc WHERE name IN (SELECT name FROM document WHERE ID = ?)",
        documentId));
    CORPUSDB_TRY(executeChanges(db, "DELETE FROM document WHERE ID = ?", documentId));
    spdlog::debug("Purged document {}", documentId);
    return {};
}

Result<void> purgeCorpus(Database& db, RowId corpusId) {
    CORPUSDB_TRY(purgeSentences(db,
                                "SELECT s.ID FROM sentence s JOIN document d ON s.docID = d.ID "
                                "WHERE d.corpusID = ?",
                                corpusId));
    CORPUSDB_TRY(executeChanges(
        db, "DELETE FROM meta_doc WHERE name IN (SELECT name FROM document WHERE corpusID = ?)",
        corpusId));
    CORPUSDB_TRY(executeChanges(db, "DELETE FROM document WHERE corpusID = ?", corpusId));
    CORPUSDB_TRY(executeChanges(
        db, "DELETE FROM meta_cor WHERE name IN (SELECT name FROM corpus WHERE ID = ?)",
        corpusId));
    CORPUSDB_TRY(executeChanges(db, "DELETE FROM corpus WHERE ID = ?", corpusId));
    spdlog::debug("Purged corpus {}", corpusId);
    return {};
}

Result<IntegrityReport> auditOrphans(Database& db) {
    IntegrityReport report;

    struct Check {
        int64_t* counter;
        const char* sql;
    };
    const Check checks[] = {
        {&report.orphanDocuments,
         "SELECT COUNT(*) FROM document d "
         "WHERE NOT EXISTS (SELECT 1 FROM corpus c WHERE c.ID = d.corpusID)"},
        {&report.orphanSentences,
         "SELECT COUNT(*) FROM sentence s "
         "WHERE NOT EXISTS (SELECT 1 FROM document d WHERE d.ID = s.docID)"},
        {&report.orphanTokens,
         "SELECT COUNT(*) FROM token t "
         "WHERE NOT EXISTS (SELECT 1 FROM sentence s WHERE s.ID = t.sid)"},
        {&report.orphanConcepts,
         "SELECT COUNT(*) FROM concept c "
         "WHERE NOT EXISTS (SELECT 1 FROM sentence s WHERE s.ID = c.sid)"},
        {&report.orphanTags,
         "SELECT COUNT(*) FROM tag g "
         "WHERE NOT EXISTS (SELECT 1 FROM sentence s WHERE s.ID = g.sid) "
         "OR (g.wid IS NOT NULL AND NOT EXISTS (SELECT 1 FROM token t WHERE t.ID = g.wid))"},
        {&report.orphanLinks,
         "SELECT COUNT(*) FROM cwl l "
         "WHERE NOT EXISTS (SELECT 1 FROM sentence s WHERE s.ID = l.sid) "
         "OR NOT EXISTS (SELECT 1 FROM concept c WHERE c.ID = l.cid) "
         "OR NOT EXISTS (SELECT 1 FROM token t WHERE t.ID = l.wid)"},
        {&report.crossSentenceLinks,
         "SELECT COUNT(*) FROM cwl l "
         "JOIN concept c ON c.ID = l.cid JOIN token t ON t.ID = l.wid "
         "WHERE c.sid != l.sid OR t.sid != l.sid"},
        {&report.orphanDocumentMeta,
         "SELECT COUNT(*) FROM meta_doc m "
         "WHERE NOT EXISTS (SELECT 1 FROM document d WHERE d.name = m.name)"},
        {&report.orphanCorpusMeta,
         "SELECT COUNT(*) FROM meta_cor m "
         "WHERE NOT EXISTS (SELECT 1 FROM corpus c WHERE c.name = m.name)"},
    };

    for (const auto& check : checks) {
        CORPUSDB_TRY_UNWRAP(count, queryScalar(db, check.sql));
        *check.counter = count;
    }

    if (!report.clean()) {
        spdlog::warn("Integrity audit found orphan rows");
    }
    return report;
}

Result<StoreStats> countRows(Database& db) {
    StoreStats stats;

    struct Count {
        int64_t* counter;
        const char* table;
    };
    const Count counts[] = {
        {&stats.corpora, "corpus"},      {&stats.documents, "document"},
        {&stats.sentences, "sentence"},  {&stats.tokens, "token"},
        {&stats.concepts, "concept"},    {&stats.tags, "tag"},
        {&stats.links, "cwl"},           {&stats.globalMeta, "meta"},
        {&stats.documentMeta, "meta_doc"}, {&stats.corpusMeta, "meta_cor"},
    };

    for (const auto& entry : counts) {
        CORPUSDB_TRY_UNWRAP(count,
                            queryScalar(db, std::string("SELECT COUNT(*) FROM ") + entry.table));
        *entry.counter = count;
    }
    return stats;
}

} // namespace corpusdb::storage::detail
