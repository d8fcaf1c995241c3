#pragma once

/**
 * @file record_ops.hpp
 * @brief Row mapping and single-table primitives shared by the store layers
 *
 * Everything here runs on a connection the caller already holds and inside
 * the caller's transaction. None of it checks references; that is the job of
 * integrity_ops.
 */

#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include <corpusdb/storage/corpus_records.h>
#include <corpusdb/storage/database.h>

#include "result_helpers.hpp"

namespace corpusdb::storage::detail {

// Column lists in the order the mappers below read them
inline constexpr const char* kCorpusColumns = "ID, name, title";
inline constexpr const char* kDocumentColumns = "ID, name, title, lang, corpusID";
inline constexpr const char* kSentenceColumns = "ID, ident, text, docID, flag, comment";
inline constexpr const char* kTokenColumns = "ID, sid, widx, cfrom, cto, text, lemma, pos, comment";
inline constexpr const char* kConceptColumns = "ID, sid, cidx, clemma, tag, flag, comment";
inline constexpr const char* kTagColumns = "ID, sid, wid, cfrom, cto, label, source, tagtype";

/**
 * @brief Prefix every column of a list with a table alias ("t" -> "t.ID, t.sid, ...")
 */
std::string qualifiedColumns(const std::string& alias, const std::string& columns);

CorpusRecord mapCorpusRow(const Statement& stmt);
DocumentRecord mapDocumentRow(const Statement& stmt);
SentenceRecord mapSentenceRow(const Statement& stmt);
TokenRecord mapTokenRow(const Statement& stmt);
ConceptRecord mapConceptRow(const Statement& stmt);
TagRecord mapTagRow(const Statement& stmt);
ConceptWordLink mapLinkRow(const Statement& stmt);

/**
 * @brief Run a SELECT and map every row
 */
template <typename Mapper, typename... Args>
auto queryAll(Database& db, const std::string& sql, Mapper&& map, Args&&... args)
    -> Result<std::vector<std::invoke_result_t<Mapper, const Statement&>>> {
    using Record = std::invoke_result_t<Mapper, const Statement&>;

    CORPUSDB_TRY_UNWRAP(stmt, db.prepare(sql));
    CORPUSDB_TRY(stmt.bindAll(std::forward<Args>(args)...));

    std::vector<Record> rows;
    while (true) {
        CORPUSDB_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow) {
            break;
        }
        rows.push_back(map(stmt));
    }
    return rows;
}

/**
 * @brief Run a SELECT and map the first row, if any
 */
template <typename Mapper, typename... Args>
auto queryOne(Database& db, const std::string& sql, Mapper&& map, Args&&... args)
    -> Result<std::optional<std::invoke_result_t<Mapper, const Statement&>>> {
    using Record = std::invoke_result_t<Mapper, const Statement&>;

    CORPUSDB_TRY_UNWRAP(stmt, db.prepare(sql));
    CORPUSDB_TRY(stmt.bindAll(std::forward<Args>(args)...));
    CORPUSDB_TRY_UNWRAP(hasRow, stmt.step());
    if (!hasRow) {
        return std::optional<Record>{};
    }
    return std::optional<Record>{map(stmt)};
}

/**
 * @brief Run a single-value integer query (COUNT, MAX, ...); NULL reads as 0
 */
template <typename... Args>
Result<int64_t> queryScalar(Database& db, const std::string& sql, Args&&... args) {
    CORPUSDB_TRY_UNWRAP(stmt, db.prepare(sql));
    CORPUSDB_TRY(stmt.bindAll(std::forward<Args>(args)...));
    CORPUSDB_TRY_UNWRAP(hasRow, stmt.step());
    if (!hasRow || stmt.isNull(0)) {
        return int64_t{0};
    }
    return stmt.getInt64(0);
}

/**
 * @brief Run a non-SELECT statement and return the number of rows it touched
 */
template <typename... Args>
Result<int> executeChanges(Database& db, const std::string& sql, Args&&... args) {
    CORPUSDB_TRY_UNWRAP(stmt, db.prepare(sql));
    CORPUSDB_TRY(stmt.bindAll(std::forward<Args>(args)...));
    CORPUSDB_TRY(stmt.execute());
    return db.changes();
}

// Inserts; each returns the new row's ID
Result<RowId> insertCorpus(Database& db, const CorpusRecord& corpus);
Result<RowId> insertDocument(Database& db, const DocumentRecord& document);
Result<RowId> insertSentence(Database& db, const SentenceRecord& sentence);
Result<RowId> insertToken(Database& db, const TokenRecord& token);
Result<RowId> insertConcept(Database& db, const ConceptRecord& record);
Result<RowId> insertTag(Database& db, const TagRecord& tag);
Result<void> insertLink(Database& db, const ConceptWordLink& link);

/**
 * @brief First free widx of a sentence (0 when it has no tokens)
 */
Result<int64_t> nextTokenIndex(Database& db, RowId sentenceId);

} // namespace corpusdb::storage::detail
