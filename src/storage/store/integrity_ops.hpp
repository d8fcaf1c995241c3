#pragma once

/**
 * @file integrity_ops.hpp
 * @brief Reference checks, uniqueness checks, cascades and the orphan audit
 *
 * SQLite foreign keys are off for corpus files, so every rule the schema
 * declares is enforced here. All functions run inside the caller's
 * transaction.
 */

#include <optional>
#include <string>
#include <corpusdb/storage/corpus_records.h>
#include <corpusdb/storage/database.h>

namespace corpusdb::storage::detail {

// Argument checks (InvalidArgument)
Result<void> validateName(const std::string& name, const char* what);
Result<void> validateSpan(const std::optional<int64_t>& cfrom, const std::optional<int64_t>& cto,
                          const char* what);

Result<bool> rowExists(Database& db, const char* table, RowId id);

/**
 * @brief DanglingReference unless table has a row with this ID
 */
Result<void> requireParent(Database& db, const char* table, RowId id);

/**
 * @brief NotFound unless table has a row with this ID
 */
Result<void> requireTarget(Database& db, const char* table, RowId id);

/**
 * @brief Sentence a token, concept or tag row belongs to
 */
Result<std::optional<RowId>> owningSentence(Database& db, const char* table, RowId id);

/**
 * @brief DuplicateKey if another row of table (corpus or document) has this name
 */
Result<void> requireUniqueName(Database& db, const char* table, const std::string& name,
                               RowId exceptId = 0);

Result<void> requireLinkAbsent(Database& db, const ConceptWordLink& link);

/**
 * @brief Resolve the link for a concept/token pair, checking both sit in one sentence
 */
Result<ConceptWordLink> resolveLink(Database& db, RowId conceptId, RowId tokenId);

// Cascades, dependents first
Result<void> purgeToken(Database& db, RowId tokenId);
Result<void> purgeConcept(Database& db, RowId conceptId);
Result<void> purgeSentence(Database& db, RowId sentenceId);
Result<void> purgeDocument(Database& db, RowId documentId);
Result<void> purgeCorpus(Database& db, RowId corpusId);

Result<IntegrityReport> auditOrphans(Database& db);
Result<StoreStats> countRows(Database& db);

} // namespace corpusdb::storage::detail
