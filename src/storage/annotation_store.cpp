#include <corpusdb/storage/corpus_store.h>

#include "store/integrity_ops.hpp"
#include "store/record_ops.hpp"
#include "store/result_helpers.hpp"

namespace corpusdb::storage {

using namespace detail;

namespace {

const std::string kSelectConcept = std::string("SELECT ") + kConceptColumns + " FROM concept";
const std::string kSelectTag = std::string("SELECT ") + kTagColumns + " FROM tag";

// A token-level tag must point at a token of its own sentence
Result<void> requireTagToken(Database& db, RowId sentenceId, const std::optional<RowId>& tokenId) {
    if (!tokenId) {
        return {};
    }
    CORPUSDB_TRY_UNWRAP(tokenSentence, owningSentence(db, "token", *tokenId));
    if (!tokenSentence) {
        return Error{ErrorCode::DanglingReference, "No token with ID " + std::to_string(*tokenId)};
    }
    if (*tokenSentence != sentenceId) {
        return Error{ErrorCode::DanglingReference,
                     "Token " + std::to_string(*tokenId) + " belongs to sentence " +
                         std::to_string(*tokenSentence) + ", not " + std::to_string(sentenceId)};
    }
    return {};
}

Result<ConceptWordLink> addLink(Database& db, RowId conceptId, RowId tokenId) {
    CORPUSDB_TRY_UNWRAP(link, resolveLink(db, conceptId, tokenId));
    CORPUSDB_TRY(requireLinkAbsent(db, link));
    CORPUSDB_TRY(insertLink(db, link));
    return link;
}

} // namespace

// Concept operations

Result<ConceptRecord> CorpusStore::createConcept(const ConceptRecord& record) {
    return executeWrite<ConceptRecord>([&](Database& db) -> Result<ConceptRecord> {
        CORPUSDB_TRY(requireParent(db, "sentence", record.sentenceId));

        ConceptRecord stored = record;
        CORPUSDB_TRY_UNWRAP(id, insertConcept(db, stored));
        stored.id = id;
        return stored;
    });
}

Result<std::optional<ConceptRecord>> CorpusStore::getConcept(RowId id) {
    return executeRead<std::optional<ConceptRecord>>([&](Database& db) {
        return queryOne(db, kSelectConcept + " WHERE ID = ?", mapConceptRow, id);
    });
}

Result<std::vector<ConceptRecord>> CorpusStore::getConcepts(RowId sentenceId) {
    return executeRead<std::vector<ConceptRecord>>(
        [&](Database& db) -> Result<std::vector<ConceptRecord>> {
            CORPUSDB_TRY(requireTarget(db, "sentence", sentenceId));
            return queryAll(db, kSelectConcept + " WHERE sid = ? ORDER BY cidx, ID", mapConceptRow,
                            sentenceId);
        });
}

Result<void> CorpusStore::updateConcept(const ConceptRecord& record) {
    return executeWrite<void>([&](Database& db) -> Result<void> {
        CORPUSDB_TRY(requireTarget(db, "concept", record.id));
        CORPUSDB_TRY(executeChanges(
            db, "UPDATE concept SET cidx = ?, clemma = ?, tag = ?, flag = ?, comment = ? "
                "WHERE ID = ?",
            record.cidx, record.clemma, record.tag, record.flag, record.comment, record.id));
        return {};
    });
}

Result<void> CorpusStore::deleteConcept(RowId id) {
    return executeWrite<void>([&](Database& db) -> Result<void> {
        CORPUSDB_TRY(requireTarget(db, "concept", id));
        return purgeConcept(db, id);
    });
}

// Link operations

Result<ConceptWordLink> CorpusStore::linkConceptToken(RowId conceptId, RowId tokenId) {
    return executeWrite<ConceptWordLink>(
        [&](Database& db) -> Result<ConceptWordLink> { return addLink(db, conceptId, tokenId); });
}

Result<std::vector<ConceptWordLink>>
CorpusStore::linkConceptTokens(RowId conceptId, const std::vector<RowId>& tokenIds) {
    return executeWrite<std::vector<ConceptWordLink>>(
        [&](Database& db) -> Result<std::vector<ConceptWordLink>> {
            CORPUSDB_TRY(requireParent(db, "concept", conceptId));
            std::vector<ConceptWordLink> links;
            links.reserve(tokenIds.size());
            for (auto tokenId : tokenIds) {
                CORPUSDB_TRY_UNWRAP(link, addLink(db, conceptId, tokenId));
                links.push_back(link);
            }
            return links;
        });
}

Result<void> CorpusStore::unlinkConceptToken(RowId conceptId, RowId tokenId) {
    return executeWrite<void>([&](Database& db) -> Result<void> {
        CORPUSDB_TRY_UNWRAP(removed, executeChanges(db, "DELETE FROM cwl WHERE cid = ? AND wid = ?",
                                                    conceptId, tokenId));
        if (removed == 0) {
            return Error{ErrorCode::NotFound, "Concept " + std::to_string(conceptId) +
                                                  " is not linked to token " +
                                                  std::to_string(tokenId)};
        }
        return {};
    });
}

Result<std::vector<TokenRecord>> CorpusStore::getConceptTokens(RowId conceptId) {
    return executeRead<std::vector<TokenRecord>>(
        [&](Database& db) -> Result<std::vector<TokenRecord>> {
            CORPUSDB_TRY(requireTarget(db, "concept", conceptId));
            return queryAll(db,
                            "SELECT " + qualifiedColumns("t", kTokenColumns) +
                                " FROM token t JOIN cwl l ON l.wid = t.ID"
                                " WHERE l.cid = ? ORDER BY t.widx",
                            mapTokenRow, conceptId);
        });
}

Result<std::vector<ConceptRecord>> CorpusStore::getTokenConcepts(RowId tokenId) {
    return executeRead<std::vector<ConceptRecord>>(
        [&](Database& db) -> Result<std::vector<ConceptRecord>> {
            CORPUSDB_TRY(requireTarget(db, "token", tokenId));
            return queryAll(db,
                            "SELECT " + qualifiedColumns("c", kConceptColumns) +
                                " FROM concept c JOIN cwl l ON l.cid = c.ID"
                                " WHERE l.wid = ? ORDER BY c.cidx, c.ID",
                            mapConceptRow, tokenId);
        });
}

Result<std::vector<ConceptWordLink>> CorpusStore::getLinks(RowId sentenceId) {
    return executeRead<std::vector<ConceptWordLink>>(
        [&](Database& db) -> Result<std::vector<ConceptWordLink>> {
            CORPUSDB_TRY(requireTarget(db, "sentence", sentenceId));
            return queryAll(db, "SELECT sid, cid, wid FROM cwl WHERE sid = ? ORDER BY cid, wid",
                            mapLinkRow, sentenceId);
        });
}

// Tag operations

Result<TagRecord> CorpusStore::createTag(const TagRecord& tag) {
    return executeWrite<TagRecord>([&](Database& db) -> Result<TagRecord> {
        CORPUSDB_TRY(requireParent(db, "sentence", tag.sentenceId));
        CORPUSDB_TRY(requireTagToken(db, tag.sentenceId, tag.tokenId));
        CORPUSDB_TRY(validateSpan(tag.cfrom, tag.cto, "Tag"));

        TagRecord stored = tag;
        CORPUSDB_TRY_UNWRAP(id, insertTag(db, stored));
        stored.id = id;
        return stored;
    });
}

Result<std::optional<TagRecord>> CorpusStore::getTag(RowId id) {
    return executeRead<std::optional<TagRecord>>(
        [&](Database& db) { return queryOne(db, kSelectTag + " WHERE ID = ?", mapTagRow, id); });
}

Result<SentenceTags> CorpusStore::getTags(RowId sentenceId) {
    return executeRead<SentenceTags>([&](Database& db) -> Result<SentenceTags> {
        CORPUSDB_TRY(requireTarget(db, "sentence", sentenceId));
        CORPUSDB_TRY_UNWRAP(tags,
                            queryAll(db, kSelectTag + " WHERE sid = ? ORDER BY ID", mapTagRow,
                                     sentenceId));
        SentenceTags partitioned;
        for (auto& tag : tags) {
            auto& bucket = tag.isSentenceLevel() ? partitioned.sentenceLevel
                                                 : partitioned.tokenLevel;
            bucket.push_back(std::move(tag));
        }
        return partitioned;
    });
}

Result<std::vector<TagRecord>> CorpusStore::getTokenTags(RowId tokenId) {
    return executeRead<std::vector<TagRecord>>([&](Database& db) -> Result<std::vector<TagRecord>> {
        CORPUSDB_TRY(requireTarget(db, "token", tokenId));
        return queryAll(db, kSelectTag + " WHERE wid = ? ORDER BY ID", mapTagRow, tokenId);
    });
}

Result<void> CorpusStore::updateTag(const TagRecord& tag) {
    return executeWrite<void>([&](Database& db) -> Result<void> {
        CORPUSDB_TRY_UNWRAP(sentenceId, owningSentence(db, "tag", tag.id));
        if (!sentenceId) {
            return Error{ErrorCode::NotFound, "No tag with ID " + std::to_string(tag.id)};
        }
        CORPUSDB_TRY(requireTagToken(db, *sentenceId, tag.tokenId));
        CORPUSDB_TRY(validateSpan(tag.cfrom, tag.cto, "Tag"));
        CORPUSDB_TRY(executeChanges(
            db, "UPDATE tag SET wid = ?, cfrom = ?, cto = ?, label = ?, source = ?, tagtype = ? "
                "WHERE ID = ?",
            tag.tokenId, tag.cfrom, tag.cto, tag.label, tag.source, tag.tagType, tag.id));
        return {};
    });
}

Result<void> CorpusStore::deleteTag(RowId id) {
    return executeWrite<void>([&](Database& db) -> Result<void> {
        CORPUSDB_TRY_UNWRAP(removed, executeChanges(db, "DELETE FROM tag WHERE ID = ?", id));
        if (removed == 0) {
            return Error{ErrorCode::NotFound, "No tag with ID " + std::to_string(id)};
        }
        return {};
    });
}

} // namespace corpusdb::storage
