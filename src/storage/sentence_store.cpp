#include <spdlog/spdlog.h>
#include <algorithm>
#include <unordered_map>
#include <corpusdb/storage/corpus_store.h>

#include "store/integrity_ops.hpp"
#include "store/record_ops.hpp"
#include "store/result_helpers.hpp"

namespace corpusdb::storage {

using namespace detail;

namespace {

const std::string kSelectSentence = std::string("SELECT ") + kSentenceColumns + " FROM sentence";
const std::string kSelectToken = std::string("SELECT ") + kTokenColumns + " FROM token";

Result<void> validateTokenBatch(const std::vector<TokenRecord>& tokens,
                                const TokenImportOptions& options) {
    std::optional<int64_t> previousEnd;
    for (const auto& token : tokens) {
        CORPUSDB_TRY(validateSpan(token.cfrom, token.cto, "Token"));
        if (!options.validateSpans || !token.cfrom || !token.cto) {
            continue;
        }
        if (*token.cfrom < 0) {
            return Error{ErrorCode::InvalidArgument,
                         "Token '" + token.text + "' has a negative span start"};
        }
        if (previousEnd && *token.cfrom < *previousEnd) {
            return Error{ErrorCode::InvalidArgument,
                         "Token '" + token.text + "' overlaps or precedes the previous token"};
        }
        previousEnd = token.cto;
    }
    return {};
}

// Bundles store an empty tag source as NULL
void clearEmptySource(TagRecord& tag) {
    if (tag.source && tag.source->empty()) {
        tag.source.reset();
    }
}

Result<SentenceBundle> writeBundle(Database& db, const SentenceBundle& bundle) {
    CORPUSDB_TRY(requireParent(db, "document", bundle.sentence.documentId));

    std::vector<TokenRecord> tokenRecords;
    tokenRecords.reserve(bundle.tokens.size());
    for (const auto& token : bundle.tokens) {
        tokenRecords.push_back(token.record);
        for (const auto& tag : token.tags) {
            CORPUSDB_TRY(validateSpan(tag.cfrom, tag.cto, "Tag"));
        }
    }
    CORPUSDB_TRY(validateTokenBatch(tokenRecords, {}));
    for (const auto& tag : bundle.tags) {
        if (tag.tokenId) {
            return Error{ErrorCode::InvalidArgument,
                         "Sentence-level tag '" + tag.label + "' must not name a token"};
        }
        CORPUSDB_TRY(validateSpan(tag.cfrom, tag.cto, "Tag"));
    }
    for (const auto& annotated : bundle.concepts) {
        std::vector<std::size_t> seen = annotated.tokenIndices;
        std::sort(seen.begin(), seen.end());
        if (!seen.empty() && seen.back() >= bundle.tokens.size()) {
            return Error{ErrorCode::DanglingReference,
                         "Concept '" + annotated.record.clemma + "' links to token position " +
                             std::to_string(seen.back()) + " outside the sentence"};
        }
        if (std::adjacent_find(seen.begin(), seen.end()) != seen.end()) {
            return Error{ErrorCode::DuplicateKey,
                         "Concept '" + annotated.record.clemma + "' links a token twice"};
        }
    }

    SentenceBundle saved = bundle;
    CORPUSDB_TRY_UNWRAP(sentenceId, insertSentence(db, saved.sentence));
    saved.sentence.id = sentenceId;

    for (auto& tag : saved.tags) {
        tag.sentenceId = sentenceId;
        clearEmptySource(tag);
        CORPUSDB_TRY_UNWRAP(tagId, insertTag(db, tag));
        tag.id = tagId;
    }

    int64_t widx = 0;
    for (auto& token : saved.tokens) {
        token.record.sentenceId = sentenceId;
        token.record.widx = widx++;
        CORPUSDB_TRY_UNWRAP(tokenId, insertToken(db, token.record));
        token.record.id = tokenId;

        for (auto& tag : token.tags) {
            tag.sentenceId = sentenceId;
            tag.tokenId = tokenId;
            clearEmptySource(tag);
            CORPUSDB_TRY_UNWRAP(tagId, insertTag(db, tag));
            tag.id = tagId;
        }
    }

    for (auto& annotated : saved.concepts) {
        annotated.record.sentenceId = sentenceId;
        CORPUSDB_TRY_UNWRAP(conceptId, insertConcept(db, annotated.record));
        annotated.record.id = conceptId;

        for (auto index : annotated.tokenIndices) {
            CORPUSDB_TRY(insertLink(
                db, ConceptWordLink{sentenceId, conceptId, saved.tokens[index].record.id}));
        }
    }

    spdlog::debug("Saved sentence {} with {} tokens, {} concepts", sentenceId, saved.tokens.size(),
                  saved.concepts.size());
    return saved;
}

Result<SentenceBundle> readBundle(Database& db, RowId sentenceId) {
    CORPUSDB_TRY_UNWRAP(sentence,
                        queryOne(db, kSelectSentence + " WHERE ID = ?", mapSentenceRow, sentenceId));
    if (!sentence) {
        return Error{ErrorCode::NotFound, "No sentence with ID " + std::to_string(sentenceId)};
    }

    SentenceBundle bundle;
    bundle.sentence = std::move(*sentence);

    CORPUSDB_TRY_UNWRAP(tokens, queryAll(db, kSelectToken + " WHERE sid = ? ORDER BY widx",
                                         mapTokenRow, sentenceId));
    std::unordered_map<RowId, std::size_t> tokenPositions;
    for (auto& token : tokens) {
        tokenPositions.emplace(token.id, bundle.tokens.size());
        bundle.tokens.push_back(AnnotatedToken{std::move(token), {}});
    }

    CORPUSDB_TRY_UNWRAP(tags, queryAll(db,
                                       std::string("SELECT ") + kTagColumns +
                                           " FROM tag WHERE sid = ? ORDER BY ID",
                                       mapTagRow, sentenceId));
    for (auto& tag : tags) {
        if (tag.isSentenceLevel()) {
            bundle.tags.push_back(std::move(tag));
            continue;
        }
        auto it = tokenPositions.find(*tag.tokenId);
        if (it == tokenPositions.end()) {
            spdlog::warn("Skipping orphan tag {} of sentence {}: token {} does not exist", tag.id,
                         sentenceId, *tag.tokenId);
            continue;
        }
        bundle.tokens[it->second].tags.push_back(std::move(tag));
    }

    CORPUSDB_TRY_UNWRAP(records, queryAll(db,
                                          std::string("SELECT ") + kConceptColumns +
                                              " FROM concept WHERE sid = ? ORDER BY cidx, ID",
                                          mapConceptRow, sentenceId));
    std::unordered_map<RowId, std::size_t> conceptPositions;
    for (auto& record : records) {
        conceptPositions.emplace(record.id, bundle.concepts.size());
        bundle.concepts.push_back(AnnotatedConcept{std::move(record), {}});
    }

    CORPUSDB_TRY_UNWRAP(links, queryAll(db, "SELECT sid, cid, wid FROM cwl WHERE sid = ?",
                                        mapLinkRow, sentenceId));
    for (const auto& link : links) {
        auto conceptIt = conceptPositions.find(link.conceptId);
        auto tokenIt = tokenPositions.find(link.tokenId);
        if (conceptIt == conceptPositions.end() || tokenIt == tokenPositions.end()) {
            spdlog::warn("Skipping orphan link ({}, {}) of sentence {}", link.conceptId,
                         link.tokenId, sentenceId);
            continue;
        }
        bundle.concepts[conceptIt->second].tokenIndices.push_back(tokenIt->second);
    }
    for (auto& annotated : bundle.concepts) {
        std::sort(annotated.tokenIndices.begin(), annotated.tokenIndices.end());
    }

    return bundle;
}

} // namespace

// Sentence operations

Result<SentenceRecord> CorpusStore::createSentence(const SentenceRecord& sentence) {
    return executeWrite<SentenceRecord>([&](Database& db) -> Result<SentenceRecord> {
        CORPUSDB_TRY(requireParent(db, "document", sentence.documentId));

        SentenceRecord stored = sentence;
        CORPUSDB_TRY_UNWRAP(id, insertSentence(db, stored));
        stored.id = id;
        return stored;
    });
}

Result<std::optional<SentenceRecord>> CorpusStore::getSentence(RowId id) {
    return executeRead<std::optional<SentenceRecord>>([&](Database& db) {
        return queryOne(db, kSelectSentence + " WHERE ID = ?", mapSentenceRow, id);
    });
}

Result<std::vector<SentenceRecord>> CorpusStore::findSentencesByIdent(const std::string& ident) {
    return executeRead<std::vector<SentenceRecord>>([&](Database& db) {
        return queryAll(db, kSelectSentence + " WHERE ident = ? ORDER BY ID", mapSentenceRow,
                        ident);
    });
}

Result<std::vector<SentenceRecord>> CorpusStore::findSentences(const SentenceQuery& query) {
    QueryBuilder builder;
    builder.select({kSentenceColumns}).from("sentence");
    if (query.documentId) {
        builder.andWhere("docID = ?");
    }
    if (query.ident) {
        builder.andWhere("ident = ?");
    }
    if (query.flag) {
        builder.andWhere("flag = ?");
    }
    if (query.textContains) {
        builder.andWhere("instr(text, ?) > 0");
    }
    builder.orderBy("ID");
    if (query.limit > 0) {
        builder.limit(query.limit);
    }
    if (query.offset > 0) {
        builder.offset(query.offset);
    }
    const std::string sql = builder.build();

    return executeRead<std::vector<SentenceRecord>>(
        [&](Database& db) -> Result<std::vector<SentenceRecord>> {
            CORPUSDB_TRY_UNWRAP(stmt, db.prepare(sql));
            int index = 1;
            if (query.documentId) {
                CORPUSDB_TRY(stmt.bind(index++, *query.documentId));
            }
            if (query.ident) {
                CORPUSDB_TRY(stmt.bind(index++, *query.ident));
            }
            if (query.flag) {
                CORPUSDB_TRY(stmt.bind(index++, *query.flag));
            }
            if (query.textContains) {
                CORPUSDB_TRY(stmt.bind(index++, *query.textContains));
            }

            std::vector<SentenceRecord> sentences;
            while (true) {
                CORPUSDB_TRY_UNWRAP(hasRow, stmt.step());
                if (!hasRow) {
                    break;
                }
                sentences.push_back(mapSentenceRow(stmt));
            }
            return sentences;
        });
}

Result<std::vector<SentenceRecord>> CorpusStore::listSentences(RowId documentId) {
    return executeRead<std::vector<SentenceRecord>>(
        [&](Database& db) -> Result<std::vector<SentenceRecord>> {
            CORPUSDB_TRY(requireTarget(db, "document", documentId));
            return queryAll(db, kSelectSentence + " WHERE docID = ? ORDER BY ID", mapSentenceRow,
                            documentId);
        });
}

Result<void> CorpusStore::updateSentence(const SentenceRecord& sentence) {
    return executeWrite<void>([&](Database& db) -> Result<void> {
        CORPUSDB_TRY(requireTarget(db, "sentence", sentence.id));
        CORPUSDB_TRY(requireParent(db, "document", sentence.documentId));
        CORPUSDB_TRY(executeChanges(
            db, "UPDATE sentence SET ident = ?, text = ?, docID = ?, flag = ?, comment = ? "
                "WHERE ID = ?",
            sentence.ident, sentence.text, sentence.documentId, sentence.flag, sentence.comment,
            sentence.id));
        return {};
    });
}

Result<void> CorpusStore::deleteSentence(RowId id) {
    return executeWrite<void>([&](Database& db) -> Result<void> {
        CORPUSDB_TRY(requireTarget(db, "sentence", id));
        return purgeSentence(db, id);
    });
}

// Token operations

Result<std::vector<TokenRecord>> CorpusStore::importTokens(RowId sentenceId,
                                                           const std::vector<TokenRecord>& tokens,
                                                           const TokenImportOptions& options) {
    return executeWrite<std::vector<TokenRecord>>(
        [&](Database& db) -> Result<std::vector<TokenRecord>> {
            CORPUSDB_TRY(requireParent(db, "sentence", sentenceId));
            CORPUSDB_TRY(validateTokenBatch(tokens, options));
            CORPUSDB_TRY_UNWRAP(widx, nextTokenIndex(db, sentenceId));

            std::vector<TokenRecord> stored;
            stored.reserve(tokens.size());
            for (const auto& token : tokens) {
                TokenRecord record = token;
                record.sentenceId = sentenceId;
                record.widx = widx++;
                CORPUSDB_TRY_UNWRAP(id, insertToken(db, record));
                record.id = id;
                stored.push_back(std::move(record));
            }

            spdlog::debug("Imported {} tokens into sentence {}", stored.size(), sentenceId);
            return stored;
        });
}

Result<std::vector<TokenRecord>>
CorpusStore::importTokenTexts(RowId sentenceId, const std::vector<std::string>& texts) {
    std::vector<TokenRecord> tokens(texts.size());
    for (std::size_t i = 0; i < texts.size(); ++i) {
        tokens[i].text = texts[i];
    }
    return importTokens(sentenceId, tokens);
}

Result<std::vector<TokenRecord>> CorpusStore::getTokens(RowId sentenceId) {
    return executeRead<std::vector<TokenRecord>>(
        [&](Database& db) -> Result<std::vector<TokenRecord>> {
            CORPUSDB_TRY(requireTarget(db, "sentence", sentenceId));
            return queryAll(db, kSelectToken + " WHERE sid = ? ORDER BY widx", mapTokenRow,
                            sentenceId);
        });
}

Result<std::optional<TokenRecord>> CorpusStore::getToken(RowId id) {
    return executeRead<std::optional<TokenRecord>>(
        [&](Database& db) { return queryOne(db, kSelectToken + " WHERE ID = ?", mapTokenRow, id); });
}

Result<void> CorpusStore::updateToken(const TokenRecord& token) {
    return executeWrite<void>([&](Database& db) -> Result<void> {
        CORPUSDB_TRY(requireTarget(db, "token", token.id));
        CORPUSDB_TRY(validateSpan(token.cfrom, token.cto, "Token"));
        CORPUSDB_TRY(executeChanges(
            db, "UPDATE token SET cfrom = ?, cto = ?, text = ?, lemma = ?, pos = ?, comment = ? "
                "WHERE ID = ?",
            token.cfrom, token.cto, token.text, token.lemma, token.pos, token.comment, token.id));
        return {};
    });
}

Result<void> CorpusStore::deleteToken(RowId id) {
    return executeWrite<void>([&](Database& db) -> Result<void> {
        CORPUSDB_TRY(requireTarget(db, "token", id));
        return purgeToken(db, id);
    });
}

Result<int64_t> CorpusStore::countTokens(RowId sentenceId) {
    return executeRead<int64_t>([&](Database& db) -> Result<int64_t> {
        CORPUSDB_TRY(requireTarget(db, "sentence", sentenceId));
        return queryScalar(db, "SELECT COUNT(*) FROM token WHERE sid = ?", sentenceId);
    });
}

// Whole-sentence operations

Result<SentenceBundle> CorpusStore::saveSentence(const SentenceBundle& bundle) {
    return executeWrite<SentenceBundle>(
        [&](Database& db) -> Result<SentenceBundle> { return writeBundle(db, bundle); });
}

Result<SentenceBundle> CorpusStore::loadSentence(RowId sentenceId) {
    return executeRead<SentenceBundle>(
        [&](Database& db) -> Result<SentenceBundle> { return readBundle(db, sentenceId); });
}

Result<std::vector<LexiconEntry>> CorpusStore::lexicon(int limit) {
    QueryBuilder builder;
    builder.select({"text", "COUNT(*) AS freq"}).from("token").groupBy("text").orderBy(
        "freq DESC, text");
    if (limit > 0) {
        builder.limit(limit);
    }
    const std::string sql = builder.build();

    return executeRead<std::vector<LexiconEntry>>([&](Database& db) {
        return queryAll(db, sql, [](const Statement& stmt) {
            return LexiconEntry{stmt.getString(0), stmt.getInt64(1)};
        });
    });
}

} // namespace corpusdb::storage
