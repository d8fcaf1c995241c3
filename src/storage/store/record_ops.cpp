#include <sstream>

#include "record_ops.hpp"

namespace corpusdb::storage::detail {

std::string qualifiedColumns(const std::string& alias, const std::string& columns) {
    std::ostringstream out;
    std::istringstream in(columns);
    std::string column;
    bool first = true;
    while (std::getline(in, column, ',')) {
        auto start = column.find_first_not_of(' ');
        if (start == std::string::npos) {
            continue;
        }
        if (!first) {
            out << ", ";
        }
        out << alias << '.' << column.substr(start);
        first = false;
    }
    return out.str();
}

CorpusRecord mapCorpusRow(const Statement& stmt) {
    CorpusRecord corpus;
    corpus.id = stmt.getInt64(0);
    corpus.name = stmt.getString(1);
    corpus.title = stmt.getOptionalString(2);
    return corpus;
}

DocumentRecord mapDocumentRow(const Statement& stmt) {
    DocumentRecord doc;
    doc.id = stmt.getInt64(0);
    doc.name = stmt.getString(1);
    doc.title = stmt.getOptionalString(2);
    doc.lang = stmt.getOptionalString(3);
    doc.corpusId = stmt.getInt64(4);
    return doc;
}

SentenceRecord mapSentenceRow(const Statement& stmt) {
    SentenceRecord sent;
    sent.id = stmt.getInt64(0);
    sent.ident = stmt.getOptionalString(1);
    sent.text = stmt.getString(2);
    sent.documentId = stmt.getInt64(3);
    sent.flag = stmt.getOptionalInt64(4);
    sent.comment = stmt.getOptionalString(5);
    return sent;
}

TokenRecord mapTokenRow(const Statement& stmt) {
    TokenRecord token;
    token.id = stmt.getInt64(0);
    token.sentenceId = stmt.getInt64(1);
    token.widx = stmt.getInt64(2);
    token.cfrom = stmt.getOptionalInt64(3);
    token.cto = stmt.getOptionalInt64(4);
    token.text = stmt.getString(5);
    token.lemma = stmt.getOptionalString(6);
    token.pos = stmt.getOptionalString(7);
    token.comment = stmt.getOptionalString(8);
    return token;
}

ConceptRecord mapConceptRow(const Statement& stmt) {
    ConceptRecord record;
    record.id = stmt.getInt64(0);
    record.sentenceId = stmt.getInt64(1);
    record.cidx = stmt.getInt64(2);
    record.clemma = stmt.getString(3);
    record.tag = stmt.getOptionalString(4);
    record.flag = stmt.getOptionalString(5);
    record.comment = stmt.getOptionalString(6);
    return record;
}

TagRecord mapTagRow(const Statement& stmt) {
    TagRecord tag;
    tag.id = stmt.getInt64(0);
    tag.sentenceId = stmt.getInt64(1);
    tag.tokenId = stmt.getOptionalInt64(2);
    tag.cfrom = stmt.getOptionalInt64(3);
    tag.cto = stmt.getOptionalInt64(4);
    tag.label = stmt.getString(5);
    tag.source = stmt.getOptionalString(6);
    tag.tagType = stmt.getOptionalString(7);
    return tag;
}

ConceptWordLink mapLinkRow(const Statement& stmt) {
    return ConceptWordLink{stmt.getInt64(0), stmt.getInt64(1), stmt.getInt64(2)};
}

Result<RowId> insertCorpus(Database& db, const CorpusRecord& corpus) {
    CORPUSDB_TRY_UNWRAP(stmt, db.prepare("INSERT INTO corpus (name, title) VALUES (?, ?)"));
    CORPUSDB_TRY(stmt.bindAll(corpus.name, corpus.title));
    CORPUSDB_TRY(stmt.execute());
    return db.lastInsertRowId();
}

Result<RowId> insertDocument(Database& db, const DocumentRecord& document) {
    CORPUSDB_TRY_UNWRAP(stmt, db.prepare(R"(
        INSERT INTO document (name, title, lang, corpusID) VALUES (?, ?, ?, ?)
    )"));
    CORPUSDB_TRY(stmt.bindAll(document.name, document.title, document.lang, document.corpusId));
    CORPUSDB_TRY(stmt.execute());
    return db.lastInsertRowId();
}

Result<RowId> insertSentence(Database& db, const SentenceRecord& sentence) {
    CORPUSDB_TRY_UNWRAP(stmt, db.prepare(R"(
        INSERT INTO sentence (ident, text, docID, flag, comment) VALUES (?, ?, ?, ?, ?)
    )"));
    CORPUSDB_TRY(stmt.bindAll(sentence.ident, sentence.text, sentence.documentId, sentence.flag,
                              sentence.comment));
    CORPUSDB_TRY(stmt.execute());
    return db.lastInsertRowId();
}

Result<RowId> insertToken(Database& db, const TokenRecord& token) {
    CORPUSDB_TRY_UNWRAP(stmt, db.prepare(R"(
        INSERT INTO token (sid, widx, cfrom, cto, text, lemma, pos, comment)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    )"));
    CORPUSDB_TRY(stmt.bindAll(token.sentenceId, token.widx, token.cfrom, token.cto, token.text,
                              token.lemma, token.pos, token.comment));
    CORPUSDB_TRY(stmt.execute());
    return db.lastInsertRowId();
}

Result<RowId> insertConcept(Database& db, const ConceptRecord& record) {
    CORPUSDB_TRY_UNWRAP(stmt, db.prepare(R"(
        INSERT INTO concept (sid, cidx, clemma, tag, flag, comment) VALUES (?, ?, ?, ?, ?, ?)
    )"));
    CORPUSDB_TRY(stmt.bindAll(record.sentenceId, record.cidx, record.clemma, record.tag,
                              record.flag, record.comment));
    CORPUSDB_TRY(stmt.execute());
    return db.lastInsertRowId();
}

Result<RowId> insertTag(Database& db, const TagRecord& tag) {
    CORPUSDB_TRY_UNWRAP(stmt, db.prepare(R"(
        INSERT INTO tag (sid, wid, cfrom, cto, label, source, tagtype)
        VALUES (?, ?, ?, ?, ?, ?, ?)
    )"));
    CORPUSDB_TRY(stmt.bindAll(tag.sentenceId, tag.tokenId, tag.cfrom, tag.cto, tag.label,
                              tag.source, tag.tagType));
    CORPUSDB_TRY(stmt.execute());
    return db.lastInsertRowId();
}

Result<void> insertLink(Database& db, const ConceptWordLink& link) {
    CORPUSDB_TRY_UNWRAP(stmt, db.prepare("INSERT INTO cwl (sid, cid, wid) VALUES (?, ?, ?)"));
    CORPUSDB_TRY(stmt.bindAll(link.sentenceId, link.conceptId, link.tokenId));
    return stmt.execute();
}

Result<int64_t> nextTokenIndex(Database& db, RowId sentenceId) {
    return queryScalar(db, "SELECT COALESCE(MAX(widx) + 1, 0) FROM token WHERE sid = ?",
                       sentenceId);
}

} // namespace corpusdb::storage::detail
