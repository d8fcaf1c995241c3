#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <corpusdb/core/types.h>

namespace corpusdb::storage {

/**
 * @brief Top-level named collection of documents (table `corpus`)
 */
struct CorpusRecord {
    RowId id = 0;                     ///< corpus.ID
    std::string name;                 ///< Unique corpus name
    std::optional<std::string> title; ///< Display title
};

/**
 * @brief Named unit of text within a corpus (table `document`)
 */
struct DocumentRecord {
    RowId id = 0;                     ///< document.ID
    std::string name;                 ///< Globally unique document name
    std::optional<std::string> title; ///< Display title
    std::optional<std::string> lang;  ///< Language code
    RowId corpusId = 0;               ///< Owning corpus (document.corpusID)
};

/**
 * @brief Sentence within a document (table `sentence`)
 */
struct SentenceRecord {
    RowId id = 0;                       ///< sentence.ID
    RowId documentId = 0;               ///< Owning document (sentence.docID)
    std::optional<std::string> ident;   ///< External identifier
    std::string text;                   ///< Raw sentence text
    std::optional<int64_t> flag;        ///< Status flag, opaque to the store
    std::optional<std::string> comment; ///< Free-form comment
};

/**
 * @brief Surface token within a sentence (table `token`)
 */
struct TokenRecord {
    RowId id = 0;                       ///< token.ID
    RowId sentenceId = 0;               ///< Owning sentence (token.sid)
    int64_t widx = 0;                   ///< Sentence-local position, dense from 0
    std::optional<int64_t> cfrom;       ///< Character span start
    std::optional<int64_t> cto;         ///< Character span end
    std::string text;                   ///< Surface form
    std::optional<std::string> lemma;   ///< Lemma
    std::optional<std::string> pos;     ///< Part-of-speech
    std::optional<std::string> comment; ///< Free-form comment
};

/**
 * @brief Span-level semantic annotation (table `concept`)
 */
struct ConceptRecord {
    RowId id = 0;                       ///< concept.ID
    RowId sentenceId = 0;               ///< Owning sentence (concept.sid)
    int64_t cidx = 0;                   ///< Sentence-local sequence index
    std::string clemma;                 ///< Lemma label
    std::optional<std::string> tag;     ///< Sense or concept tag
    std::optional<std::string> flag;    ///< Opaque flag
    std::optional<std::string> comment; ///< Free-form comment
};

/**
 * @brief Concept-to-token link row (table `cwl`)
 */
struct ConceptWordLink {
    RowId sentenceId = 0; ///< cwl.sid
    RowId conceptId = 0;  ///< cwl.cid
    RowId tokenId = 0;    ///< cwl.wid

    auto operator<=>(const ConceptWordLink&) const = default;
};

/**
 * @brief Labeled span on a sentence, optionally narrowed to one token (table `tag`)
 */
struct TagRecord {
    RowId id = 0;                       ///< tag.ID
    RowId sentenceId = 0;               ///< Owning sentence (tag.sid)
    std::optional<RowId> tokenId;       ///< tag.wid; empty for sentence-level tags
    std::optional<int64_t> cfrom;       ///< Character span start
    std::optional<int64_t> cto;         ///< Character span end
    std::string label;                  ///< Tag value
    std::optional<std::string> source;  ///< Provenance
    std::optional<std::string> tagType; ///< Discriminator, opaque to the store

    [[nodiscard]] bool isSentenceLevel() const { return !tokenId.has_value(); }
};

/**
 * @brief Tags of one sentence partitioned by scope
 */
struct SentenceTags {
    std::vector<TagRecord> sentenceLevel;
    std::vector<TagRecord> tokenLevel;
};

/**
 * @brief Scope a metadata pair is attached to
 */
enum class MetaScope {
    Global,   ///< Store-wide (table `meta`)
    Document, ///< Per document name (table `meta_doc`)
    Corpus    ///< Per corpus name (table `meta_cor`)
};

struct MetaEntry {
    MetaScope scope = MetaScope::Global;
    std::string owner; ///< Document or corpus name; empty for Global
    std::string key;
    std::string value;
};

/**
 * @brief Options for batch token import
 */
struct TokenImportOptions {
    /// Reject batches whose character spans overlap or run backwards
    bool validateSpans = false;
};

/**
 * @brief Filter for sentence lookups
 */
struct SentenceQuery {
    std::optional<RowId> documentId;
    std::optional<std::string> ident;
    std::optional<int64_t> flag;
    std::optional<std::string> textContains;
    int limit = 0;
    int offset = 0;
};

/**
 * @brief Token with its token-level tags
 */
struct AnnotatedToken {
    TokenRecord record;
    std::vector<TagRecord> tags;
};

/**
 * @brief Concept with the positions of the tokens it covers
 */
struct AnnotatedConcept {
    ConceptRecord record;
    std::vector<std::size_t> tokenIndices; ///< Indices into SentenceBundle::tokens
};

/**
 * @brief A sentence together with all of its annotation layers
 */
struct SentenceBundle {
    SentenceRecord sentence;
    std::vector<AnnotatedToken> tokens;
    std::vector<TagRecord> tags; ///< Sentence-level tags
    std::vector<AnnotatedConcept> concepts;
};

struct LexiconEntry {
    std::string text;
    int64_t count = 0;
};

/**
 * @brief Row counts per table
 */
struct StoreStats {
    int64_t corpora = 0;
    int64_t documents = 0;
    int64_t sentences = 0;
    int64_t tokens = 0;
    int64_t concepts = 0;
    int64_t tags = 0;
    int64_t links = 0;
    int64_t globalMeta = 0;
    int64_t documentMeta = 0;
    int64_t corpusMeta = 0;
};

/**
 * @brief Rows whose parent no longer exists, per table
 */
struct IntegrityReport {
    int64_t orphanDocuments = 0;
    int64_t orphanSentences = 0;
    int64_t orphanTokens = 0;
    int64_t orphanConcepts = 0;
    int64_t orphanTags = 0;
    int64_t orphanLinks = 0;
    int64_t crossSentenceLinks = 0; ///< Links whose concept or token sits in another sentence
    int64_t orphanDocumentMeta = 0;
    int64_t orphanCorpusMeta = 0;

    [[nodiscard]] bool clean() const {
        return orphanDocuments == 0 && orphanSentences == 0 && orphanTokens == 0 &&
               orphanConcepts == 0 && orphanTags == 0 && orphanLinks == 0 &&
               crossSentenceLinks == 0 && orphanDocumentMeta == 0 && orphanCorpusMeta == 0;
    }
};

} // namespace corpusdb::storage
