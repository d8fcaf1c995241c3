#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>
#include <corpusdb/config/config_helpers.h>
#include <corpusdb/storage/connection_pool.h>
#include <corpusdb/storage/corpus_records.h>
#include <corpusdb/storage/database.h>
#include <corpusdb/storage/store_concepts.h>

namespace corpusdb::storage {

/**
 * @brief Interface for corpus annotation storage
 */
class ICorpusStore {
public:
    virtual ~ICorpusStore() = default;

    // Corpus operations
    virtual Result<CorpusRecord> createCorpus(const std::string& name,
                                              const std::optional<std::string>& title = {}) = 0;
    virtual Result<CorpusRecord> ensureCorpus(const std::string& name,
                                              const std::optional<std::string>& title = {}) = 0;
    virtual Result<std::optional<CorpusRecord>> getCorpus(RowId id) = 0;
    virtual Result<std::optional<CorpusRecord>> getCorpusByName(const std::string& name) = 0;
    virtual Result<std::vector<CorpusRecord>> listCorpora() = 0;
    virtual Result<void> updateCorpus(const CorpusRecord& corpus) = 0;
    virtual Result<void> deleteCorpus(RowId id) = 0;

    // Document operations
    virtual Result<DocumentRecord> createDocument(const std::string& name, RowId corpusId,
                                                  const std::optional<std::string>& title = {},
                                                  const std::optional<std::string>& lang = {}) = 0;
    virtual Result<DocumentRecord> ensureDocument(const std::string& name, RowId corpusId,
                                                  const std::optional<std::string>& title = {},
                                                  const std::optional<std::string>& lang = {}) = 0;
    virtual Result<std::optional<DocumentRecord>> getDocument(RowId id) = 0;
    virtual Result<std::optional<DocumentRecord>> getDocumentByName(const std::string& name) = 0;
    virtual Result<std::vector<DocumentRecord>> listDocuments(RowId corpusId) = 0;
    virtual Result<void> updateDocument(const DocumentRecord& document) = 0;
    virtual Result<void> deleteDocument(RowId id) = 0;

    // Sentence operations
    virtual Result<SentenceRecord> createSentence(const SentenceRecord& sentence) = 0;
    virtual Result<std::optional<SentenceRecord>> getSentence(RowId id) = 0;
    virtual Result<std::vector<SentenceRecord>> findSentencesByIdent(const std::string& ident) = 0;
    virtual Result<std::vector<SentenceRecord>> findSentences(const SentenceQuery& query) = 0;
    virtual Result<std::vector<SentenceRecord>> listSentences(RowId documentId) = 0;
    virtual Result<void> updateSentence(const SentenceRecord& sentence) = 0;
    virtual Result<void> deleteSentence(RowId id) = 0;

    // Token operations
    virtual Result<std::vector<TokenRecord>>
    importTokens(RowId sentenceId, const std::vector<TokenRecord>& tokens,
                 const TokenImportOptions& options = {}) = 0;
    virtual Result<std::vector<TokenRecord>>
    importTokenTexts(RowId sentenceId, const std::vector<std::string>& texts) = 0;
    virtual Result<std::vector<TokenRecord>> getTokens(RowId sentenceId) = 0;
    virtual Result<std::optional<TokenRecord>> getToken(RowId id) = 0;
    virtual Result<void> updateToken(const TokenRecord& token) = 0;
    /**
     * @brief Delete a token with its links and token-level tags
     *
     * Later tokens keep their widx, so the sentence is left with a gap.
     * importTokens continues after the highest remaining index.
     */
    virtual Result<void> deleteToken(RowId id) = 0;
    virtual Result<int64_t> countTokens(RowId sentenceId) = 0;

    // Concept and link operations
    virtual Result<ConceptRecord> createConcept(const ConceptRecord& record) = 0;
    virtual Result<std::optional<ConceptRecord>> getConcept(RowId id) = 0;
    virtual Result<std::vector<ConceptRecord>> getConcepts(RowId sentenceId) = 0;
    virtual Result<void> updateConcept(const ConceptRecord& record) = 0;
    virtual Result<void> deleteConcept(RowId id) = 0;
    virtual Result<ConceptWordLink> linkConceptToken(RowId conceptId, RowId tokenId) = 0;
    virtual Result<std::vector<ConceptWordLink>>
    linkConceptTokens(RowId conceptId, const std::vector<RowId>& tokenIds) = 0;
    virtual Result<void> unlinkConceptToken(RowId conceptId, RowId tokenId) = 0;
    virtual Result<std::vector<TokenRecord>> getConceptTokens(RowId conceptId) = 0;
    virtual Result<std::vector<ConceptRecord>> getTokenConcepts(RowId tokenId) = 0;
    virtual Result<std::vector<ConceptWordLink>> getLinks(RowId sentenceId) = 0;

    // Tag operations
    virtual Result<TagRecord> createTag(const TagRecord& tag) = 0;
    virtual Result<std::optional<TagRecord>> getTag(RowId id) = 0;
    virtual Result<SentenceTags> getTags(RowId sentenceId) = 0;
    virtual Result<std::vector<TagRecord>> getTokenTags(RowId tokenId) = 0;
    virtual Result<void> updateTag(const TagRecord& tag) = 0;
    virtual Result<void> deleteTag(RowId id) = 0;

    // Metadata operations
    virtual Result<void> setMeta(MetaScope scope, const std::string& owner, const std::string& key,
                                 const std::string& value) = 0;
    virtual Result<std::string> getMeta(MetaScope scope, const std::string& owner,
                                        const std::string& key) = 0;
    virtual Result<std::vector<MetaEntry>> listMeta(MetaScope scope, const std::string& owner) = 0;
    virtual Result<void> deleteMeta(MetaScope scope, const std::string& owner,
                                    const std::string& key) = 0;

    // Whole-sentence operations
    virtual Result<SentenceBundle> saveSentence(const SentenceBundle& bundle) = 0;
    virtual Result<SentenceBundle> loadSentence(RowId sentenceId) = 0;
    virtual Result<std::vector<LexiconEntry>> lexicon(int limit = 0) = 0;

    // Integrity and statistics
    virtual Result<IntegrityReport> auditIntegrity() = 0;
    virtual Result<StoreStats> stats() = 0;
};

/**
 * @brief SQLite implementation of the corpus store
 *
 * Mutations are serialized by a writer mutex and run in a single
 * BEGIN IMMEDIATE transaction each; reads run on pooled connections inside
 * a deferred transaction so that multi-statement reads share one snapshot.
 */
class CorpusStore : public ICorpusStore {
public:
    explicit CorpusStore(ConnectionPool& pool);
    ~CorpusStore() override = default;

    /**
     * @brief Install or adopt the corpus schema
     */
    Result<void> initialize();

    // Corpus operations
    Result<CorpusRecord> createCorpus(const std::string& name,
                                      const std::optional<std::string>& title = {}) override;
    Result<CorpusRecord> ensureCorpus(const std::string& name,
                                      const std::optional<std::string>& title = {}) override;
    Result<std::optional<CorpusRecord>> getCorpus(RowId id) override;
    Result<std::optional<CorpusRecord>> getCorpusByName(const std::string& name) override;
    Result<std::vector<CorpusRecord>> listCorpora() override;
    Result<void> updateCorpus(const CorpusRecord& corpus) override;
    Result<void> deleteCorpus(RowId id) override;

    // Document operations
    Result<DocumentRecord> createDocument(const std::string& name, RowId corpusId,
                                          const std::optional<std::string>& title = {},
                                          const std::optional<std::string>& lang = {}) override;
    Result<DocumentRecord> ensureDocument(const std::string& name, RowId corpusId,
                                          const std::optional<std::string>& title = {},
                                          const std::optional<std::string>& lang = {}) override;
    Result<std::optional<DocumentRecord>> getDocument(RowId id) override;
    Result<std::optional<DocumentRecord>> getDocumentByName(const std::string& name) override;
    Result<std::vector<DocumentRecord>> listDocuments(RowId corpusId) override;
    Result<void> updateDocument(const DocumentRecord& document) override;
    Result<void> deleteDocument(RowId id) override;

    // Sentence operations
    Result<SentenceRecord> createSentence(const SentenceRecord& sentence) override;
    Result<std::optional<SentenceRecord>> getSentence(RowId id) override;
    Result<std::vector<SentenceRecord>> findSentencesByIdent(const std::string& ident) override;
    Result<std::vector<SentenceRecord>> findSentences(const SentenceQuery& query) override;
    Result<std::vector<SentenceRecord>> listSentences(RowId documentId) override;
    Result<void> updateSentence(const SentenceRecord& sentence) override;
    Result<void> deleteSentence(RowId id) override;

    // Token operations
    Result<std::vector<TokenRecord>> importTokens(RowId sentenceId,
                                                  const std::vector<TokenRecord>& tokens,
                                                  const TokenImportOptions& options = {}) override;
    Result<std::vector<TokenRecord>>
    importTokenTexts(RowId sentenceId, const std::vector<std::string>& texts) override;
    Result<std::vector<TokenRecord>> getTokens(RowId sentenceId) override;
    Result<std::optional<TokenRecord>> getToken(RowId id) override;
    Result<void> updateToken(const TokenRecord& token) override;
    Result<void> deleteToken(RowId id) override;
    Result<int64_t> countTokens(RowId sentenceId) override;

    // Concept and link operations
    Result<ConceptRecord> createConcept(const ConceptRecord& record) override;
    Result<std::optional<ConceptRecord>> getConcept(RowId id) override;
    Result<std::vector<ConceptRecord>> getConcepts(RowId sentenceId) override;
    Result<void> updateConcept(const ConceptRecord& record) override;
    Result<void> deleteConcept(RowId id) override;
    Result<ConceptWordLink> linkConceptToken(RowId conceptId, RowId tokenId) override;
    Result<std::vector<ConceptWordLink>>
    linkConceptTokens(RowId conceptId, const std::vector<RowId>& tokenIds) override;
    Result<void> unlinkConceptToken(RowId conceptId, RowId tokenId) override;
    Result<std::vector<TokenRecord>> getConceptTokens(RowId conceptId) override;
    Result<std::vector<ConceptRecord>> getTokenConcepts(RowId tokenId) override;
    Result<std::vector<ConceptWordLink>> getLinks(RowId sentenceId) override;

    // Tag operations
    Result<TagRecord> createTag(const TagRecord& tag) override;
    Result<std::optional<TagRecord>> getTag(RowId id) override;
    Result<SentenceTags> getTags(RowId sentenceId) override;
    Result<std::vector<TagRecord>> getTokenTags(RowId tokenId) override;
    Result<void> updateTag(const TagRecord& tag) override;
    Result<void> deleteTag(RowId id) override;

    // Metadata operations
    Result<void> setMeta(MetaScope scope, const std::string& owner, const std::string& key,
                         const std::string& value) override;
    Result<std::string> getMeta(MetaScope scope, const std::string& owner,
                                const std::string& key) override;
    Result<std::vector<MetaEntry>> listMeta(MetaScope scope, const std::string& owner) override;
    Result<void> deleteMeta(MetaScope scope, const std::string& owner,
                            const std::string& key) override;

    // Whole-sentence operations
    Result<SentenceBundle> saveSentence(const SentenceBundle& bundle) override;
    Result<SentenceBundle> loadSentence(RowId sentenceId) override;
    Result<std::vector<LexiconEntry>> lexicon(int limit = 0) override;

    // Integrity and statistics
    Result<IntegrityReport> auditIntegrity() override;
    Result<StoreStats> stats() override;

private:
    ConnectionPool& pool_;
    std::mutex writeMutex_;

    /**
     * @brief Run func on a pooled connection inside a deferred transaction
     */
    template <typename T> Result<T> executeRead(std::function<Result<T>(Database&)> func) {
        return pool_.withConnection([&](Database& db) -> Result<T> {
            return inTransaction<T>(db, func, TransactionMode::Deferred);
        });
    }

    /**
     * @brief Run func as the single writer inside a BEGIN IMMEDIATE transaction
     */
    template <typename T> Result<T> executeWrite(std::function<Result<T>(Database&)> func) {
        std::lock_guard<std::mutex> lock(writeMutex_);
        return pool_.withConnection([&](Database& db) -> Result<T> {
            return inTransaction<T>(db, func, TransactionMode::Immediate);
        });
    }

    template <typename T>
    static Result<T> inTransaction(Database& db, const std::function<Result<T>(Database&)>& func,
                                   TransactionMode mode) {
        if constexpr (std::is_void_v<T>) {
            return db.transaction([&]() { return func(db); }, mode);
        } else {
            std::optional<T> out;
            auto txn = db.transaction(
                [&]() -> Result<void> {
                    auto result = func(db);
                    if (!result) {
                        return result.error();
                    }
                    out.emplace(std::move(result).value());
                    return {};
                },
                mode);
            if (!txn) {
                return txn.error();
            }
            return std::move(*out);
        }
    }
};

/**
 * @brief A store together with the pool it runs on
 */
struct CorpusStoreHandle {
    std::unique_ptr<ConnectionPool> pool;
    std::unique_ptr<CorpusStore> store;
};

/**
 * @brief Open (creating if needed) the store described by config
 *
 * Applies config.logLevel to the default spdlog logger first; an unknown
 * level name is InvalidArgument.
 */
Result<CorpusStoreHandle> openCorpusStore(const config::StoreConfig& config);

} // namespace corpusdb::storage

static_assert(corpusdb::storage::FullCorpusStore<corpusdb::storage::CorpusStore>);
