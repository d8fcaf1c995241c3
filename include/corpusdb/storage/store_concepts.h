#pragma once

#include <concepts>
#include <optional>
#include <string>
#include <vector>
#include <corpusdb/core/types.h>
#include <corpusdb/storage/corpus_records.h>

namespace corpusdb::storage {

template <typename T>
concept HierarchyStore = requires(T store, std::string name, RowId id) {
    { store.createCorpus(name) } -> std::same_as<Result<CorpusRecord>>;
    { store.getCorpusByName(name) } -> std::same_as<Result<std::optional<CorpusRecord>>>;
    { store.createDocument(name, id) } -> std::same_as<Result<DocumentRecord>>;
    { store.getDocumentByName(name) } -> std::same_as<Result<std::optional<DocumentRecord>>>;
    { store.deleteCorpus(id) } -> std::same_as<Result<void>>;
    { store.deleteDocument(id) } -> std::same_as<Result<void>>;
};

template <typename T>
concept TokenLayerStore =
    requires(T store, SentenceRecord sentence, std::vector<TokenRecord> tokens, RowId id) {
        { store.createSentence(sentence) } -> std::same_as<Result<SentenceRecord>>;
        { store.importTokens(id, tokens) } -> std::same_as<Result<std::vector<TokenRecord>>>;
        { store.getTokens(id) } -> std::same_as<Result<std::vector<TokenRecord>>>;
        { store.deleteToken(id) } -> std::same_as<Result<void>>;
    };

template <typename T>
concept AnnotationStore = requires(T store, ConceptRecord record, TagRecord tag, RowId id) {
    { store.createConcept(record) } -> std::same_as<Result<ConceptRecord>>;
    { store.linkConceptToken(id, id) } -> std::same_as<Result<ConceptWordLink>>;
    { store.getConceptTokens(id) } -> std::same_as<Result<std::vector<TokenRecord>>>;
    { store.createTag(tag) } -> std::same_as<Result<TagRecord>>;
    { store.getTags(id) } -> std::same_as<Result<SentenceTags>>;
};

template <typename T>
concept MetaKVStore = requires(T store, MetaScope scope, std::string owner, std::string key) {
    { store.setMeta(scope, owner, key, key) } -> std::same_as<Result<void>>;
    { store.getMeta(scope, owner, key) } -> std::same_as<Result<std::string>>;
    { store.deleteMeta(scope, owner, key) } -> std::same_as<Result<void>>;
};

template <typename T>
concept FullCorpusStore =
    HierarchyStore<T> && TokenLayerStore<T> && AnnotationStore<T> && MetaKVStore<T>;

} // namespace corpusdb::storage
