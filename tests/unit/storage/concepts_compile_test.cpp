#include <gtest/gtest.h>
#include <corpusdb/storage/corpus_store.h>

// No runtime checks; including the header keeps the FullCorpusStore
// static_assert compiled into the test build.
TEST(StoreConceptsCompile, FullCorpusStoreConceptIsSatisfied) {
    SUCCEED();
}
