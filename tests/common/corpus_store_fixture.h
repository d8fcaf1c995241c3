#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <corpusdb/storage/connection_pool.h>
#include <corpusdb/storage/corpus_store.h>

#include "common/test_helpers.h"

namespace corpusdb::tests {

// File-backed store on a fresh database for every test
class CorpusStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dbPath_ = make_temp_db_path("corpus_store_test_");

        storage::ConnectionPoolConfig config;
        config.minConnections = 1;
        config.maxConnections = 2;

        pool_ = std::make_unique<storage::ConnectionPool>(dbPath_.string(), config);
        auto initResult = pool_->initialize();
        ASSERT_TRUE(initResult.has_value()) << initResult.error().message;

        store_ = std::make_unique<storage::CorpusStore>(*pool_);
        auto schemaResult = store_->initialize();
        ASSERT_TRUE(schemaResult.has_value()) << schemaResult.error().message;
    }

    void TearDown() override {
        store_.reset();
        pool_->shutdown();
        pool_.reset();
        remove_db_files(dbPath_);
    }

    storage::CorpusRecord makeCorpus(const std::string& name) {
        auto result = store_->createCorpus(name);
        EXPECT_TRUE(result.has_value()) << result.error().message;
        return result.value();
    }

    storage::DocumentRecord makeDocument(const std::string& name, RowId corpusId) {
        auto result = store_->createDocument(name, corpusId);
        EXPECT_TRUE(result.has_value()) << result.error().message;
        return result.value();
    }

    storage::SentenceRecord makeSentence(RowId documentId, const std::string& text) {
        storage::SentenceRecord sentence;
        sentence.documentId = documentId;
        sentence.text = text;
        auto result = store_->createSentence(sentence);
        EXPECT_TRUE(result.has_value()) << result.error().message;
        return result.value();
    }

    std::vector<storage::TokenRecord> importWords(RowId sentenceId,
                                                  const std::vector<std::string>& words) {
        auto result = store_->importTokenTexts(sentenceId, words);
        EXPECT_TRUE(result.has_value()) << result.error().message;
        return result.value();
    }

    std::filesystem::path dbPath_;
    std::unique_ptr<storage::ConnectionPool> pool_;
    std::unique_ptr<storage::CorpusStore> store_;
};

} // namespace corpusdb::tests
