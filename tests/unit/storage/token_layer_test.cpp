#include <string>
#include <vector>
#include <gtest/gtest.h>

#include "common/corpus_store_fixture.h"

using namespace corpusdb;
using namespace corpusdb::storage;

class TokenLayerTest : public corpusdb::tests::CorpusStoreTest {
protected:
    void SetUp() override {
        CorpusStoreTest::SetUp();
        corpus_ = makeCorpus("minimal");
        doc_ = makeDocument("doc1", corpus_.id);
    }

    static TokenRecord spanned(const std::string& text, int64_t cfrom, int64_t cto) {
        TokenRecord token;
        token.text = text;
        token.cfrom = cfrom;
        token.cto = cto;
        return token;
    }

    CorpusRecord corpus_;
    DocumentRecord doc_;
};

TEST_F(TokenLayerTest, ImportAssignsDenseWordIndices) {
    auto sent = makeSentence(doc_.id, "I am a sentence.");
    auto tokens = importWords(sent.id, {"I", "am", "a", "sentence", "."});
    ASSERT_EQ(tokens.size(), 5u);

    auto loaded = store_->getTokens(sent.id);
    ASSERT_TRUE(loaded.has_value());
    ASSERT_EQ(loaded.value().size(), 5u);

    const std::vector<std::string> expected{"I", "am", "a", "sentence", "."};
    for (std::size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(loaded.value()[i].text, expected[i]);
        EXPECT_EQ(loaded.value()[i].widx, static_cast<int64_t>(i));
        EXPECT_EQ(loaded.value()[i].sentenceId, sent.id);
        EXPECT_EQ(loaded.value()[i].id, tokens[i].id);
    }
    EXPECT_EQ(store_->countTokens(sent.id).value(), 5);
}

TEST_F(TokenLayerTest, AppendingContinuesWordIndex) {
    auto sent = makeSentence(doc_.id, "I am a sentence.");
    importWords(sent.id, {"I", "am"});
    auto more = importWords(sent.id, {"a", "sentence", "."});

    ASSERT_EQ(more.size(), 3u);
    EXPECT_EQ(more.front().widx, 2);
    EXPECT_EQ(more.back().widx, 4);
}

TEST_F(TokenLayerTest, TokensKeepSpansAndAnalysis) {
    auto sent = makeSentence(doc_.id, "Dogs bark.");
    TokenRecord dogs = spanned("Dogs", 0, 4);
    dogs.lemma = "dog";
    dogs.pos = "NNS";
    auto stored = store_->importTokens(sent.id, {dogs, spanned("bark", 5, 9)});
    ASSERT_TRUE(stored.has_value()) << stored.error().message;

    auto token = store_->getToken(stored.value()[0].id);
    ASSERT_TRUE(token.has_value());
    ASSERT_TRUE(token.value().has_value());
    EXPECT_EQ(token.value()->cfrom, std::optional<int64_t>(0));
    EXPECT_EQ(token.value()->cto, std::optional<int64_t>(4));
    EXPECT_EQ(token.value()->lemma, std::optional<std::string>("dog"));
    EXPECT_EQ(token.value()->pos, std::optional<std::string>("NNS"));
    EXPECT_FALSE(token.value()->comment.has_value());
}

TEST_F(TokenLayerTest, BackwardSpanRejectsWholeBatch) {
    auto sent = makeSentence(doc_.id, "I am");
    auto result = store_->importTokens(sent.id, {spanned("I", 0, 1), spanned("am", 4, 2)});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(store_->countTokens(sent.id).value(), 0);
}

TEST_F(TokenLayerTest, OverlapCheckIsOptIn) {
    auto sent = makeSentence(doc_.id, "I am");
    std::vector<TokenRecord> overlapping{spanned("I", 0, 3), spanned("am", 2, 4)};

    TokenImportOptions strict;
    strict.validateSpans = true;
    auto rejected = store_->importTokens(sent.id, overlapping, strict);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(store_->countTokens(sent.id).value(), 0);

    auto accepted = store_->importTokens(sent.id, overlapping);
    ASSERT_TRUE(accepted.has_value());
    EXPECT_EQ(store_->countTokens(sent.id).value(), 2);
}

TEST_F(TokenLayerTest, ImportIntoMissingSentenceFails) {
    auto result = store_->importTokenTexts(9999, {"orphan"});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::DanglingReference);
    EXPECT_EQ(store_->stats().value().tokens, 0);
}

TEST_F(TokenLayerTest, UpdateToken) {
    auto sent = makeSentence(doc_.id, "I am");
    auto tokens = importWords(sent.id, {"I", "am"});

    TokenRecord updated = tokens[1];
    updated.lemma = "be";
    updated.pos = "VBP";
    updated.cfrom = 2;
    updated.cto = 4;
    ASSERT_TRUE(store_->updateToken(updated).has_value());

    auto loaded = store_->getToken(updated.id).value();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->lemma, std::optional<std::string>("be"));
    EXPECT_EQ(loaded->widx, 1);

    updated.cfrom = 9;
    auto bad = store_->updateToken(updated);
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidArgument);

    TokenRecord ghost;
    ghost.id = 123456;
    ghost.text = "ghost";
    auto missing = store_->updateToken(ghost);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

TEST_F(TokenLayerTest, DeleteTokenRemovesLinksAndTags) {
    auto sent = makeSentence(doc_.id, "I am");
    auto tokens = importWords(sent.id, {"I", "am"});

    ConceptRecord draft;
    draft.sentenceId = sent.id;
    draft.clemma = "be";
    auto concept_ = store_->createConcept(draft);
    ASSERT_TRUE(concept_.has_value());
    ASSERT_TRUE(store_->linkConceptToken(concept_.value().id, tokens[1].id).has_value());

    TagRecord tag;
    tag.sentenceId = sent.id;
    tag.tokenId = tokens[1].id;
    tag.label = "VBP";
    ASSERT_TRUE(store_->createTag(tag).has_value());

    ASSERT_TRUE(store_->deleteToken(tokens[1].id).has_value());

    EXPECT_FALSE(store_->getToken(tokens[1].id).value().has_value());
    EXPECT_TRUE(store_->getLinks(sent.id).value().empty());
    EXPECT_TRUE(store_->getTags(sent.id).value().tokenLevel.empty());
    EXPECT_EQ(store_->getTokenTags(tokens[1].id).error().code, ErrorCode::NotFound);
    EXPECT_TRUE(store_->getConcept(concept_.value().id).value().has_value());
    EXPECT_TRUE(store_->auditIntegrity().value().clean());

    auto again = store_->deleteToken(tokens[1].id);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::NotFound);
}

TEST_F(TokenLayerTest, SentenceFieldsRoundTrip) {
    SentenceRecord draft;
    draft.documentId = doc_.id;
    draft.ident = "10001";
    draft.text = "I am a sentence.";
    draft.flag = 1;
    draft.comment = "checked";
    auto created = store_->createSentence(draft);
    ASSERT_TRUE(created.has_value());

    auto loaded = store_->getSentence(created.value().id);
    ASSERT_TRUE(loaded.has_value());
    ASSERT_TRUE(loaded.value().has_value());
    EXPECT_EQ(loaded.value()->ident, std::optional<std::string>("10001"));
    EXPECT_EQ(loaded.value()->flag, std::optional<int64_t>(1));
    EXPECT_EQ(loaded.value()->comment, std::optional<std::string>("checked"));
    EXPECT_EQ(loaded.value()->documentId, doc_.id);

    SentenceRecord changed = created.value();
    changed.text = "I was a sentence.";
    changed.flag.reset();
    ASSERT_TRUE(store_->updateSentence(changed).has_value());
    auto reloaded = store_->getSentence(changed.id).value();
    ASSERT_TRUE(reloaded.has_value());
    EXPECT_EQ(reloaded->text, "I was a sentence.");
    EXPECT_FALSE(reloaded->flag.has_value());
}

TEST_F(TokenLayerTest, SentenceRequiresExistingDocument) {
    SentenceRecord draft;
    draft.documentId = 4040;
    draft.text = "Nowhere.";
    auto result = store_->createSentence(draft);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::DanglingReference);
}

TEST_F(TokenLayerTest, FindSentences) {
    auto other = makeDocument("doc2", corpus_.id);
    SentenceRecord tagged;
    tagged.documentId = doc_.id;
    tagged.ident = "s-1";
    tagged.text = "The dog barks.";
    tagged.flag = 2;
    ASSERT_TRUE(store_->createSentence(tagged).has_value());
    makeSentence(doc_.id, "A cat sleeps.");
    makeSentence(other.id, "Another dog runs.");

    auto byIdent = store_->findSentencesByIdent("s-1");
    ASSERT_TRUE(byIdent.has_value());
    ASSERT_EQ(byIdent.value().size(), 1u);
    EXPECT_EQ(byIdent.value()[0].text, "The dog barks.");

    SentenceQuery dogs;
    dogs.textContains = "dog";
    auto found = store_->findSentences(dogs);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found.value().size(), 2u);

    dogs.documentId = doc_.id;
    found = store_->findSentences(dogs);
    ASSERT_TRUE(found.has_value());
    ASSERT_EQ(found.value().size(), 1u);
    EXPECT_EQ(found.value()[0].ident, std::optional<std::string>("s-1"));

    SentenceQuery flagged;
    flagged.flag = 2;
    EXPECT_EQ(store_->findSentences(flagged).value().size(), 1u);

    SentenceQuery paged;
    paged.limit = 1;
    paged.offset = 1;
    auto page = store_->findSentences(paged);
    ASSERT_TRUE(page.has_value());
    ASSERT_EQ(page.value().size(), 1u);
    EXPECT_EQ(page.value()[0].text, "A cat sleeps.");

    SentenceQuery tail;
    tail.offset = 2;
    auto rest = store_->findSentences(tail);
    ASSERT_TRUE(rest.has_value());
    ASSERT_EQ(rest.value().size(), 1u);
    EXPECT_EQ(rest.value()[0].text, "Another dog runs.");
}

TEST_F(TokenLayerTest, DeleteSentenceCascades) {
    auto sent = makeSentence(doc_.id, "I am");
    importWords(sent.id, {"I", "am"});
    TagRecord tag;
    tag.sentenceId = sent.id;
    tag.label = "declarative";
    ASSERT_TRUE(store_->createTag(tag).has_value());

    ASSERT_TRUE(store_->deleteSentence(sent.id).has_value());

    auto stats = store_->stats();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats.value().sentences, 0);
    EXPECT_EQ(stats.value().tokens, 0);
    EXPECT_EQ(stats.value().tags, 0);
    EXPECT_EQ(stats.value().documents, 1);
}

TEST_F(TokenLayerTest, TokenReadsNeedExistingSentence) {
    auto tokens = store_->getTokens(4242);
    ASSERT_FALSE(tokens.has_value());
    EXPECT_EQ(tokens.error().code, ErrorCode::NotFound);

    auto count = store_->countTokens(4242);
    ASSERT_FALSE(count.has_value());
    EXPECT_EQ(count.error().code, ErrorCode::NotFound);

    auto sentences = store_->listSentences(4242);
    ASSERT_FALSE(sentences.has_value());
    EXPECT_EQ(sentences.error().code, ErrorCode::NotFound);

    auto empty = makeSentence(doc_.id, "");
    EXPECT_TRUE(store_->getTokens(empty.id).value().empty());
    EXPECT_EQ(store_->countTokens(empty.id).value(), 0);
}

TEST_F(TokenLayerTest, DeletingMiddleTokenLeavesIndexGap) {
    auto sent = makeSentence(doc_.id, "I am a sentence.");
    auto tokens = importWords(sent.id, {"I", "am", "a", "sentence", "."});
    ASSERT_TRUE(store_->deleteToken(tokens[2].id).has_value());

    auto remaining = store_->getTokens(sent.id);
    ASSERT_TRUE(remaining.has_value());
    ASSERT_EQ(remaining.value().size(), 4u);
    std::vector<int64_t> indices;
    for (const auto& token : remaining.value()) {
        indices.push_back(token.widx);
    }
    EXPECT_EQ(indices, (std::vector<int64_t>{0, 1, 3, 4}));

    auto appended = importWords(sent.id, {"!"});
    ASSERT_EQ(appended.size(), 1u);
    EXPECT_EQ(appended[0].widx, 5);
}
