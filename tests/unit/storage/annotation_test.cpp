#include <string>
#include <vector>
#include <gtest/gtest.h>

#include "common/corpus_store_fixture.h"

using namespace corpusdb;
using namespace corpusdb::storage;

class AnnotationTest : public corpusdb::tests::CorpusStoreTest {
protected:
    void SetUp() override {
        CorpusStoreTest::SetUp();
        auto corpus = makeCorpus("minimal");
        doc_ = makeDocument("doc1", corpus.id);
        sent_ = makeSentence(doc_.id, "I am a sentence.");
        tokens_ = importWords(sent_.id, {"I", "am", "a", "sentence", "."});
    }

    ConceptRecord makeConcept(RowId sentenceId, int64_t cidx, const std::string& clemma) {
        ConceptRecord draft;
        draft.sentenceId = sentenceId;
        draft.cidx = cidx;
        draft.clemma = clemma;
        auto result = store_->createConcept(draft);
        EXPECT_TRUE(result.has_value()) << result.error().message;
        return result.value();
    }

    DocumentRecord doc_;
    SentenceRecord sent_;
    std::vector<TokenRecord> tokens_;
};

TEST_F(AnnotationTest, ConceptCoversTokens) {
    auto pronoun = makeConcept(sent_.id, 0, "I am");
    auto links = store_->linkConceptTokens(pronoun.id, {tokens_[0].id, tokens_[1].id});
    ASSERT_TRUE(links.has_value()) << links.error().message;
    ASSERT_EQ(links.value().size(), 2u);
    EXPECT_EQ(links.value()[0].sentenceId, sent_.id);

    auto covered = store_->getConceptTokens(pronoun.id);
    ASSERT_TRUE(covered.has_value());
    ASSERT_EQ(covered.value().size(), 2u);
    EXPECT_EQ(covered.value()[0].text, "I");
    EXPECT_EQ(covered.value()[1].text, "am");

    auto concepts = store_->getTokenConcepts(tokens_[1].id);
    ASSERT_TRUE(concepts.has_value());
    ASSERT_EQ(concepts.value().size(), 1u);
    EXPECT_EQ(concepts.value()[0].clemma, "I am");

    auto stored = store_->getLinks(sent_.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored.value(), links.value());
}

TEST_F(AnnotationTest, DuplicateLinkKeepsOriginal) {
    auto c = makeConcept(sent_.id, 0, "sentence");
    ASSERT_TRUE(store_->linkConceptToken(c.id, tokens_[3].id).has_value());

    auto again = store_->linkConceptToken(c.id, tokens_[3].id);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::DuplicateKey);

    auto links = store_->getLinks(sent_.id);
    ASSERT_TRUE(links.has_value());
    ASSERT_EQ(links.value().size(), 1u);
    EXPECT_EQ(links.value()[0].tokenId, tokens_[3].id);
}

TEST_F(AnnotationTest, BatchLinkIsAllOrNothing) {
    auto c = makeConcept(sent_.id, 0, "a sentence");
    auto result = store_->linkConceptTokens(c.id, {tokens_[2].id, tokens_[3].id, tokens_[3].id});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::DuplicateKey);
    EXPECT_TRUE(store_->getLinks(sent_.id).value().empty());
}

TEST_F(AnnotationTest, CrossSentenceLinkIsRejected) {
    auto other = makeSentence(doc_.id, "Another one.");
    auto otherTokens = importWords(other.id, {"Another", "one", "."});
    auto c = makeConcept(sent_.id, 0, "one");

    auto result = store_->linkConceptToken(c.id, otherTokens[1].id);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::DanglingReference);

    auto missingToken = store_->linkConceptToken(c.id, 987654);
    ASSERT_FALSE(missingToken.has_value());
    EXPECT_EQ(missingToken.error().code, ErrorCode::DanglingReference);

    auto missingConcept = store_->linkConceptToken(987654, tokens_[0].id);
    ASSERT_FALSE(missingConcept.has_value());
    EXPECT_EQ(missingConcept.error().code, ErrorCode::DanglingReference);
}

TEST_F(AnnotationTest, UnlinkConceptToken) {
    auto c = makeConcept(sent_.id, 0, "I am");
    ASSERT_TRUE(store_->linkConceptTokens(c.id, {tokens_[0].id, tokens_[1].id}).has_value());

    ASSERT_TRUE(store_->unlinkConceptToken(c.id, tokens_[0].id).has_value());
    auto covered = store_->getConceptTokens(c.id);
    ASSERT_TRUE(covered.has_value());
    ASSERT_EQ(covered.value().size(), 1u);
    EXPECT_EQ(covered.value()[0].id, tokens_[1].id);

    auto again = store_->unlinkConceptToken(c.id, tokens_[0].id);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::NotFound);
}

TEST_F(AnnotationTest, ConceptsListedBySequenceIndex) {
    makeConcept(sent_.id, 2, "sentence");
    makeConcept(sent_.id, 0, "I");
    makeConcept(sent_.id, 1, "be");

    auto concepts = store_->getConcepts(sent_.id);
    ASSERT_TRUE(concepts.has_value());
    ASSERT_EQ(concepts.value().size(), 3u);
    EXPECT_EQ(concepts.value()[0].clemma, "I");
    EXPECT_EQ(concepts.value()[1].clemma, "be");
    EXPECT_EQ(concepts.value()[2].clemma, "sentence");
}

TEST_F(AnnotationTest, UpdateAndDeleteConcept) {
    auto c = makeConcept(sent_.id, 0, "sentence");
    ASSERT_TRUE(store_->linkConceptToken(c.id, tokens_[3].id).has_value());

    c.tag = "06296399-n";
    c.flag = "E";
    ASSERT_TRUE(store_->updateConcept(c).has_value());
    auto loaded = store_->getConcept(c.id).value();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->tag, std::optional<std::string>("06296399-n"));
    EXPECT_EQ(loaded->flag, std::optional<std::string>("E"));

    ASSERT_TRUE(store_->deleteConcept(c.id).has_value());
    EXPECT_FALSE(store_->getConcept(c.id).value().has_value());
    EXPECT_TRUE(store_->getLinks(sent_.id).value().empty());
    EXPECT_TRUE(store_->getToken(tokens_[3].id).value().has_value());

    auto missing = store_->updateConcept(c);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

TEST_F(AnnotationTest, ConceptRequiresExistingSentence) {
    ConceptRecord draft;
    draft.sentenceId = 5555;
    draft.clemma = "lost";
    auto result = store_->createConcept(draft);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::DanglingReference);
}

TEST_F(AnnotationTest, TagsPartitionBySentenceAndToken) {
    TagRecord sentenceTag;
    sentenceTag.sentenceId = sent_.id;
    sentenceTag.cfrom = 0;
    sentenceTag.cto = 16;
    sentenceTag.label = "declarative";
    sentenceTag.source = "manual";
    ASSERT_TRUE(store_->createTag(sentenceTag).has_value());

    TagRecord tokenTag;
    tokenTag.sentenceId = sent_.id;
    tokenTag.tokenId = tokens_[0].id;
    tokenTag.label = "PRP";
    tokenTag.tagType = "pos";
    auto created = store_->createTag(tokenTag);
    ASSERT_TRUE(created.has_value());

    auto tags = store_->getTags(sent_.id);
    ASSERT_TRUE(tags.has_value());
    ASSERT_EQ(tags.value().sentenceLevel.size(), 1u);
    ASSERT_EQ(tags.value().tokenLevel.size(), 1u);
    EXPECT_EQ(tags.value().sentenceLevel[0].label, "declarative");
    EXPECT_EQ(tags.value().sentenceLevel[0].source, std::optional<std::string>("manual"));
    EXPECT_EQ(tags.value().tokenLevel[0].tokenId, std::optional<RowId>(tokens_[0].id));
    EXPECT_EQ(tags.value().tokenLevel[0].tagType, std::optional<std::string>("pos"));

    auto byToken = store_->getTokenTags(tokens_[0].id);
    ASSERT_TRUE(byToken.has_value());
    ASSERT_EQ(byToken.value().size(), 1u);
    EXPECT_EQ(byToken.value()[0].id, created.value().id);
}

TEST_F(AnnotationTest, TagOnForeignTokenIsRejected) {
    auto other = makeSentence(doc_.id, "Elsewhere.");
    auto otherTokens = importWords(other.id, {"Elsewhere", "."});

    TagRecord tag;
    tag.sentenceId = sent_.id;
    tag.tokenId = otherTokens[0].id;
    tag.label = "RB";
    auto result = store_->createTag(tag);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::DanglingReference);

    tag.tokenId.reset();
    tag.cfrom = 8;
    tag.cto = 3;
    auto badSpan = store_->createTag(tag);
    ASSERT_FALSE(badSpan.has_value());
    EXPECT_EQ(badSpan.error().code, ErrorCode::InvalidArgument);
}

TEST_F(AnnotationTest, UpdateAndDeleteTag) {
    TagRecord tag;
    tag.sentenceId = sent_.id;
    tag.tokenId = tokens_[3].id;
    tag.label = "NN";
    auto created = store_->createTag(tag);
    ASSERT_TRUE(created.has_value());

    TagRecord changed = created.value();
    changed.label = "NNP";
    changed.tokenId.reset();
    ASSERT_TRUE(store_->updateTag(changed).has_value());

    auto loaded = store_->getTag(changed.id).value();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->label, "NNP");
    EXPECT_TRUE(loaded->isSentenceLevel());

    ASSERT_TRUE(store_->deleteTag(changed.id).has_value());
    auto again = store_->deleteTag(changed.id);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::NotFound);

    auto missing = store_->updateTag(changed);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

TEST_F(AnnotationTest, ReadsUnderMissingParentAreNotFound) {
    constexpr RowId missing = 999;
    EXPECT_EQ(store_->getConcepts(missing).error().code, ErrorCode::NotFound);
    EXPECT_EQ(store_->getConceptTokens(missing).error().code, ErrorCode::NotFound);
    EXPECT_EQ(store_->getTokenConcepts(missing).error().code, ErrorCode::NotFound);
    EXPECT_EQ(store_->getLinks(missing).error().code, ErrorCode::NotFound);
    EXPECT_EQ(store_->getTags(missing).error().code, ErrorCode::NotFound);
    EXPECT_EQ(store_->getTokenTags(missing).error().code, ErrorCode::NotFound);

    // Existing parents with nothing beneath them still read as empty
    auto unlinked = makeConcept(sent_.id, 0, "sentence");
    auto covered = store_->getConceptTokens(unlinked.id);
    ASSERT_TRUE(covered.has_value()) << covered.error().message;
    EXPECT_TRUE(covered.value().empty());
    EXPECT_TRUE(store_->getTokenConcepts(tokens_[4].id).value().empty());
    EXPECT_TRUE(store_->getTokenTags(tokens_[4].id).value().empty());
}

TEST_F(AnnotationTest, EmptyLinkBatchNeedsExistingConcept) {
    auto result = store_->linkConceptTokens(999, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::DanglingReference);

    auto c = makeConcept(sent_.id, 0, "be");
    auto none = store_->linkConceptTokens(c.id, {});
    ASSERT_TRUE(none.has_value()) << none.error().message;
    EXPECT_TRUE(none.value().empty());
}
